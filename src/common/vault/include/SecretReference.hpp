// src/common/vault/include/SecretReference.hpp
#pragma once
#include <cstddef>
#include <string>
#include <utility>

namespace secret_env::vault
{
    constexpr const char* LATEST_VERSION = "latest";
    constexpr size_t MAX_SECRET_NAME_LENGTH = 255;

    /**
     * @brief projects/{project}/secrets/{secret}/versions/{version}
     */
    struct SecretReference
    {
        std::string project;
        std::string secret_name;
        std::string version = LATEST_VERSION;

        SecretReference(std::string p, std::string s)
            : project(std::move(p)), secret_name(std::move(s)) {}

        /**
         * @throws ConfigurationException project가 [a-z0-9-]+ 가 아니거나
         *         secret_name이 [A-Za-z0-9_-]{1,255} 가 아님
         */
        void Validate() const;

        std::string ToResourceName() const;
    };

} // namespace secret_env::vault
