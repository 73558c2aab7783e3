// src/common/vault/src/SecretReference.cpp
#include "common/vault/include/SecretReference.hpp"
#include "common/vault/include/VaultException.hpp"

namespace secret_env::vault
{
    namespace
    {
        // [a-z0-9-]
        bool IsProjectChar(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        }

        // [A-Za-z0-9_-]
        bool IsSecretNameChar(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '_' || c == '-';
        }

        template <typename Pred>
        bool AllOf(const std::string& value, Pred pred)
        {
            for (char c : value) {
                if (!pred(c)) {
                    return false;
                }
            }
            return true;
        }
    }

    void SecretReference::Validate() const
    {
        if (project.empty()) {
            throw ConfigurationException("project is empty");
        }
        if (secret_name.empty()) {
            throw ConfigurationException("secret name is empty");
        }
        if (!AllOf(project, IsProjectChar)) {
            throw ConfigurationException("invalid project id: " + project);
        }
        if (secret_name.size() > MAX_SECRET_NAME_LENGTH || !AllOf(secret_name, IsSecretNameChar)) {
            throw ConfigurationException("invalid secret name: " + secret_name);
        }
    }

    std::string SecretReference::ToResourceName() const
    {
        return "projects/" + project + "/secrets/" + secret_name + "/versions/" + version;
    }

} // namespace secret_env::vault
