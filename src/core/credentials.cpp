#include "credentials.hpp"

Result<std::unique_ptr<CredentialStore>> make_credential_store(const std::string& backend,
                                                               const std::filesystem::path& file,
                                                               ProcessRunner& runner) {
    using R = Result<std::unique_ptr<CredentialStore>>;
    if (backend == "system") {
        return R::Ok(std::make_unique<SystemCredentialStore>(runner));
    }
    if (backend == "file") {
        return R::Ok(std::make_unique<FileCredentialStore>(file));
    }
    return R::Err("unknown keychain backend '" + backend + "' (expected system or file)");
}
