#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "types.hpp"

class ProcessRunner;

// Local secret store addressed by (service, account).
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual Result<std::string> get(const std::string& service, const std::string& account) = 0;
    virtual Result<void> set(const std::string& service, const std::string& account,
                             const std::string& value) = 0;
};

// The OS keychain. macOS: Security framework generic passwords.
// Linux: freedesktop Secret Service via `secret-tool`, using the
// service/username attributes keyring-rs writes.
class SystemCredentialStore : public CredentialStore {
public:
    explicit SystemCredentialStore(ProcessRunner& runner) : runner_(runner) {}

    Result<std::string> get(const std::string& service, const std::string& account) override;
    Result<void> set(const std::string& service, const std::string& account,
                     const std::string& value) override;

private:
    ProcessRunner& runner_;
};

// Fallback for machines without a keychain daemon: "service/account=value"
// lines in a file kept at mode 600.
class FileCredentialStore : public CredentialStore {
public:
    explicit FileCredentialStore(std::filesystem::path path) : path_(std::move(path)) {}

    Result<std::string> get(const std::string& service, const std::string& account) override;
    Result<void> set(const std::string& service, const std::string& account,
                     const std::string& value) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// backend: "system" or "file". Unknown names are an error.
Result<std::unique_ptr<CredentialStore>> make_credential_store(const std::string& backend,
                                                               const std::filesystem::path& file,
                                                               ProcessRunner& runner);
