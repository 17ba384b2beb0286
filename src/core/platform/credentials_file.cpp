#include "../credentials.hpp"
#include <fstream>
#include <map>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Credentials stored as simple "service/account=value" lines.
// File is chmod 600.

static std::string entry_key(const std::string& service, const std::string& account) {
    return service + "/" + account;
}

// Read all key=value pairs from the credentials file
static std::map<std::string, std::string> read_all(const fs::path& path) {
    std::map<std::string, std::string> m;
    std::ifstream f(path);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

// Write all key=value pairs to the credentials file (chmod 600)
static bool write_all(const fs::path& path, const std::map<std::string, std::string>& m) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) return false;

    // Create restricted before any secret is written.
    {
        std::ofstream touch(path, std::ios::app);
        if (!touch) return false;
    }
    if (chmod(path.c_str(), 0600) != 0) return false;

    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();
    return static_cast<bool>(f);
}

Result<std::string> FileCredentialStore::get(const std::string& service,
                                             const std::string& account) {
    auto m = read_all(path_);
    auto it = m.find(entry_key(service, account));
    if (it == m.end()) {
        return Result<std::string>::Err("credential not found in " + path_.string());
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> FileCredentialStore::set(const std::string& service, const std::string& account,
                                      const std::string& value) {
    std::string key = entry_key(service, account);
    if (key.find('=') != std::string::npos || key.find('\n') != std::string::npos ||
        value.find('\n') != std::string::npos) {
        return Result<void>::Err("credential service/account may not contain '=', and no field may span lines");
    }

    auto m = read_all(path_);
    m[key] = value;
    if (!write_all(path_, m)) {
        return Result<void>::Err("failed to write credentials file " + path_.string());
    }
    return Result<void>::Ok();
}
