#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fmt/format.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    // TMPDIR is taken as given; a bad value surfaces when something is
    // created there, not as a silent switch to another directory.
    const char* tmp = std::getenv("TMPDIR");
    if (tmp && *tmp) return fs::path(tmp);
    return fs::path("/tmp");
}

Result<fs::path> make_private_temp_dir(const std::string& prefix) {
    std::string templ = (temp_dir() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    // mkdtemp creates the directory with mode 0700.
    if (mkdtemp(buf.data()) == nullptr) {
        return Result<fs::path>::Err(fmt::format(
            "failed to create temporary directory {}: {}", templ, std::strerror(errno)));
    }
    return Result<fs::path>::Ok(fs::path(buf.data()));
}

} // namespace platform
