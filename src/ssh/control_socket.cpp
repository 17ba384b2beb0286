#include "control_socket.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <core/log.hpp>
#include <system_error>

namespace fs = std::filesystem;

Result<ControlSocket> ControlSocket::create(const std::string& prefix) {
    auto dir = platform::make_private_temp_dir(prefix);
    if (dir.is_err()) {
        return Result<ControlSocket>::Err(dir.error);
    }
    return Result<ControlSocket>::Ok(ControlSocket(dir.value / SOCKET_FILE_NAME));
}

ControlSocket::~ControlSocket() {
    try {
        auto removed = destroy();
        if (removed.is_err()) reauth_warn("cleanup ssh: " + removed.error);
    } catch (const std::exception& e) {
        reauth_log(std::string("cleanup ssh: ") + e.what());
    }
}

ControlSocket::ControlSocket(ControlSocket&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ControlSocket& ControlSocket::operator=(ControlSocket&& other) noexcept {
    if (this != &other) {
        destroy();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Result<void> ControlSocket::destroy() {
    if (path_.empty()) return Result<void>::Ok();

    fs::path dir = path_.parent_path();
    path_.clear();

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return Result<void>::Err("failed to remove " + dir.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}
