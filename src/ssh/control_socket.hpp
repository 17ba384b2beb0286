#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>

// A private temporary directory holding one control-socket path.
//
// The directory is created mode 0700 with a caller-chosen prefix; the socket
// path is "<dir>/sock" and is only a name until ssh binds it. destroy()
// removes the whole directory and is safe to call any number of times; the
// destructor calls it and logs a failed removal as a warning.
class ControlSocket {
public:
    static Result<ControlSocket> create(const std::string& prefix);

    ControlSocket() = default;
    ~ControlSocket();

    ControlSocket(ControlSocket&& other) noexcept;
    ControlSocket& operator=(ControlSocket&& other) noexcept;
    ControlSocket(const ControlSocket&) = delete;
    ControlSocket& operator=(const ControlSocket&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path directory() const { return path_.parent_path(); }

    // False once destroy() has run, and for a default-constructed socket.
    bool exists() const { return !path_.empty(); }

    // Returns an error message if removal failed; the socket is considered
    // destroyed either way.
    Result<void> destroy();

private:
    explicit ControlSocket(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};
