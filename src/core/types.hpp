#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Whether to stand up a private control master for the run.
enum class SocketPolicy {
    CreateAlways,
    ReuseAlways,
    Infer,
};

// Parses "infer" or a boolish value (y/yes/t/true/on/1, n/no/f/false/off/0).
std::optional<SocketPolicy> parse_socket_policy(const std::string& value);
const char* socket_policy_name(SocketPolicy policy);

// Outcome of a full refresh run, used to pick the closing message.
enum class RefreshOutcome {
    NotNeeded,
    Synced,
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
