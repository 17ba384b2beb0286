#include "types.hpp"

std::optional<SocketPolicy> parse_socket_policy(const std::string& value) {
    if (value == "infer") return SocketPolicy::Infer;
    if (value == "y" || value == "yes" || value == "t" || value == "true" ||
        value == "on" || value == "1") {
        return SocketPolicy::CreateAlways;
    }
    if (value == "n" || value == "no" || value == "f" || value == "false" ||
        value == "off" || value == "0") {
        return SocketPolicy::ReuseAlways;
    }
    return std::nullopt;
}

const char* socket_policy_name(SocketPolicy policy) {
    switch (policy) {
        case SocketPolicy::CreateAlways: return "true";
        case SocketPolicy::ReuseAlways:  return "false";
        case SocketPolicy::Infer:        return "infer";
    }
    return "infer";
}
