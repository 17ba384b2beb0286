#include "../credentials.hpp"
#include "../utils.hpp"
#include <platform/process_runner.hpp>
#include <fmt/format.h>

// Secret Service access through libsecret's `secret-tool`. Attribute names
// match keyring-rs so a credential stored by either tool is found by both.

using platform::ProcessSpec;
using platform::Stdio;

Result<std::string> SystemCredentialStore::get(const std::string& service,
                                               const std::string& account) {
    ProcessSpec spec("secret-tool");
    spec.add_args({"lookup", "service", service, "username", account});
    spec.stdout_mode = Stdio::Pipe;
    spec.stderr_mode = Stdio::Pipe;

    auto r = runner_.run(spec);
    if (r.is_err()) {
        return Result<std::string>::Err(r.error);
    }
    // secret-tool exits 1 with no output when nothing matches.
    if (r.value.failed()) {
        std::string err = trimmed(r.value.stderr_data);
        return Result<std::string>::Err(err.empty()
            ? std::string("no matching entry in Secret Service")
            : fmt::format("secret-tool lookup: {}: {}", r.value.describe(), err));
    }
    return Result<std::string>::Ok(std::move(r.value.stdout_data));
}

Result<void> SystemCredentialStore::set(const std::string& service, const std::string& account,
                                        const std::string& value) {
    ProcessSpec spec("secret-tool");
    spec.add_args({"store", fmt::format("--label={}@{}", account, service),
                   "service", service, "username", account});
    spec.stdin_mode = Stdio::Pipe;
    spec.input = value;
    spec.stdout_mode = Stdio::Null;
    spec.stderr_mode = Stdio::Pipe;

    auto r = runner_.run(spec);
    if (r.is_err()) {
        return Result<void>::Err(r.error);
    }
    if (r.value.failed()) {
        return Result<void>::Err(fmt::format("secret-tool store: {}: {}",
                                             r.value.describe(), trimmed(r.value.stderr_data)));
    }
    return Result<void>::Ok();
}
