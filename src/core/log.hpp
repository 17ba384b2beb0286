#pragma once

#include <string>
#include <platform/process.hpp>

// Debug log at <tmp>/aspect_reauth_debug.log. Lines are also echoed to
// stderr in theme::log style when verbose output is on.
std::string reauth_log_path();

void set_log_verbose(bool verbose);
bool log_verbose();

void reauth_log(const std::string& msg);

// Logs argv, exit status and a stderr preview. Stdin payloads are never logged.
void reauth_log_process(const std::string& label, const platform::ProcessSpec& spec,
                        const platform::ProcessResult& r);

// Non-fatal problem: logged, and printed to stderr regardless of verbosity.
void reauth_warn(const std::string& msg);
