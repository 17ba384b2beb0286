#include "log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <cli/theme.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

static std::atomic<bool> g_verbose{false};
static std::mutex g_log_mutex;

std::string reauth_log_path() {
    static std::string path = (platform::temp_dir() / "aspect_reauth_debug.log").string();
    return path;
}

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose);
}

bool log_verbose() {
    return g_verbose.load();
}

void reauth_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (g_verbose.load()) {
        std::cerr << theme::log(msg) << std::flush;
    }

    std::ofstream out(reauth_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << now_log_stamp() << "] " << msg << "\n";
}

void reauth_log_process(const std::string& label, const platform::ProcessSpec& spec,
                        const platform::ProcessResult& r) {
    reauth_log(fmt::format("{} CMD: {}", label, spec.display()));
    reauth_log(fmt::format("{} {} stdout({})", label, r.describe(), r.stdout_data.size()));
    if (!r.stderr_data.empty())
        reauth_log(fmt::format("{} stderr={}", label,
                               trimmed(r.stderr_data.substr(0, LOG_STDERR_PREVIEW_BYTES))));
}

void reauth_warn(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << theme::warn(msg) << std::flush;
    }
    reauth_log("warning: " + msg);
}
