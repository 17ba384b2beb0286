#pragma once

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <core/credentials.hpp>
#include <platform/process_runner.hpp>

using platform::ProcessResult;
using platform::ProcessSpec;

// ── Canned results ──────────────────────────────────────────

inline Result<ProcessResult> exited(int code, const std::string& err = "",
                                    const std::string& out = "") {
    ProcessResult r;
    r.exit_code = code;
    r.stderr_data = err;
    r.stdout_data = out;
    return Result<ProcessResult>::Ok(r);
}

inline Result<ProcessResult> succeeded(const std::string& out = "") {
    return exited(0, "", out);
}

inline Result<ProcessResult> spawn_failed(const std::string& msg) {
    return Result<ProcessResult>::Err(msg);
}

// ── Matchers ────────────────────────────────────────────────

using SpecMatch = std::function<bool(const ProcessSpec&)>;

inline bool has_arg(const ProcessSpec& spec, const std::string& a) {
    return std::find(spec.args.begin(), spec.args.end(), a) != spec.args.end();
}

// `<helper> get` run directly
inline SpecMatch local_get(const std::string& helper) {
    return [helper](const ProcessSpec& s) {
        return s.program == helper && !s.args.empty() && s.args[0] == "get";
    };
}

// `<helper> login ...`
inline SpecMatch local_login(const std::string& helper) {
    return [helper](const ProcessSpec& s) {
        return s.program == helper && !s.args.empty() && s.args[0] == "login";
    };
}

// `ssh ... -- host <helper> get`
inline SpecMatch remote_get(const std::string& helper) {
    return [helper](const ProcessSpec& s) {
        return s.program == "ssh" && s.args.size() >= 2 && s.args.back() == "get" &&
               s.args[s.args.size() - 2] == helper;
    };
}

inline SpecMatch ssh_with(const std::string& a) {
    return [a](const ProcessSpec& s) { return s.program == "ssh" && has_arg(s, a); };
}

// Control master / plain connection setup: ends in "host true".
inline SpecMatch ssh_setup() {
    return [](const ProcessSpec& s) {
        return s.program == "ssh" && !s.args.empty() && s.args.back() == "true";
    };
}

// Scripted ProcessRunner. Rules are tried in order; a rule with several
// results hands them out one per call and then repeats the last. Unmatched
// specs succeed with empty output. Safe to call from several threads.
class FakeRunner : public ProcessRunner {
public:
    void on(SpecMatch match, Result<ProcessResult> result) {
        rules_.push_back({std::move(match), {std::move(result)}});
    }

    void on_sequence(SpecMatch match, std::vector<Result<ProcessResult>> results) {
        rules_.push_back({std::move(match), {results.begin(), results.end()}});
    }

    Result<ProcessResult> run(const ProcessSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(spec);
        for (auto& rule : rules_) {
            if (!rule.match(spec)) continue;
            Result<ProcessResult> r = rule.results.front();
            if (rule.results.size() > 1) rule.results.pop_front();
            return r;
        }
        return succeeded();
    }

    std::vector<ProcessSpec> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const SpecMatch& match) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(), match));
    }

    std::vector<ProcessSpec> matching(const SpecMatch& match) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProcessSpec> out;
        for (const auto& c : calls_) {
            if (match(c)) out.push_back(c);
        }
        return out;
    }

private:
    struct Rule {
        SpecMatch match;
        std::deque<Result<ProcessResult>> results;
    };
    std::vector<Rule> rules_;
    std::vector<ProcessSpec> calls_;
    mutable std::mutex mutex_;
};

// In-memory CredentialStore keyed by "service/account".
class FakeCredentialStore : public CredentialStore {
public:
    Result<std::string> get(const std::string& service, const std::string& account) override {
        auto it = entries.find(service + "/" + account);
        if (it == entries.end()) {
            return Result<std::string>::Err("no entry for " + service + "/" + account);
        }
        return Result<std::string>::Ok(it->second);
    }

    Result<void> set(const std::string& service, const std::string& account,
                     const std::string& value) override {
        if (fail_writes) return Result<void>::Err("keychain locked");
        entries[service + "/" + account] = value;
        return Result<void>::Ok();
    }

    std::map<std::string, std::string> entries;
    bool fail_writes = false;
};
