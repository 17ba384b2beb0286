#include "process_runner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>

Result<platform::ProcessResult> SubprocessRunner::run(const platform::ProcessSpec& spec) {
    auto result = platform::run_process(spec);
    if (result.is_err()) {
        reauth_log(program_basename(spec.program) + ": " + result.error);
        return result;
    }
    reauth_log_process(program_basename(spec.program), spec, result.value);
    return result;
}
