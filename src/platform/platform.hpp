#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp directory).
std::filesystem::path home_dir();

// Returns the system temporary directory: TMPDIR if set, else /tmp. The
// directory is not checked for existence.
std::filesystem::path temp_dir();

// Creates a fresh directory <temp_dir>/<prefix>XXXXXX readable only by the
// owner (mkdtemp semantics). Returns its path.
Result<std::filesystem::path> make_private_temp_dir(const std::string& prefix);

} // namespace platform
