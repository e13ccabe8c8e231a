#pragma once

#include <filesystem>
#include <system_error>

namespace mediadex {

/// Modification time as fractional seconds since the Unix epoch
double toEpochSeconds(std::filesystem::file_time_type time);

/// Modification time of `path`, with `ec` set when it cannot be read
double mtimeSeconds(const std::filesystem::path& path, std::error_code& ec);

} // namespace mediadex
