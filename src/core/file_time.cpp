#include <chrono>
#include <mediadex/core/file_time.h>

namespace mediadex {

double toEpochSeconds(std::filesystem::file_time_type time) {
    auto sys = std::filesystem::file_time_type::clock::to_sys(time);
    return std::chrono::duration<double>(sys.time_since_epoch()).count();
}

double mtimeSeconds(const std::filesystem::path& path, std::error_code& ec) {
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec)
        return 0.0;
    return toEpochSeconds(time);
}

} // namespace mediadex
