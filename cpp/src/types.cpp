#include "polystore/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace polystore {

std::string format_iso8601(TimePoint t) {
    auto time_t = Clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds(1000);

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return out.str();
}

} // namespace polystore
