#include "immich/util/datetime.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace immich::util {
namespace {

constexpr std::time_t kFallbackEpochSeconds = 654955200; // 1990-10-03T12:00:00Z

} // namespace

DateTime::DateTime()
    : time_(clock::from_time_t(kFallbackEpochSeconds)) {}

DateTime::DateTime(clock::time_point time)
    : time_(std::chrono::time_point_cast<std::chrono::seconds>(time)) {}

Result<DateTime> DateTime::from_civil(int year, int month, int day,
                                      int hour, int minute, int second) {
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return Err<DateTime>(make_error(ErrorCode::InvalidDate, "date or time component out of range"));
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    const std::time_t seconds = ::timegm(&tm);

    // timegm normalizes overflowing days (Feb 30 -> Mar 2); reject those
    std::tm check{};
    if (::gmtime_r(&seconds, &check) == nullptr ||
        check.tm_mday != day || check.tm_mon != month - 1 || check.tm_year != year - 1900) {
        return Err<DateTime>(make_error(ErrorCode::InvalidDate, "day does not exist in month"));
    }

    return Ok(DateTime(clock::from_time_t(seconds)));
}

DateTime DateTime::from_file_time(std::filesystem::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + clock::now());
    return DateTime(system_time);
}

std::string DateTime::to_string() const {
    return format("%Y-%m-%dT%H:%M:%S.000Z");
}

std::string DateTime::filename() const {
    return format("%Y%m%d_%H%M%S");
}

std::string DateTime::format(const char* pattern) const {
    const std::time_t seconds = clock::to_time_t(time_);
    std::tm tm{};
    ::gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

} // namespace immich::util
