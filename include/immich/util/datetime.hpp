#pragma once

#include "immich/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace immich::util {

/**
 * @brief UTC timestamp with one-second resolution
 *
 * Serialized the way the server expects it in upload forms:
 * "2025-01-28T05:42:36.000Z".
 */
class DateTime {
public:
    using clock = std::chrono::system_clock;

    /**
     * @brief 1990-10-03 12:00:00 UTC, used when a file carries no usable time
     */
    DateTime();

    explicit DateTime(clock::time_point time);

    static Result<DateTime> from_civil(int year, int month, int day,
                                       int hour = 0, int minute = 0, int second = 0);

    static DateTime from_file_time(std::filesystem::file_time_type time);

    [[nodiscard]] clock::time_point time_point() const noexcept { return time_; }

    /**
     * @brief ISO-8601 form with a fixed ".000Z" suffix
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Compact form usable in file names: "20250128_054236"
     */
    [[nodiscard]] std::string filename() const;

    bool operator==(const DateTime& other) const noexcept { return time_ == other.time_; }
    bool operator!=(const DateTime& other) const noexcept { return time_ != other.time_; }

private:
    std::string format(const char* pattern) const;

    clock::time_point time_;
};

} // namespace immich::util
