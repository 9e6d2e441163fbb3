#ifndef RCX_DATETIME_H
#define RCX_DATETIME_H

#include "rcx_string.h"
#include <chrono>
#include <stdexcept>

class rcx_datetime_exception : public std::runtime_error {
public:
    rcx_datetime_exception(const rcx_string& message) : std::runtime_error(message.c_str()) {}
};

// Local calendar time with millisecond precision. Receipt dates are stored at
// local midnight of the printed day.
class rcx_datetime
{
private:
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> m_timepoint;

    static std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> create_timepoint(int year, int month, int day, int hour, int minute, int second, int millisecond);

public:
    rcx_datetime();
    rcx_datetime(const std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>& tp);
    // Throws rcx_datetime_exception for out-of-range components.
    rcx_datetime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, int millisecond = 0);

    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> to_chrono() const { return m_timepoint; }

    bool operator==(const rcx_datetime& other) const;
    bool operator!=(const rcx_datetime& other) const;
    bool operator<(const rcx_datetime& other) const;

    static rcx_datetime now();

    int year() const;
    int month() const;
    int day() const;

    rcx_string to_iso_date() const;
    rcx_string to_date_string() const;

    long long milliseconds_since_epoch() const;

    static bool is_valid_date(int year, int month, int day);
    static bool is_valid_time(int hour, int minute, int second, int millisecond = 0);
    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);
};

#endif // RCX_DATETIME_H
