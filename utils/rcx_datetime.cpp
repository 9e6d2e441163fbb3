#include "rcx_datetime.h"
#include <iomanip>
#include <sstream>
#include <ctime>
#include <array>

namespace {

std::tm local_tm(const std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&time_t_val, &tm);
    return tm;
}

} // namespace

rcx_datetime::rcx_datetime() : m_timepoint(std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now())) {}

rcx_datetime::rcx_datetime(const std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>& tp) : m_timepoint(tp) {}

rcx_datetime::rcx_datetime(int year, int month, int day, int hour, int minute, int second, int millisecond) {
    m_timepoint = create_timepoint(year, month, day, hour, minute, second, millisecond);
}

bool rcx_datetime::operator==(const rcx_datetime& other) const {
    return m_timepoint == other.m_timepoint;
}

bool rcx_datetime::operator!=(const rcx_datetime& other) const {
    return m_timepoint != other.m_timepoint;
}

bool rcx_datetime::operator<(const rcx_datetime& other) const {
    return m_timepoint < other.m_timepoint;
}

rcx_datetime rcx_datetime::now() {
    return rcx_datetime();
}

std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>
rcx_datetime::create_timepoint(int year, int month, int day, int hour, int minute, int second, int millisecond) {
    if (!is_valid_date(year, month, day) || !is_valid_time(hour, minute, second, millisecond)) {
        throw rcx_datetime_exception("Invalid date or time values");
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;

    auto time_t_val = std::mktime(&tm);
    if (time_t_val == -1) {
        throw rcx_datetime_exception("Invalid date/time values");
    }

    auto tp = std::chrono::system_clock::from_time_t(time_t_val);
    auto tp_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    tp_ms += std::chrono::milliseconds(millisecond);

    return tp_ms;
}

int rcx_datetime::year() const {
    return local_tm(m_timepoint).tm_year + 1900;
}

int rcx_datetime::month() const {
    return local_tm(m_timepoint).tm_mon + 1;
}

int rcx_datetime::day() const {
    return local_tm(m_timepoint).tm_mday;
}

rcx_string rcx_datetime::to_iso_date() const {
    std::tm tm = local_tm(m_timepoint);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return rcx_string(ss.str());
}

// dd/MM/yyyy, the format expense forms display
rcx_string rcx_datetime::to_date_string() const {
    std::tm tm = local_tm(m_timepoint);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%d/%m/%Y");
    return rcx_string(ss.str());
}

long long rcx_datetime::milliseconds_since_epoch() const {
    return m_timepoint.time_since_epoch().count();
}

bool rcx_datetime::is_valid_date(int year, int month, int day) {
    if (year < 1900 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > days_in_month(year, month)) return false;
    return true;
}

bool rcx_datetime::is_valid_time(int hour, int minute, int second, int millisecond) {
    if (hour < 0 || hour > 23) return false;
    if (minute < 0 || minute > 59) return false;
    if (second < 0 || second > 59) return false;
    if (millisecond < 0 || millisecond > 999) return false;
    return true;
}

bool rcx_datetime::is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int rcx_datetime::days_in_month(int year, int month) {
    static const std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}
