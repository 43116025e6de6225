#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <array>
#include <ctime>

namespace mandi {

using std::chrono::system_clock;

timestamp date(int year, unsigned month, unsigned day) {
    if (month < 1 or month > 12) throw InvalidInput("Invalid month " + std::to_string(month));
    if (day < 1 or day > 31) throw InvalidInput("Invalid day of month " + std::to_string(day));
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = (int) month - 1;
    tm.tm_mday = (int) day;
    return system_clock::from_time_t(timegm(&tm));
}

unsigned month_of(timestamp t) {
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return (unsigned) tm.tm_mon + 1;
}

double days_between(timestamp from, timestamp to) {
    return std::chrono::duration<double, std::ratio<86400>>(to - from).count();
}

timestamp add_days(timestamp t, double days) {
    return t + std::chrono::duration_cast<system_clock::duration>(std::chrono::duration<double, std::ratio<86400>>(days));
}

std::string iso_date(timestamp t) {
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string month_name(unsigned month) {
    static const std::array<const char*, 12> names{{
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"}};
    if (month < 1 or month > 12) throw InvalidInput("Invalid month " + std::to_string(month));
    return names[month - 1];
}

}
