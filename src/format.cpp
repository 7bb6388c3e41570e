#include "format.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

/**
 * @file format.cpp
 * @brief JSON escaping and UTC time formatting.
 */

namespace vigil {

std::string jsonEscape(const std::string& s) {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << (int)(unsigned char)c;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

int64_t unixMillis(WallTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

static std::tm to_utc(WallTime t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

std::string utcDate(WallTime t) {
    std::tm tm = to_utc(t);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string utcDateTime(WallTime t) {
    std::tm tm = to_utc(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string isoTimestamp(WallTime t) {
    std::tm tm = to_utc(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    int ms = static_cast<int>(unixMillis(t) % 1000);
    if (ms < 0) ms += 1000;
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, ms);
    return out;
}

bool parsePartitionDate(const std::string& name, int& year, int& month, int& day) {
    if (name.size() != 10 || name[4] != '-' || name[7] != '-') return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    year = std::stoi(name.substr(0, 4));
    month = std::stoi(name.substr(5, 2));
    day = std::stoi(name.substr(8, 2));
    if (month < 1 || month > 12 || day < 1) return false;
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    if (month == 2 && leap) limit = 29;
    return day <= limit;
}

} // namespace vigil
