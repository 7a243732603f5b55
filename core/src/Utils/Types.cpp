#include "meterlink/Types.h"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace MeterLink {

// ═══════════════════════════════════════════════════════════
// ConnectionState
// ═══════════════════════════════════════════════════════════

const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting:     return "connecting";
        case ConnectionState::Authenticating: return "authenticating";
        case ConnectionState::Authenticated:  return "authenticated";
        case ConnectionState::Closed:         return "closed";
        default:                              return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// PairingError
// ═══════════════════════════════════════════════════════════

const char* pairingErrorToString(PairingError error) {
    switch (error) {
        case PairingError::None:             return "none";
        case PairingError::ServerNotRunning: return "serverNotRunning";
        case PairingError::BindFailed:       return "bindFailed";
        case PairingError::ListenFailed:     return "listenFailed";
        case PairingError::SocketFailed:     return "socketFailed";
        case PairingError::InvalidConfig:    return "invalidConfig";
        default:                             return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// Timestamps
// ═══════════════════════════════════════════════════════════

namespace {

// Howard Hinnant's days_from_civil: avoids timegm(), which is not portable
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Ровно count цифр с позиции pos; sscanf пропускал бы пробелы и знак
bool readDigits(const std::string& str, size_t pos, size_t count, int& out) {
    if (pos + count > str.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) return false;
        value = value * 10 + (str[i] - '0');
    }
    out = value;
    return true;
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : DAYS[month - 1];
}

} // namespace

std::string formatTimestamp(Timestamp ts) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
    int64_t secs = ms / 1000;
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string& str) {
    // YYYY-MM-DDTHH:MM:SS
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (str.size() < 19 || str[4] != '-' || str[7] != '-' || str[10] != 'T' ||
        str[13] != ':' || str[16] != ':') {
        return std::nullopt;
    }
    if (!readDigits(str, 0, 4, year) || !readDigits(str, 5, 2, month) ||
        !readDigits(str, 8, 2, day) || !readDigits(str, 11, 2, hour) ||
        !readDigits(str, 14, 2, minute) || !readDigits(str, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;

    // Fractional seconds: keep millisecond precision
    int64_t millis = 0;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (str[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    // Zone designator
    int64_t offsetSeconds = 0;
    if (pos < str.size()) {
        char zone = str[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (!readDigits(str, pos + 1, 2, oh) || pos + 3 >= str.size() ||
                str[pos + 3] != ':' || !readDigits(str, pos + 4, 2, om) ||
                oh > 23 || om > 59) {
                return std::nullopt;
            }
            offsetSeconds = (oh * 3600 + om * 60) * (zone == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != str.size()) {
        return std::nullopt;
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;

    return Timestamp(std::chrono::duration_cast<SystemClock::duration>(
        std::chrono::milliseconds(secs * 1000 + millis)));
}

} // namespace MeterLink
