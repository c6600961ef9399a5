#pragma once
// Core types: time, clocks, text helpers
//
// Every tier speaks Timestamp (Unix millis). Clocks are injected so that
// decay, throttling and scheduling can be driven deterministically.

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace cortex {

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;

// Current wall-clock time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Time source. Tiers never call now() directly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override { return cortex::now(); }
};

// Manually advanced clock for tests and replay
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : current_(start) {}

    Timestamp now() const override { return current_.load(); }

    void set(Timestamp t) { current_.store(t); }
    void advance(int64_t ms) { current_.fetch_add(ms); }
    void advance_days(double days) {
        current_.fetch_add(static_cast<int64_t>(days * MS_PER_DAY));
    }

private:
    std::atomic<Timestamp> current_;
};

inline std::shared_ptr<Clock> system_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

// ═══════════════════════════════════════════════════════════════════════════
// Calendar days (UTC)
// ═══════════════════════════════════════════════════════════════════════════

// Days since epoch
using DayNumber = int64_t;

inline DayNumber day_of(Timestamp ts) {
    // Floor division so pre-epoch timestamps land on the right day
    return ts >= 0 ? ts / MS_PER_DAY : -((-ts + MS_PER_DAY - 1) / MS_PER_DAY);
}

inline Timestamp start_of_day(DayNumber day) {
    return day * MS_PER_DAY;
}

// Whole days elapsed between two timestamps (never negative)
inline int64_t days_between(Timestamp earlier, Timestamp later) {
    if (later <= earlier) return 0;
    return (later - earlier) / MS_PER_DAY;
}

// Civil date <-> day number (Howard Hinnant's algorithm)
inline DayNumber days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<DayNumber>(era) * 146097 + static_cast<DayNumber>(doe) - 719468;
}

inline void civil_from_days(DayNumber z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const DayNumber era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2);
}

// YYYY-MM-DD
inline std::string format_day(DayNumber day) {
    int y;
    unsigned m, d;
    civil_from_days(day, y, m, d);
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

// Parse YYYY-MM-DD, returns false on malformed input
inline bool parse_day(const std::string& s, DayNumber& out) {
    int y = 0;
    unsigned m = 0, d = 0;
    if (sscanf(s.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) return false;
    if (m < 1 || m > 12 || d < 1 || d > 31) return false;
    out = days_from_civil(y, m, d);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text helpers
// ═══════════════════════════════════════════════════════════════════════════

inline std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Lowercase, collapse whitespace. Used as a natural key for titles.
inline std::string normalize_key(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!out.empty() && out.back() != ' ') out += ' ';
        } else {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

// Tokenizer shared by every ranked search: lowercase alphanumeric runs,
// single characters dropped
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current.empty()) {
            if (current.length() >= 2) {
                tokens.push_back(current);
            }
            current.clear();
        }
    }
    if (current.length() >= 2) {
        tokens.push_back(current);
    }
    return tokens;
}

inline std::string basename_of(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace cortex
