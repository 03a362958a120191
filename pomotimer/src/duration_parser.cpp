#include <cctype>
#include <climits>
#include <string>

#include "duration_parser.hpp"
#include "errors.hpp"

namespace {

const char* const EXAMPLES = "25m, 90s, 1m30s, 25:00, 1500";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    std::string::size_type first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    std::string::size_type last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Length of the run of ASCII digits starting at pos.
std::string::size_type digit_run(const std::string& s, std::string::size_type pos) {
    std::string::size_type end = pos;
    while (end < s.size() && is_digit(s[end])) {
        ++end;
    }
    return end - pos;
}

long long to_number(const std::string& original, const std::string& digits) {
    long long value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
        if (value > INT_MAX) {
            throw InvalidDuration("duration too large: \"" + original + "\"");
        }
    }
    return value;
}

int checked(const std::string& original, long long total) {
    if (total > INT_MAX) {
        throw InvalidDuration("duration too large: \"" + original + "\"");
    }
    return static_cast<int>(total);
}

// MM:SS, one to three digits of minutes and exactly two of seconds.
bool match_clock(const std::string& s, const std::string& original, int& seconds) {
    std::string::size_type colon = s.find(':');
    if (colon == std::string::npos || colon < 1 || colon > 3) {
        return false;
    }
    if (digit_run(s, 0) != colon) {
        return false;
    }
    if (s.size() != colon + 3 || digit_run(s, colon + 1) != 2) {
        return false;
    }
    long long mm = to_number(original, s.substr(0, colon));
    long long ss = to_number(original, s.substr(colon + 1));
    seconds = checked(original, mm * 60 + ss);
    return true;
}

bool match_plain(const std::string& s, const std::string& original, int& seconds) {
    if (digit_run(s, 0) != s.size()) {
        return false;
    }
    seconds = checked(original, to_number(original, s));
    return true;
}

// [<N>h][<N>m][<N>s], each unit once and in that order.
bool match_compound(const std::string& s, const std::string& original, int& seconds) {
    static const char units[] = {'h', 'm', 's'};
    static const long long scale[] = {3600, 60, 1};

    std::string::size_type pos = 0;
    long long total = 0;
    bool any = false;
    for (int i = 0; i < 3; ++i) {
        std::string::size_type n = digit_run(s, pos);
        if (n == 0 || pos + n >= s.size()) {
            continue;
        }
        if (std::tolower(static_cast<unsigned char>(s[pos + n])) != units[i]) {
            continue;
        }
        total += to_number(original, s.substr(pos, n)) * scale[i];
        if (total > INT_MAX) {
            throw InvalidDuration("duration too large: \"" + original + "\"");
        }
        pos += n + 1;
        any = true;
    }
    if (!any || pos != s.size() || total <= 0) {
        return false;
    }
    seconds = static_cast<int>(total);
    return true;
}

}  // namespace

int parse_duration(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) {
        throw InvalidDuration("duration is required: \"" + text + "\" (examples: " + EXAMPLES + ")");
    }

    int seconds = 0;
    if (match_clock(s, text, seconds)) {
        return seconds;
    }
    if (match_plain(s, text, seconds)) {
        return seconds;
    }
    if (match_compound(s, text, seconds)) {
        return seconds;
    }

    throw InvalidDuration("invalid duration: \"" + text + "\" (examples: " + EXAMPLES + ")");
}
