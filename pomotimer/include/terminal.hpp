#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include <ostream>
#include <string>

namespace ansi {
const char* const HIDE_CURSOR = "\x1b[?25l";
const char* const SHOW_CURSOR = "\x1b[?25h";
const char* const CLEAR_LINE = "\r\x1b[2K";
const char* const RESET = "\x1b[0m";
const char* const REVERSE = "\x1b[7m";

std::string color(int code);
} // namespace ansi

// Hides the cursor on construction and shows it again exactly once, either
// through release() or when the guard goes out of scope.
class CursorGuard {
private:
    std::ostream& out;
    bool hidden;

public:
    explicit CursorGuard(std::ostream& out);
    ~CursorGuard();

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

    void release();
};

#endif // TERMINAL_HPP
