#include "terminal.hpp"

std::string ansi::color(int code) {
    return "\x1b[" + std::to_string(code) + "m";
}

CursorGuard::CursorGuard(std::ostream& out) : out(out), hidden(true) {
    out << ansi::HIDE_CURSOR << std::flush;
}

CursorGuard::~CursorGuard() {
    release();
}

void CursorGuard::release() {
    if (!hidden) {
        return;
    }
    hidden = false;
    out << ansi::SHOW_CURSOR << std::flush;
}
