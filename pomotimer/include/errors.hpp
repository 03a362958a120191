#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Text that matches none of the duration grammars, or evaluates to nothing.
class InvalidDuration : public std::invalid_argument {
public:
    explicit InvalidDuration(const std::string& what) : std::invalid_argument(what) {}
};

// No DURATION on the command line.
class MissingArgument : public std::invalid_argument {
public:
    explicit MissingArgument(const std::string& what) : std::invalid_argument(what) {}
};

// TimerConfig values a timer cannot run with.
class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

#endif // ERRORS_HPP
