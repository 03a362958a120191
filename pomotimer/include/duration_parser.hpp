#ifndef DURATIONPARSER_HPP
#define DURATIONPARSER_HPP

#include <string>

// Converts "25:00", "1500" or "1h2m3s" style text into whole seconds.
// Rules are tried in that order and the first match wins.
// Throws InvalidDuration when nothing matches.
int parse_duration(const std::string& text);

#endif // DURATIONPARSER_HPP
