#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on '\n'. A final '\n' does not produce an empty last element;
// whether one was present is reported through trailingNewline.
// '\r' is left on the line so CRLF files round-trip.
std::vector<std::string> split_lines(const std::string& text, bool* trailingNewline = nullptr);

// Replace a leading "~/" (or a lone "~") with home
std::string expand_home(const std::string& path, const std::string& home);
