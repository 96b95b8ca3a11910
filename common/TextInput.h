#pragma once

#include <string>
#include <optional>

std::string trim(const std::string& text);

// Whole-string parses; surrounding whitespace is ignored, anything else fails
std::optional<int> parse_int(const std::string& text);
std::optional<double> parse_decimal(const std::string& text);
