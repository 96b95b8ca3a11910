#include "TextInput.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();

    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;

    return text.substr(begin, end - begin);
}

std::optional<int> parse_int(const std::string& text) {
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;

    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size())
            return std::nullopt;
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parse_decimal(const std::string& text) {
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;

    // stod would also take hexadecimal floats
    size_t digits = (value[0] == '+' || value[0] == '-') ? 1 : 0;
    if (value.size() > digits + 1 && value[digits] == '0' && (value[digits + 1] == 'x' || value[digits + 1] == 'X'))
        return std::nullopt;

    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size() || !std::isfinite(parsed))
            return std::nullopt;
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
