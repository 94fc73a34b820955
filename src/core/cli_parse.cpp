#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace brandimg::core {

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::ranges::transform(value, value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> split_list(const std::string& value, char separator) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(separator, start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string item = trim_copy(value.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed <= 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_positive_double(const std::string& token, double& out) {
    if (token.empty()) {
        return false;
    }
    std::istringstream iss(token);
    double value = 0.0;
    char extra = '\0';
    if (!(iss >> value)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    if (!std::isfinite(value) || value <= 0.0) {
        return false;
    }
    out = value;
    return true;
}

bool parse_positive_int_list(const std::string& value, std::vector<int>& out) {
    std::vector<std::string> items = split_list(value);
    if (items.empty()) {
        return false;
    }
    std::vector<int> parsed;
    parsed.reserve(items.size());
    for (const std::string& item : items) {
        int n = 0;
        if (!parse_positive_int(item, n)) {
            return false;
        }
        parsed.push_back(n);
    }
    out = std::move(parsed);
    return true;
}

bool parse_byte_count(const std::string& value, size_t& out) {
    if (value.empty()) {
        return false;
    }
    size_t multiplier = 1;
    std::string digits = value;
    const char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(value.back())));
    if (suffix == 'K' || suffix == 'M') {
        multiplier = (suffix == 'K') ? 1024 : 1024 * 1024;
        digits.pop_back();
    }
    size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size() || parsed == 0) {
        return false;
    }
    if (parsed > std::numeric_limits<size_t>::max() / multiplier) {
        return false;
    }
    out = parsed * multiplier;
    return true;
}

void remove_duplicates(std::vector<std::string>& items) {
    std::vector<std::string> unique;
    unique.reserve(items.size());
    for (std::string& item : items) {
        if (std::ranges::find(unique, item) == unique.end()) {
            unique.push_back(std::move(item));
        }
    }
    items = std::move(unique);
}

void remove_duplicates(std::vector<int>& items) {
    std::vector<int> unique;
    unique.reserve(items.size());
    for (int item : items) {
        if (std::ranges::find(unique, item) == unique.end()) {
            unique.push_back(item);
        }
    }
    items = std::move(unique);
}

} // namespace brandimg::core
