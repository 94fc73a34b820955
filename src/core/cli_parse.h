#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace brandimg::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

// Splits on `separator`, trims every item and drops empty ones.
std::vector<std::string> split_list(const std::string& value, char separator = ',');

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_positive_double(const std::string& value, double& out);

// "256,512,1024" -> {256, 512, 1024}; every entry must be a positive integer.
bool parse_positive_int_list(const std::string& value, std::vector<int>& out);

// Plain byte count or a number with a K/M suffix (binary units): "3M" -> 3145728.
bool parse_byte_count(const std::string& value, size_t& out);

// Keeps the first occurrence of every item, in order.
void remove_duplicates(std::vector<std::string>& items);
void remove_duplicates(std::vector<int>& items);

} // namespace brandimg::core
