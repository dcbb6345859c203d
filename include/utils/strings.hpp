#pragma once
#include <string>

std::string to_upper_ascii(std::string s);

// Drops spaces and dashes ("4532-1234 5678 9012" -> "4532123456789012").
std::string strip_card_separators(const std::string& s);

bool is_all_digits(const std::string& s);

std::string trim(const std::string& s);

std::string format_money(double amount);
