#include "utils/strings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

std::string to_upper_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return s;
}

std::string strip_card_separators(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (ch != ' ' && ch != '-') out.push_back(ch);
    }
    return out;
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string format_money(double amount) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "$%.2f", amount);
    return buf;
}
