#pragma once

#include <cctype>
#include <stdexcept>
#include <string>

inline std::string ltrim(const std::string& s) {
    std::size_t pos = s.find_first_not_of(" \t\r\n");
    if (pos == std::string::npos) return "";
    return s.substr(pos);
}

inline std::string rtrim(const std::string& s) {
    std::size_t pos = s.find_last_not_of(" \t\r\n");
    if (pos == std::string::npos) return "";
    return s.substr(0, pos + 1);
}

inline std::string toLower(const std::string& s) {
    std::string t = s;
    for (char& c : t) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return t;
}

// SPICE 数值后缀（大小写不敏感）；单位字母跟在后缀后面时忽略，如 10kohm、1uA
inline double spiceSuffixFactor(const std::string& suffix) {
    std::string s = toLower(suffix);
    if (s.compare(0, 3, "meg") == 0) return 1e6;
    if (s.compare(0, 3, "mil") == 0) return 25.4e-6;
    if (s.empty()) return 1.0;
    switch (s[0]) {
        case 'f': return 1e-15;
        case 'p': return 1e-12;
        case 'n': return 1e-9;
        case 'u': return 1e-6;
        case 'm': return 1e-3;
        case 'k': return 1e3;
        case 'g': return 1e9;
        case 't': return 1e12;
        default:  break;
    }
    if (std::isalpha(static_cast<unsigned char>(s[0]))) return 1.0;  // 纯单位，如 1V
    throw std::invalid_argument("bad numeric suffix '" + suffix + "'");
}

// 支持科学计数法 + SPICE 后缀：10k, 1u, 3e12, 3.3meg 等
// 解析失败抛 std::invalid_argument
inline double parseSpiceNumber(const std::string& token) {
    std::size_t pos = 0;
    double base = 0.0;
    try {
        base = std::stod(token, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("cannot parse number '" + token + "'");
    }
    if (pos == token.size()) return base;
    return base * spiceSuffixFactor(token.substr(pos));
}

inline bool isGroundName(const std::string& n) {
    std::string lower = toLower(n);
    return (lower == "0" || lower == "gnd");
}
