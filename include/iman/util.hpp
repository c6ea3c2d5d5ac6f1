#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace iman::util {

inline std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Unicode full case folding (ICU); "Ру" and "ру" fold to the same string.
std::string foldCase(const std::string& utf8);

bool iequals(const std::string& a, const std::string& b);

// Case-insensitive substring test.
bool icontains(const std::string& haystack, const std::string& needle);

// -1 / 0 / 1 on the folded strings, in code point order.
int icompare(const std::string& a, const std::string& b);

inline std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

inline std::vector<std::string> splitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        std::string item = trim(s.substr(start, pos - start));
        if (!item.empty()) out.push_back(item);
        start = pos + 1;
    }
    return out;
}

// Sanitize a string for use as a single path component.
inline std::string safeName(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c <= 31 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|') {
            out.push_back('_');
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    if (out.empty() || out == "." || out == "..") out = "game";
    return out;
}

inline std::string humanSize(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    if (u == 0) std::snprintf(buf, sizeof(buf), "%llu %s", static_cast<unsigned long long>(bytes), units[u]);
    else std::snprintf(buf, sizeof(buf), "%.2f %s", v, units[u]);
    return buf;
}

inline std::string percent(uint64_t done, uint64_t total) {
    if (total == 0) return "0%";
    uint64_t p = done >= total ? 100 : (done * 100) / total;
    return std::to_string(p) + "%";
}

// Days since 1970-01-01 for a proleptic Gregorian date.
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Accepts "YYYY-MM-DD" and "YYYY-MM-DD[T ]HH:MM[:SS[.fff]]" followed by
// nothing (UTC), "Z" or a "+HH:MM" / "-HHMM" offset. Anything else is rejected.
bool parseIsoTimestamp(const std::string& text, int64_t& out);

inline std::string formatDate(int64_t epochSeconds) {
    if (epochSeconds <= 0) return {};
    std::time_t t = static_cast<std::time_t>(epochSeconds);
    std::tm tmv{};
    gmtime_r(&t, &tmv);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tmv);
    return buf;
}

} // namespace iman::util
