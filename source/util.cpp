#include "iman/util.hpp"
#include <unicode/unistr.h>

namespace iman::util {

std::string foldCase(const std::string& utf8) {
    std::string out;
    icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())))
        .foldCase()
        .toUTF8String(out);
    return out;
}

bool iequals(const std::string& a, const std::string& b) {
    return foldCase(a) == foldCase(b);
}

bool icontains(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return foldCase(haystack).find(foldCase(needle)) != std::string::npos;
}

int icompare(const std::string& a, const std::string& b) {
    const int c = foldCase(a).compare(foldCase(b));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

namespace {

bool readDigits(const std::string& t, size_t& i, size_t count, int& out) {
    if (i + count > t.size()) return false;
    out = 0;
    for (size_t k = 0; k < count; ++k) {
        const char c = t[i + k];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        out = out * 10 + (c - '0');
    }
    i += count;
    return true;
}

bool skipChar(const std::string& t, size_t& i, char c) {
    if (i < t.size() && t[i] == c) {
        ++i;
        return true;
    }
    return false;
}

} // namespace

bool parseIsoTimestamp(const std::string& text, int64_t& out) {
    const std::string t = trim(text);
    size_t i = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int64_t offset = 0;
    if (!readDigits(t, i, 4, y) || !skipChar(t, i, '-') || !readDigits(t, i, 2, mo) ||
        !skipChar(t, i, '-') || !readDigits(t, i, 2, d))
        return false;

    if (i < t.size()) {
        if (t[i] != 'T' && t[i] != ' ') return false;
        ++i;
        if (!readDigits(t, i, 2, h) || !skipChar(t, i, ':') || !readDigits(t, i, 2, mi)) return false;
        if (skipChar(t, i, ':')) {
            if (!readDigits(t, i, 2, s)) return false;
            if (skipChar(t, i, '.')) {
                const size_t digits = i;
                while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
                if (i == digits) return false;
            }
        }
        if (i < t.size()) {
            const char zone = t[i++];
            if (zone == 'Z') {
                if (i != t.size()) return false;
            } else if (zone == '+' || zone == '-') {
                int oh = 0, om = 0;
                if (!readDigits(t, i, 2, oh)) return false;
                if (i < t.size()) {
                    skipChar(t, i, ':');
                    if (!readDigits(t, i, 2, om)) return false;
                }
                if (i != t.size() || oh > 23 || om > 59) return false;
                offset = (oh * 3600 + om * 60) * (zone == '-' ? -1 : 1);
            } else {
                return false;
            }
        }
    }

    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) return false;
    // Local time minus its offset is UTC.
    out = daysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d)) * 86400 +
          h * 3600 + mi * 60 + s - offset;
    return true;
}

} // namespace iman::util
