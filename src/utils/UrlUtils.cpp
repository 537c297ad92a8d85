#include "utils/UrlUtils.h"
#include <cctype>

namespace {
    const char HEX[] = "0123456789ABCDEF";

    bool isUnreserved(unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
    }

    bool isSegmentSafe(unsigned char c) {
        switch (c) {
            case '$': case '&': case '+':
            case '=': case ':': case '@':
                return true;
            default:
                return isUnreserved(c);
        }
    }

    void appendPercent(std::string& out, unsigned char c) {
        out += '%';
        out += HEX[c >> 4];
        out += HEX[c & 0x0F];
    }
}

namespace UrlUtils {

std::string queryEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out += ch;
        } else if (c == ' ') {
            out += '+';
        } else {
            appendPercent(out, c);
        }
    }
    return out;
}

std::string pathEscape(const std::string& segment) {
    std::string out;
    out.reserve(segment.size() * 3);
    for (char ch : segment) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isSegmentSafe(c)) {
            out += ch;
        } else {
            appendPercent(out, c);
        }
    }
    return out;
}

std::string escapePath(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            out += pathEscape(path.substr(start));
            break;
        }
        out += pathEscape(path.substr(start, slash - start));
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string trimPrefix(const std::string& s, char c) {
    if (!s.empty() && s.front() == c) {
        return s.substr(1);
    }
    return s;
}

std::string trim(const std::string& s, char c) {
    size_t first = s.find_first_not_of(c);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(c);
    return s.substr(first, last - first + 1);
}

}
