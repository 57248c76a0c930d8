#include "charset.hpp"
#include <cstring>

namespace Charset
{
    bool isAlpha(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    bool isAlnum(char c) {
        return isAlpha(c) || isDigit(c);
    }

    static bool allowed(char c, const char* specials) {
        if (isAlnum(c)) return true;
        // strchr would match the terminator for c == '\0'
        return c != '\0' && std::strchr(specials, c) != nullptr;
    }

    std::string filter(const std::string& input, const char* allowedSpecials) {
        std::string out;
        out.reserve(input.size());
        for (char c : input) {
            if (allowed(c, allowedSpecials))
                out.push_back(c);
        }
        return out;
    }

    bool containsOnly(const char* allowedSpecials, const std::string& tested) {
        for (char c : tested) {
            if (!allowed(c, allowedSpecials))
                return false;
        }
        return true;
    }
}
