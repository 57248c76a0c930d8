#pragma once
#include <string>

// ASCII character classes used by the registration field sanitizers.
// Every check here ignores the C locale: bytes >= 0x80 are never
// alphanumeric, so any UTF-8 sequence is dropped by filter().

namespace Charset
{
    constexpr const char NAME_SPECIALS[] = "";
    constexpr const char PASSWORD_SPECIALS[] = "-_";
    constexpr const char EMAIL_SPECIALS[] = "-_@.";
    constexpr const char HANDLE_SPECIALS[] = "-_,' ";

    bool isAlpha(char c);
    bool isDigit(char c);
    bool isAlnum(char c);

    // Keeps alphanumerics and every byte listed in allowedSpecials,
    // preserving order and multiplicity.
    std::string filter(const std::string& input, const char* allowedSpecials);

    // True if every byte of tested is alphanumeric or in allowedSpecials.
    // An empty string passes.
    bool containsOnly(const char* allowedSpecials, const std::string& tested);
}
