#include "Credentials.hpp"
#include "../utils/charset.hpp"
#include <sodium.h>
#include <utility>

namespace {

// Zeroes the bytes past newSize before shrinking, so truncated password
// text does not linger in the buffer.
void truncateWiped(std::string& s, std::size_t newSize) {
    if (s.size() <= newSize) return;
    sodium_memzero(&s[newSize], s.size() - newSize);
    s.resize(newSize);
}

void wipeString(std::string& s) {
    if (!s.empty())
        sodium_memzero(&s[0], s.size());
    s.clear();
}

template <typename Reason>
void report(Reason* out, Reason reason) {
    if (out) *out = reason;
}

} // namespace

std::string toString(NameError reason) {
    switch (reason) {
        case NameError::Empty:    return "empty";
        case NameError::TooShort: return "too_short";
    }
    return "unknown";
}

std::string toString(PasswordError reason) {
    switch (reason) {
        case PasswordError::Empty:    return "empty";
        case PasswordError::TooShort: return "too_short";
    }
    return "unknown";
}

std::string toString(EmailError reason) {
    switch (reason) {
        case EmailError::Empty:     return "empty";
        case EmailError::TooShort:  return "too_short";
        case EmailError::Malformed: return "malformed";
    }
    return "unknown";
}

// ---------------------------------------------------------------- Name

Name::Name(std::string sanitized)
    : value(std::move(sanitized))
{
}

std::optional<Name> Name::tryParse(const std::string& input, NameError* reason) {
    std::string sanitized = Charset::filter(input, Charset::NAME_SPECIALS);

    if (sanitized.empty()) {
        report(reason, NameError::Empty);
        return std::nullopt;
    }

    if (sanitized.size() < MIN_LENGTH) {
        report(reason, NameError::TooShort);
        return std::nullopt;
    }

    if (sanitized.size() > MAX_LENGTH)
        sanitized.resize(MAX_LENGTH);

    return Name(std::move(sanitized));
}

Name Name::parse(const std::string& input) {
    NameError reason = NameError::Empty;
    auto name = tryParse(input, &reason);
    if (!name)
        throw InvalidName("name", reason);
    return std::move(*name);
}

// ------------------------------------------------------------ Password

Password::Password(std::string sanitized)
    : value(std::move(sanitized))
{
}

Password::Password(Password&& other) noexcept
    : value(other.value)
{
    other.wipe();
}

Password& Password::operator=(const Password& other) {
    if (this != &other) {
        wipe();
        value = other.value;
    }
    return *this;
}

Password& Password::operator=(Password&& other) noexcept {
    if (this != &other) {
        wipe();
        value = other.value;
        other.wipe();
    }
    return *this;
}

Password::~Password() {
    wipe();
}

void Password::wipe() noexcept {
    wipeString(value);
}

std::optional<Password> Password::tryParse(const std::string& input, PasswordError* reason) {
    std::string sanitized = Charset::filter(input, Charset::PASSWORD_SPECIALS);

    if (sanitized.empty()) {
        report(reason, PasswordError::Empty);
        return std::nullopt;
    }

    if (sanitized.size() < MIN_LENGTH) {
        wipeString(sanitized);
        report(reason, PasswordError::TooShort);
        return std::nullopt;
    }

    truncateWiped(sanitized, MAX_LENGTH);
    return Password(std::move(sanitized));
}

Password Password::parse(const std::string& input) {
    PasswordError reason = PasswordError::Empty;
    auto password = tryParse(input, &reason);
    if (!password)
        throw InvalidPassword("password", reason);
    return std::move(*password);
}

// --------------------------------------------------------------- Email

Email::Email(std::string sanitized)
    : value(std::move(sanitized))
{
}

std::optional<Email> Email::tryParse(const std::string& input, EmailError* reason) {
    std::string sanitized = Charset::filter(input, Charset::EMAIL_SPECIALS);

    if (sanitized.empty()) {
        report(reason, EmailError::Empty);
        return std::nullopt;
    }

    // The last '@' splits local part and domain
    const std::size_t at = sanitized.rfind('@');
    if (at == std::string::npos || at == 0) {
        report(reason, EmailError::Malformed);
        return std::nullopt;
    }

    // Needs a '.' somewhere after that '@', and not as the final character
    const std::size_t dot = sanitized.rfind('.');
    if (dot == std::string::npos || dot < at || dot + 1 == sanitized.size()) {
        report(reason, EmailError::Malformed);
        return std::nullopt;
    }

    bool numericLocal = true;
    for (std::size_t i = 0; i < at; ++i) {
        if (!Charset::isDigit(sanitized[i])) {
            numericLocal = false;
            break;
        }
    }
    if (numericLocal) {
        report(reason, EmailError::Malformed);
        return std::nullopt;
    }

    if (!Charset::isAlpha(sanitized[0])) {
        report(reason, EmailError::Malformed);
        return std::nullopt;
    }

    // Unreachable after the structural checks above, kept so the
    // function stays total.
    if (sanitized.size() < MIN_LENGTH) {
        report(reason, EmailError::TooShort);
        return std::nullopt;
    }

    if (sanitized.size() > MAX_LENGTH)
        sanitized.resize(MAX_LENGTH);

    return Email(std::move(sanitized));
}

Email Email::parse(const std::string& input) {
    EmailError reason = EmailError::Empty;
    auto email = tryParse(input, &reason);
    if (!email)
        throw InvalidEmail("email", reason);
    return std::move(*email);
}
