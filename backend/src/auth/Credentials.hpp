#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

// Registration field parsers. The rules match what the game's account
// registration panel accepts: input is filtered down to an allowed ASCII
// class first, then checked for structure and length. Over-long input is
// truncated, not rejected.

enum class NameError {
    Empty,
    TooShort
};

enum class PasswordError {
    Empty,
    TooShort
};

enum class EmailError {
    Empty,
    TooShort,
    Malformed
};

std::string toString(NameError reason);
std::string toString(PasswordError reason);
std::string toString(EmailError reason);

// Thrown by the parse() factories. reason() carries the typed cause.
template <typename Reason>
class FieldError : public std::invalid_argument {
public:
    FieldError(const std::string& field, Reason reason)
        : std::invalid_argument(field + " rejected: " + toString(reason)), fieldReason(reason)
    {
    }

    Reason reason() const { return fieldReason; }

private:
    Reason fieldReason;
};

using InvalidName = FieldError<NameError>;
using InvalidPassword = FieldError<PasswordError>;
using InvalidEmail = FieldError<EmailError>;

class Name {
public:
    static constexpr std::size_t MIN_LENGTH = 3;
    static constexpr std::size_t MAX_LENGTH = 14;

    // Throws InvalidName.
    static Name parse(const std::string& input);
    static std::optional<Name> tryParse(const std::string& input, NameError* reason = nullptr);

    const std::string& asStr() const { return value; }
    std::size_t size() const { return value.size(); }

    bool operator==(const Name& other) const { return value == other.value; }
    bool operator!=(const Name& other) const { return value != other.value; }

private:
    explicit Name(std::string sanitized);

    std::string value;
};

// Plaintext password. The backing storage is wiped when the value is
// destroyed or overwritten; never log or serialize it.
class Password {
public:
    static constexpr std::size_t MIN_LENGTH = 6;
    static constexpr std::size_t MAX_LENGTH = 19;

    // Throws InvalidPassword.
    static Password parse(const std::string& input);
    static std::optional<Password> tryParse(const std::string& input, PasswordError* reason = nullptr);

    Password(const Password& other) = default;
    // Copies, then wipes the source: a moved std::string can leave its
    // small-string buffer behind.
    Password(Password&& other) noexcept;
    Password& operator=(const Password& other);
    Password& operator=(Password&& other) noexcept;
    ~Password();

    const std::string& asStr() const { return value; }
    std::size_t size() const { return value.size(); }

    bool operator==(const Password& other) const { return value == other.value; }
    bool operator!=(const Password& other) const { return value != other.value; }

private:
    explicit Password(std::string sanitized);
    void wipe() noexcept;

    std::string value;
};

class Email {
public:
    static constexpr std::size_t MIN_LENGTH = 4;
    static constexpr std::size_t MAX_LENGTH = 49;

    // Throws InvalidEmail.
    static Email parse(const std::string& input);
    static std::optional<Email> tryParse(const std::string& input, EmailError* reason = nullptr);

    const std::string& asStr() const { return value; }
    std::size_t size() const { return value.size(); }

    bool operator==(const Email& other) const { return value == other.value; }
    bool operator!=(const Email& other) const { return value != other.value; }

private:
    explicit Email(std::string sanitized);

    std::string value;
};

