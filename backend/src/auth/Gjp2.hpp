#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include "Credentials.hpp"

// OpenSSL digest context, defined in <openssl/evp.h>
struct evp_md_ctx_st;

// GJP2 is the password verifier scheme the game client expects:
//
//   digest   = SHA1(password + "mI29fmAnxgTs")   (20 raw bytes)
//   verifier = bcrypt(digest)                   (what the server stores)
//
// The client sends hex(digest) as its gjp2 field. bcrypt sees the raw
// bytes, embedded zero bytes included. The verifier is the
// self-describing "$2b$<cost>$<salt><hash>" string.

// Any failure of the underlying primitives (entropy, cost, encoding).
class Gjp2Error : public std::runtime_error {
public:
    explicit Gjp2Error(const std::string& what, int code = 0);

    // Error value reported by the failing primitive, 0 if it gave none
    int code() const { return errorCode; }

private:
    int errorCode;
};

class Gjp2 {
public:
    static constexpr std::size_t ENCODED_LENGTH = 60;

    // Rehydrates a verifier loaded from storage. Throws Gjp2Error unless
    // encoded is a well formed $2a$/$2b$/$2y$ bcrypt string.
    static Gjp2 fromStored(const std::string& encoded);

    const std::string& asStr() const { return encoded; }
    unsigned cost() const;

    bool operator==(const Gjp2& other) const { return encoded == other.encoded; }
    bool operator!=(const Gjp2& other) const { return encoded != other.encoded; }

private:
    friend class Gjp2Generator;
    explicit Gjp2(std::string encoded);

    std::string encoded;
};

struct Gjp2Settings {
    static constexpr unsigned MIN_COST = 4;
    static constexpr unsigned MAX_COST = 31;
    static constexpr unsigned DEFAULT_COST = 12;

    unsigned cost = DEFAULT_COST;
};

// Derives verifiers for new passwords. Holds one SHA-1 context that is
// re-initialised for every derivation, so an instance must not be shared
// between threads: use one generator per worker.
class Gjp2Generator {
public:
    static constexpr char SUFFIX[] = "mI29fmAnxgTs";
    static constexpr std::size_t DIGEST_LENGTH = 20;
    static constexpr std::size_t DIGEST_HEX_LENGTH = 2 * DIGEST_LENGTH;

    // Throws std::invalid_argument for a cost outside MIN_COST..MAX_COST,
    // Gjp2Error if libsodium or OpenSSL cannot be initialised.
    explicit Gjp2Generator(Gjp2Settings settings = {});
    ~Gjp2Generator();

    Gjp2Generator(Gjp2Generator&& other) noexcept;
    Gjp2Generator& operator=(Gjp2Generator&& other) noexcept;
    Gjp2Generator(const Gjp2Generator&) = delete;
    Gjp2Generator& operator=(const Gjp2Generator&) = delete;

    // Consumes the password; its plaintext is wiped on return.
    Gjp2 generateGjp2(Password password);

    // The hex digest a game client sends for this password.
    std::string digest(const Password& password);

    const Gjp2Settings& settings() const { return config; }

private:
    // The 20 digest bytes; may contain '\0'.
    std::string rawDigest(const Password& password);

    struct DigestContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, DigestContextDeleter> digestContext;
    Gjp2Settings config;
};

// Checks a plaintext candidate against a stored verifier. Returns false on
// mismatch, throws Gjp2Error if bcrypt itself fails.
bool verifyGjp2(const std::string& candidate, const Gjp2& verifier);

// Same check for a client that already sent its hex gjp2 digest. It is
// decoded back to the raw digest first; anything that is not 40 hex
// characters never matches.
bool verifyGjp2Digest(const std::string& clientGjp2, const Gjp2& verifier);
