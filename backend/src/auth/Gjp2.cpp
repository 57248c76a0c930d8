#include "Gjp2.hpp"
#include "../utils/charset.hpp"
#include <boost/http/bcrypt/hash.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/evp.h>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace bcrypt = boost::http::bcrypt;

namespace {

constexpr char BCRYPT_PREFIX[] = "$2b$";
// bcrypt base64 is alphanumerics plus these two
constexpr char BCRYPT_SPECIALS[] = "./";

void wipe(std::string& s) {
    if (!s.empty())
        sodium_memzero(&s[0], s.size());
    s.clear();
}

// Wipes a secret string when leaving scope, including on throw
struct WipeOnExit {
    std::string& secret;
    ~WipeOnExit() { wipe(secret); }
};

std::string toHex(const std::string& raw) {
    std::vector<unsigned char> bin(raw.begin(), raw.end());
    std::vector<char> hex(2 * bin.size() + 1);
    sodium_bin2hex(hex.data(), hex.size(), bin.data(), bin.size());
    std::string out(hex.data(), 2 * bin.size());
    sodium_memzero(bin.data(), bin.size());
    sodium_memzero(hex.data(), hex.size());
    return out;
}

// One-shot SHA-1 of plaintext + suffix, for the stateless verifier
std::string saltedSha1(const std::string& plaintext) {
    std::string salted = plaintext + Gjp2Generator::SUFFIX;
    WipeOnExit guard{salted};

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_Digest(salted.data(), salted.size(), md, &mdLen, EVP_sha1(), nullptr) != 1) {
        spdlog::error("EVP_Digest(sha1) failed");
        throw Gjp2Error("EVP_Digest(sha1) failed");
    }

    std::string digest(md, md + mdLen);
    sodium_memzero(md, sizeof(md));
    return digest;
}

// digest is passed with its length, so zero bytes inside it are hashed
std::string bcryptHash(const std::string& digest, unsigned cost) {
    try {
        bcrypt::result hashed = bcrypt::hash(
            boost::core::string_view(digest.data(), digest.size()), cost, bcrypt::version::v2b);
        return std::string(hashed.str().data(), hashed.str().size());
    } catch (const boost::system::system_error& e) {
        spdlog::error("bcrypt hash failed: {}", e.code().message());
        throw Gjp2Error("bcrypt hash failed", e.code().value());
    }
}

bool bcryptMatches(const std::string& digest, const Gjp2& verifier) {
    boost::system::error_code ec;
    const bool match = bcrypt::compare(
        boost::core::string_view(digest.data(), digest.size()), verifier.asStr(), ec);
    if (ec) {
        spdlog::error("bcrypt compare failed: {}", ec.message());
        throw Gjp2Error("bcrypt compare failed", ec.value());
    }
    return match;
}

} // namespace

Gjp2Error::Gjp2Error(const std::string& what, int code)
    : std::runtime_error("gjp2: " + what), errorCode(code)
{
}

// ---------------------------------------------------------------- Gjp2

Gjp2::Gjp2(std::string encoded)
    : encoded(std::move(encoded))
{
}

Gjp2 Gjp2::fromStored(const std::string& encoded) {
    if (encoded.size() != ENCODED_LENGTH) {
        spdlog::warn("Stored verifier has length {}, expected {}", encoded.size(), ENCODED_LENGTH);
        throw Gjp2Error("stored verifier has wrong length");
    }

    const bool knownVariant = encoded.compare(0, 4, "$2a$") == 0
        || encoded.compare(0, 4, "$2b$") == 0
        || encoded.compare(0, 4, "$2y$") == 0;
    if (!knownVariant) {
        spdlog::warn("Stored verifier is not a bcrypt string");
        throw Gjp2Error("stored verifier is not a bcrypt string");
    }

    if (!Charset::isDigit(encoded[4]) || !Charset::isDigit(encoded[5]) || encoded[6] != '$') {
        spdlog::warn("Stored verifier has a malformed cost field");
        throw Gjp2Error("stored verifier has a malformed cost field");
    }

    const unsigned cost = static_cast<unsigned>((encoded[4] - '0') * 10 + (encoded[5] - '0'));
    if (cost < Gjp2Settings::MIN_COST || cost > Gjp2Settings::MAX_COST) {
        spdlog::warn("Stored verifier has out of range cost {}", cost);
        throw Gjp2Error("stored verifier has out of range cost");
    }

    if (!Charset::containsOnly(BCRYPT_SPECIALS, encoded.substr(7))) {
        spdlog::warn("Stored verifier contains characters outside the bcrypt alphabet");
        throw Gjp2Error("stored verifier is not bcrypt base64");
    }

    return Gjp2(encoded);
}

unsigned Gjp2::cost() const {
    return static_cast<unsigned>((encoded[4] - '0') * 10 + (encoded[5] - '0'));
}

// ------------------------------------------------------- Gjp2Generator

void Gjp2Generator::DigestContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Gjp2Generator::Gjp2Generator(Gjp2Settings settings)
    : digestContext(EVP_MD_CTX_new()), config(settings)
{
    if (config.cost < Gjp2Settings::MIN_COST || config.cost > Gjp2Settings::MAX_COST) {
        spdlog::error("Rejecting bcrypt cost {}", config.cost);
        throw std::invalid_argument("bcrypt cost must be between 4 and 31, got " + std::to_string(config.cost));
    }

    if (sodium_init() < 0) {
        spdlog::error("sodium_init failed");
        throw Gjp2Error("sodium_init failed");
    }

    if (!digestContext) {
        spdlog::error("EVP_MD_CTX_new failed");
        throw Gjp2Error("EVP_MD_CTX_new failed");
    }

    spdlog::info("Gjp2Generator initialized with bcrypt cost {}", config.cost);
}

Gjp2Generator::~Gjp2Generator() = default;
Gjp2Generator::Gjp2Generator(Gjp2Generator&& other) noexcept = default;
Gjp2Generator& Gjp2Generator::operator=(Gjp2Generator&& other) noexcept = default;

std::string Gjp2Generator::rawDigest(const Password& password) {
    EVP_MD_CTX* ctx = digestContext.get();
    if (!ctx) {
        spdlog::error("digest requested from a moved-from Gjp2Generator");
        throw Gjp2Error("generator has no digest context");
    }

    // Init resets whatever the previous derivation left in the context
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1
        || EVP_DigestUpdate(ctx, password.asStr().data(), password.size()) != 1
        || EVP_DigestUpdate(ctx, SUFFIX, sizeof(SUFFIX) - 1) != 1
        || EVP_DigestFinal_ex(ctx, md, &mdLen) != 1)
    {
        spdlog::error("SHA-1 stage of GJP2 derivation failed");
        throw Gjp2Error("EVP sha1 digest failed");
    }

    std::string bytes(md, md + mdLen);
    sodium_memzero(md, sizeof(md));
    return bytes;
}

std::string Gjp2Generator::digest(const Password& password) {
    std::string raw = rawDigest(password);
    WipeOnExit guard{raw};
    return toHex(raw);
}

Gjp2 Gjp2Generator::generateGjp2(Password password) {
    spdlog::debug("Deriving GJP2 verifier (not logging password)");

    std::string raw = rawDigest(password);
    WipeOnExit guard{raw};

    std::string encoded = bcryptHash(raw, config.cost);
    if (encoded.size() != Gjp2::ENCODED_LENGTH || encoded.compare(0, 4, BCRYPT_PREFIX) != 0) {
        spdlog::error("bcrypt returned an unexpected encoding ({} chars)", encoded.size());
        throw Gjp2Error("unexpected bcrypt encoding");
    }

    spdlog::debug("GJP2 verifier derived");
    return Gjp2(std::move(encoded));
}

// -------------------------------------------------------- verification

bool verifyGjp2(const std::string& candidate, const Gjp2& verifier) {
    spdlog::debug("Verifying GJP2 (not logging password or verifier)");

    std::string raw = saltedSha1(candidate);
    WipeOnExit guard{raw};

    return bcryptMatches(raw, verifier);
}

bool verifyGjp2Digest(const std::string& clientGjp2, const Gjp2& verifier) {
    if (clientGjp2.size() != Gjp2Generator::DIGEST_HEX_LENGTH) {
        spdlog::debug("Client gjp2 has length {}, expected {}", clientGjp2.size(), Gjp2Generator::DIGEST_HEX_LENGTH);
        return false;
    }

    // Accepts either case; rejects anything that does not decode in full
    unsigned char bin[Gjp2Generator::DIGEST_LENGTH];
    std::size_t binLen = 0;
    if (sodium_hex2bin(bin, sizeof(bin), clientGjp2.data(), clientGjp2.size(),
            nullptr, &binLen, nullptr) != 0
        || binLen != sizeof(bin))
    {
        sodium_memzero(bin, sizeof(bin));
        spdlog::debug("Client gjp2 is not hex");
        return false;
    }

    std::string raw(bin, bin + binLen);
    sodium_memzero(bin, sizeof(bin));
    WipeOnExit guard{raw};

    return bcryptMatches(raw, verifier);
}
