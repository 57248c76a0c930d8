#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Social media handles are optional: anything that filters down to an
// empty string is simply absent.
std::optional<std::string> sanitizeSocialHandle(const std::string& input);

class SocialMediaHandles {
public:
    SocialMediaHandles() = default;
    SocialMediaHandles(const std::string& youtube, const std::string& twitter, const std::string& twitch);

    // Getters hand out copies; setters re-sanitize and return *this for chaining.
    std::optional<std::string> youtube() const { return youtubeHandle; }
    SocialMediaHandles& setYoutube(const std::string& youtube);

    std::optional<std::string> twitter() const { return twitterHandle; }
    SocialMediaHandles& setTwitter(const std::string& twitter);

    std::optional<std::string> twitch() const { return twitchHandle; }
    SocialMediaHandles& setTwitch(const std::string& twitch);

private:
    std::optional<std::string> youtubeHandle;
    // Renamed to X, but the game still shows it as Twitter
    std::optional<std::string> twitterHandle;
    std::optional<std::string> twitchHandle;
};

struct IconSet {
    std::uint32_t iconId = 0;
    std::uint32_t shipId = 0;
    std::uint32_t jetpackId = 0;
    std::uint32_t ballId = 0;
    std::uint32_t ufoId = 0;
    std::uint32_t waveId = 0;
    std::uint32_t robotId = 0;
    std::uint32_t spiderId = 0;
    std::uint32_t swingId = 0;
    std::uint32_t glowId = 0;
    std::uint32_t deathEffectId = 0;
};

struct Stats {
    std::uint32_t stars = 0;
    std::uint32_t moons = 0;
    std::uint32_t coins = 0;
    std::uint32_t userCoins = 0;
    std::uint32_t diamonds = 0;
    std::uint32_t demons = 0;
    std::uint32_t creatorPoints = 0;
    std::uint32_t orbs = 0;
};

// Discriminants are persisted; do not reorder.
enum class Ban : std::uint8_t {
    None = 0,
    Leaderboard = 1,
    Creator = 2,
    LeaderboardAndCreator = 3
};

std::uint8_t toByte(Ban ban);

// Throws std::invalid_argument for anything above 3.
Ban banFromByte(std::uint8_t value);

std::string toString(Ban ban);

bool isLeaderboardBanned(Ban ban);
bool isCreatorBanned(Ban ban);
Ban withLeaderboardBan(Ban ban, bool banned);
Ban withCreatorBan(Ban ban, bool banned);

// Privacy policies. The variants are defined by the game server that
// consumes this library; none are assumed here.
enum class AllowMessagesFrom : std::uint8_t {};
enum class AllowFriendRequestsFrom : std::uint8_t {};
enum class DisplayCommentHistoryTo : std::uint8_t {};
