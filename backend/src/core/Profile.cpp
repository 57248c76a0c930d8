#include "Profile.hpp"
#include "../utils/charset.hpp"
#include <stdexcept>

std::optional<std::string> sanitizeSocialHandle(const std::string& input) {
    std::string sanitized = Charset::filter(input, Charset::HANDLE_SPECIALS);
    if (sanitized.empty())
        return std::nullopt;
    return sanitized;
}

SocialMediaHandles::SocialMediaHandles(const std::string& youtube, const std::string& twitter, const std::string& twitch)
    : youtubeHandle(sanitizeSocialHandle(youtube)),
      twitterHandle(sanitizeSocialHandle(twitter)),
      twitchHandle(sanitizeSocialHandle(twitch))
{
}

SocialMediaHandles& SocialMediaHandles::setYoutube(const std::string& youtube) {
    youtubeHandle = sanitizeSocialHandle(youtube);
    return *this;
}

SocialMediaHandles& SocialMediaHandles::setTwitter(const std::string& twitter) {
    twitterHandle = sanitizeSocialHandle(twitter);
    return *this;
}

SocialMediaHandles& SocialMediaHandles::setTwitch(const std::string& twitch) {
    twitchHandle = sanitizeSocialHandle(twitch);
    return *this;
}

std::uint8_t toByte(Ban ban) {
    return static_cast<std::uint8_t>(ban);
}

Ban banFromByte(std::uint8_t value) {
    if (value > toByte(Ban::LeaderboardAndCreator))
        throw std::invalid_argument("Unknown Ban discriminant: " + std::to_string(value));
    return static_cast<Ban>(value);
}

std::string toString(Ban ban) {
    switch (ban) {
        case Ban::None:                  return "none";
        case Ban::Leaderboard:           return "leaderboard";
        case Ban::Creator:               return "creator";
        case Ban::LeaderboardAndCreator: return "leaderboard_and_creator";
    }
    return "unknown";
}

bool isLeaderboardBanned(Ban ban) {
    return ban == Ban::Leaderboard || ban == Ban::LeaderboardAndCreator;
}

bool isCreatorBanned(Ban ban) {
    return ban == Ban::Creator || ban == Ban::LeaderboardAndCreator;
}

Ban withLeaderboardBan(Ban ban, bool banned) {
    const bool creator = isCreatorBanned(ban);
    if (banned)
        return creator ? Ban::LeaderboardAndCreator : Ban::Leaderboard;
    return creator ? Ban::Creator : Ban::None;
}

Ban withCreatorBan(Ban ban, bool banned) {
    const bool leaderboard = isLeaderboardBanned(ban);
    if (banned)
        return leaderboard ? Ban::LeaderboardAndCreator : Ban::Creator;
    return leaderboard ? Ban::Leaderboard : Ban::None;
}
