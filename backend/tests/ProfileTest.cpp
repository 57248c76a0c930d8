#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "../src/core/Profile.hpp"

TEST(SocialHandle, Sanitize)
{
    EXPECT_FALSE(sanitizeSocialHandle("```").has_value());
    EXPECT_FALSE(sanitizeSocialHandle("").has_value());
    EXPECT_EQ(sanitizeSocialHandle("-_,' "), std::optional<std::string>("-_,' "));
    EXPECT_EQ(sanitizeSocialHandle("~xd"), std::optional<std::string>("xd"));

    // no upper bound on length
    const std::string longHandle(200, 'y');
    EXPECT_EQ(sanitizeSocialHandle(longHandle), std::optional<std::string>(longHandle));
}

TEST(SocialMediaHandlesTest, ConstructSanitizes)
{
    SocialMediaHandles handles("```", "-_,' ", "~xd");

    EXPECT_EQ(handles.youtube(), std::nullopt);
    EXPECT_EQ(handles.twitter(), std::optional<std::string>("-_,' "));
    EXPECT_EQ(handles.twitch(), std::optional<std::string>("xd"));
}

TEST(SocialMediaHandlesTest, ChainedSettersResanitize)
{
    SocialMediaHandles handles("```", "-_,' ", "~xd");
    handles.setYoutube("xd").setTwitter("").setTwitch("-_,' ");

    EXPECT_EQ(handles.youtube(), std::optional<std::string>("xd"));
    EXPECT_EQ(handles.twitter(), std::nullopt);
    EXPECT_EQ(handles.twitch(), std::optional<std::string>("-_,' "));
}

TEST(SocialMediaHandlesTest, GettersReturnCopies)
{
    SocialMediaHandles handles("RobTopGames", "", "");
    auto youtube = handles.youtube();
    ASSERT_TRUE(youtube.has_value());
    youtube->append("XX");

    EXPECT_EQ(handles.youtube(), std::optional<std::string>("RobTopGames"));
}

TEST(SocialMediaHandlesTest, DefaultIsAllAbsent)
{
    SocialMediaHandles handles;
    EXPECT_FALSE(handles.youtube().has_value());
    EXPECT_FALSE(handles.twitter().has_value());
    EXPECT_FALSE(handles.twitch().has_value());
}

TEST(ProfileRecords, DefaultToZero)
{
    IconSet icons;
    EXPECT_EQ(icons.iconId, 0u);
    EXPECT_EQ(icons.swingId, 0u);
    EXPECT_EQ(icons.deathEffectId, 0u);

    Stats stats;
    EXPECT_EQ(stats.stars, 0u);
    EXPECT_EQ(stats.userCoins, 0u);
    EXPECT_EQ(stats.orbs, 0u);
}

// ============================================
// BAN
// ============================================

TEST(BanTest, StableDiscriminants)
{
    EXPECT_EQ(toByte(Ban::None), 0);
    EXPECT_EQ(toByte(Ban::Leaderboard), 1);
    EXPECT_EQ(toByte(Ban::Creator), 2);
    EXPECT_EQ(toByte(Ban::LeaderboardAndCreator), 3);
    EXPECT_EQ(Ban{}, Ban::None);
}

TEST(BanTest, FromByte)
{
    for (std::uint8_t b = 0; b <= 3; ++b)
        EXPECT_EQ(toByte(banFromByte(b)), b);

    EXPECT_THROW(banFromByte(4), std::invalid_argument);
    EXPECT_THROW(banFromByte(255), std::invalid_argument);
}

TEST(BanTest, Names)
{
    EXPECT_EQ(toString(Ban::None), "none");
    EXPECT_EQ(toString(Ban::LeaderboardAndCreator), "leaderboard_and_creator");
}

TEST(BanTest, Axes)
{
    EXPECT_FALSE(isLeaderboardBanned(Ban::None));
    EXPECT_TRUE(isLeaderboardBanned(Ban::Leaderboard));
    EXPECT_FALSE(isLeaderboardBanned(Ban::Creator));
    EXPECT_TRUE(isLeaderboardBanned(Ban::LeaderboardAndCreator));

    EXPECT_FALSE(isCreatorBanned(Ban::Leaderboard));
    EXPECT_TRUE(isCreatorBanned(Ban::Creator));
    EXPECT_TRUE(isCreatorBanned(Ban::LeaderboardAndCreator));

    EXPECT_EQ(withLeaderboardBan(Ban::None, true), Ban::Leaderboard);
    EXPECT_EQ(withLeaderboardBan(Ban::Creator, true), Ban::LeaderboardAndCreator);
    EXPECT_EQ(withLeaderboardBan(Ban::LeaderboardAndCreator, false), Ban::Creator);
    EXPECT_EQ(withCreatorBan(Ban::Leaderboard, true), Ban::LeaderboardAndCreator);
    EXPECT_EQ(withCreatorBan(Ban::LeaderboardAndCreator, false), Ban::Leaderboard);
    EXPECT_EQ(withCreatorBan(Ban::Creator, false), Ban::None);
}
