#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

#include "../src/auth/User.hpp"

TEST(UserTest, HoldsParsedFields)
{
    const auto createdAt = User::Clock::now();
    User user(42,
        Name::parse("babygronk???"),
        Email::parse("baby@gronk.com"),
        SocialMediaHandles("yt", "", "tt"),
        createdAt);

    EXPECT_EQ(user.id(), 42u);
    EXPECT_EQ(user.name().asStr(), "babygronk");
    EXPECT_EQ(user.email().asStr(), "baby@gronk.com");
    EXPECT_EQ(user.socialMediaHandles().youtube(), std::optional<std::string>("yt"));
    EXPECT_FALSE(user.socialMediaHandles().twitter().has_value());
    EXPECT_EQ(user.createdAt(), createdAt);
}

TEST(UserTest, CopiesAreIndependent)
{
    SocialMediaHandles handles("a", "b", "c");
    User user(7, Name::parse("RobTop"), Email::parse("rob@top.com"), handles, User::Clock::now());

    handles.setYoutube("changed");
    EXPECT_EQ(user.socialMediaHandles().youtube(), std::optional<std::string>("a"));

    User copy = user;
    EXPECT_EQ(copy.id(), user.id());
    EXPECT_EQ(copy.name(), user.name());
}
