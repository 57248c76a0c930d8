#pragma once
#include <chrono>
#include <cstdint>
#include "Credentials.hpp"
#include "../core/Profile.hpp"

// Account identity. Fields are fixed at construction.
class User {
public:
    using Clock = std::chrono::steady_clock;

    User(std::uint64_t id, Name name, Email email, SocialMediaHandles handles, Clock::time_point createdAt);

    std::uint64_t id() const { return userId; }
    const Name& name() const { return userName; }
    const Email& email() const { return userEmail; }
    const SocialMediaHandles& socialMediaHandles() const { return handles; }
    Clock::time_point createdAt() const { return created; }

private:
    std::uint64_t userId;
    Name userName;
    Email userEmail;
    SocialMediaHandles handles;
    Clock::time_point created; // captured by the caller
};
