#include "User.hpp"
#include <spdlog/spdlog.h>
#include <utility>

User::User(std::uint64_t id, Name name, Email email, SocialMediaHandles handles, Clock::time_point createdAt)
    : userId(id), userName(std::move(name)), userEmail(std::move(email)),
      handles(std::move(handles)), created(createdAt)
{
    spdlog::debug("Created User: ID={}, Name={}", userId, userName.asStr());
}
