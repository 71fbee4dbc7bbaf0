#ifndef BASE_MODERATION_CLIENT_HPP
#define BASE_MODERATION_CLIENT_HPP

#include "enforcement/api_result.hpp"

#include <cstdint>
#include <string>

// One attempt per call; retries and circuit breaking are the caller's job
class IModerationClient {
public:
  virtual ~IModerationClient() = default;

  virtual ApiResult mute(uint64_t guild_id, uint64_t user_id,
                         uint64_t duration_seconds,
                         const std::string &reason) = 0;
  virtual ApiResult delete_message(uint64_t guild_id, uint64_t channel_id,
                                   uint64_t message_id,
                                   const std::string &reason) = 0;
  virtual ApiResult warn(uint64_t guild_id, uint64_t channel_id,
                         uint64_t user_id, const std::string &reason) = 0;

  virtual const char *get_name() const = 0;
};

#endif // BASE_MODERATION_CLIENT_HPP
