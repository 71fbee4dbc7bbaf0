#include "account_risk.hpp"
#include "core/logger.hpp"

namespace {
constexpr uint64_t MS_PER_DAY = 24ULL * 60 * 60 * 1000;
constexpr uint64_t MS_PER_MINUTE = 60ULL * 1000;
} // namespace

std::optional<AccountRiskAssessment>
NewAccountRiskAssessor::assess(const MessageEvent &event,
                               const Config::RulesConfig &rules) const {
  std::optional<uint64_t> account_age = event.account_age_ms();
  std::optional<uint64_t> membership_age = event.membership_age_ms();

  std::string reason;
  if (account_age && *account_age < rules.new_account_age_days * MS_PER_DAY)
    reason = "account age " + std::to_string(*account_age / MS_PER_DAY) +
             " days";
  else if (membership_age &&
           *membership_age < rules.new_member_minutes * MS_PER_MINUTE)
    reason = "member for " + std::to_string(*membership_age / MS_PER_MINUTE) +
             " minutes";

  if (reason.empty())
    return std::nullopt;

  LOG(LogLevel::TRACE, LogComponent::RULES_ACCOUNT,
      "New account risk for user " << event.author_id << " in guild "
                                   << event.guild_id << ": " << reason);
  return AccountRiskAssessment{rules.new_account_multiplier, reason};
}
