#ifndef ACCOUNT_RISK_HPP
#define ACCOUNT_RISK_HPP

#include "core/config.hpp"
#include "core/message_event.hpp"

#include <optional>
#include <string>

struct AccountRiskAssessment {
  double multiplier = 1.0;
  std::string reason;
};

// Never fires on its own. Returns a weight multiplier for the other rules
// when the author's account or guild membership is young; nullopt when
// the author is established or the ages are unknown.
class NewAccountRiskAssessor {
public:
  std::optional<AccountRiskAssessment>
  assess(const MessageEvent &event, const Config::RulesConfig &rules) const;
};

#endif // ACCOUNT_RISK_HPP
