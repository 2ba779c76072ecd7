#ifndef CODEBOX_POLICY_H_
#define CODEBOX_POLICY_H_

#include <regex>
#include <string>
#include <vector>
#include <optional>

#include <codebox/language.h>

// Checks shared by every runtime, applied both by Validate and by Execute
// so that a rejected snippet never runs.
class CodePolicy {
  std::vector<std::regex> blocked_;
 public:
  // throws std::invalid_argument on a malformed pattern
  explicit CodePolicy(const std::vector<std::string>& blocked_patterns);

  // nullopt if acceptable; otherwise the reason of rejection
  std::optional<std::string> Check(const std::string& code) const;
};

// Static check that code defines a function called name, the way an
// evaluator has to; nullopt if it does, otherwise the reason.
std::optional<std::string> CheckEntryPoint(const std::string& code, Language lang,
                                           const std::string& name);

#endif  // CODEBOX_POLICY_H_
