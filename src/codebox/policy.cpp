#include "policy.h"

#include <cctype>
#include <algorithm>
#include <stdexcept>

#include <codebox/config.h>

std::vector<std::string> DefaultBlockedPatterns() {
  return {
    R"(import\s+os)",
    R"(import\s+sys)",
    R"(import\s+subprocess)",
    R"(import\s+shutil)",
    R"(__import__)",
    R"(\beval\s*\()",
    R"(\bexec\s*\()",
    R"(\bcompile\s*\()",
    R"(\bopen\s*\()",
    R"(\bfile\s*\()",
    R"(\binput\s*\()",
    R"(\braw_input\s*\()",
  };
}

CodePolicy::CodePolicy(const std::vector<std::string>& blocked_patterns) {
  for (auto& i : blocked_patterns) {
    try {
      blocked_.emplace_back(i, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    } catch (const std::regex_error& e) {
      throw std::invalid_argument("invalid blocked pattern '" + i + "': " + e.what());
    }
  }
}

std::optional<std::string> CodePolicy::Check(const std::string& code) const {
  if (std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isspace(c); })) {
    return "empty code";
  }
  std::smatch match;
  for (auto& i : blocked_) {
    if (std::regex_search(code, match, i)) {
      return "Dangerous operation detected: " + match.str();
    }
  }
  return std::nullopt;
}

std::optional<std::string> CheckEntryPoint(const std::string& code, Language lang,
                                           const std::string& name) {
  static const std::regex kIdentifier(R"([A-Za-z_$][A-Za-z0-9_$]*)");
  if (!std::regex_match(name, kIdentifier)) return "'" + name + "' is not an identifier";
  std::string id;
  for (char c : name) {
    if (c == '$') id += '\\';
    id += c;
  }
  std::vector<std::string> patterns;
  switch (lang) {
    case Language::PYTHON:
      patterns = {R"((^|[\s;:])(async\s+)?def\s+)" + id + R"(\s*\()"};
      break;
    case Language::JAVASCRIPT:
    case Language::TYPESCRIPT:
      patterns = {
        R"(\bfunction\s*\*?\s*)" + id + R"(\s*\()",
        R"(\b(const|let|var)\s+)" + id + R"(\s*=)",
        R"((^|[^\w$.])\s*)" + id + R"(\s*=\s*(async\s+)?(function\b|\([^)]*\)\s*=>|[\w$]+\s*=>))",
      };
      break;
  }
  for (auto& i : patterns) {
    if (std::regex_search(code, std::regex(i))) return std::nullopt;
  }
  return name + " function is not defined";
}
