#ifndef INCLUDE_CODEBOX_LANGUAGE_H_
#define INCLUDE_CODEBOX_LANGUAGE_H_

#include <string>
#include <optional>

// name, canonical name (the casing stored by the evaluator records)
#define ENUM_LANGUAGE_ \
  X(PYTHON, "Python") \
  X(JAVASCRIPT, "JS") \
  X(TYPESCRIPT, "TypeScript")
enum class Language {
#define X(name, canonical) name,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language);
// Normalizes at the boundary: case-insensitive, accepts common aliases
// ("python3", "py", "javascript", "node", "ts"). nullopt if unknown.
std::optional<Language> ParseLanguage(const std::string&);

#endif  // INCLUDE_CODEBOX_LANGUAGE_H_
