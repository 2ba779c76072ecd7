#ifndef INCLUDE_CODEBOX_REGISTRY_H_
#define INCLUDE_CODEBOX_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>
#include <shared_mutex>
#include <unordered_map>

#include <codebox/config.h>
#include <codebox/language.h>
#include <codebox/runtime.h>

// Dispatch table from language to runtime. Holds no execution state;
// one instance may be shared by all callers.
class RuntimeRegistry {
  mutable std::shared_mutex mtx_;
  std::unordered_map<Language, std::shared_ptr<const LanguageRuntime>> runtimes_;
 public:
  // throws UnsupportedLanguageError
  std::shared_ptr<const LanguageRuntime> Resolve(Language) const;
  // accepts any spelling ParseLanguage accepts
  std::shared_ptr<const LanguageRuntime> Resolve(const std::string& language) const;

  // Installs or replaces a binding. Callers already holding the old runtime keep it.
  void Register(Language, std::shared_ptr<const LanguageRuntime>);
  bool Unregister(Language);
  bool IsSupported(Language) const;
  std::vector<Language> Languages() const;
};

// PYTHON -> PythonRuntime, JAVASCRIPT -> JavaScriptRuntime
std::unique_ptr<RuntimeRegistry> MakeDefaultRegistry(const RuntimeConfig& = {});

#endif  // INCLUDE_CODEBOX_REGISTRY_H_
