#include <codebox/registry.h>

#include <mutex>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include <codebox/js_runtime.h>
#include <codebox/python_runtime.h>

std::shared_ptr<const LanguageRuntime> RuntimeRegistry::Resolve(Language lang) const {
  std::shared_lock<std::shared_mutex> lck(mtx_);
  auto it = runtimes_.find(lang);
  if (it == runtimes_.end()) throw UnsupportedLanguageError(LanguageName(lang));
  return it->second;
}

std::shared_ptr<const LanguageRuntime> RuntimeRegistry::Resolve(const std::string& language) const {
  auto lang = ParseLanguage(language);
  if (!lang) throw UnsupportedLanguageError(language);
  return Resolve(*lang);
}

void RuntimeRegistry::Register(Language lang, std::shared_ptr<const LanguageRuntime> runtime) {
  if (!runtime) {
    Unregister(lang);
    return;
  }
  std::unique_lock<std::shared_mutex> lck(mtx_);
  runtimes_[lang] = std::move(runtime);
  spdlog::info("Registered runtime for {}", LanguageName(lang));
}

bool RuntimeRegistry::Unregister(Language lang) {
  std::unique_lock<std::shared_mutex> lck(mtx_);
  bool ret = runtimes_.erase(lang);
  if (ret) spdlog::info("Unregistered runtime for {}", LanguageName(lang));
  return ret;
}

bool RuntimeRegistry::IsSupported(Language lang) const {
  std::shared_lock<std::shared_mutex> lck(mtx_);
  return runtimes_.count(lang);
}

std::vector<Language> RuntimeRegistry::Languages() const {
  std::vector<Language> ret;
  {
    std::shared_lock<std::shared_mutex> lck(mtx_);
    for (auto& i : runtimes_) ret.push_back(i.first);
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

std::unique_ptr<RuntimeRegistry> MakeDefaultRegistry(const RuntimeConfig& config) {
  auto ret = std::make_unique<RuntimeRegistry>();
  ret->Register(Language::PYTHON, std::make_shared<PythonRuntime>(config));
  ret->Register(Language::JAVASCRIPT, std::make_shared<JavaScriptRuntime>(config));
  return ret;
}
