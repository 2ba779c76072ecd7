#include <unistd.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codebox/errors.h>
#include <codebox/registry.h>
#include "config.h"

namespace {

constexpr int kExitCodeFailure = 1;
constexpr int kExitPlatformError = 2;
constexpr int kExitBadUsage = 3;

struct Options {
  RuntimeConfig config;
  std::string language;
  long timeout_ms = 0;
  nlohmann::json ext;
  bool validate_only = false;
  std::string file;
};

bool ReadCode(const std::string& file, std::string& code) {
  std::ostringstream ss;
  if (file == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream fin(file);
    if (!fin) return false;
    ss << fin.rdbuf();
  }
  code = ss.str();
  return true;
}

// exits with kExitBadUsage on errors
Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("file")
    .help("Code file, or - for standard input");
  parser.add_argument("-c", "--config")
    .default_value(std::string(""))
    .help("Path of configuration file (default: " + std::string(kDefaultConfigPath) + " if present)");
  parser.add_argument("-l", "--language")
    .required()
    .help("Language of the code (Python, JS, ...)");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall clock limit in milliseconds");
  parser.add_argument("-e", "--ext")
    .default_value(std::string("{}"))
    .help("Extension parameters as a JSON object (entry_point, args, ...)");
  parser.add_argument("--validate-only")
    .default_value(false)
    .implicit_value(true)
    .help("Only check whether the code can run");
  parser.add_argument("--box-root")
    .help("Directory for per-execution boxes");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitBadUsage);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  Options ret;
  fs::path config_file = parser.get<std::string>("--config");
  if (config_file.empty() && access(kDefaultConfigPath, R_OK) == 0) config_file = kDefaultConfigPath;
  if (!config_file.empty() && !ParseConfigFile(config_file, ret.config)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(kExitBadUsage);
  }
  if (auto val = parser.present<std::string>("--box-root")) {
    ret.config.box_root = val.value();
  }
  if (auto val = parser.present<long>("--timeout")) {
    ret.timeout_ms = val.value();
  }
  ret.ext = nlohmann::json::parse(parser.get<std::string>("--ext"), nullptr, false);
  if (!ret.ext.is_object()) {
    spdlog::error("--ext must be a JSON object");
    exit(kExitBadUsage);
  }
  ret.language = parser.get<std::string>("--language");
  ret.validate_only = parser["--validate-only"] == true;
  ret.file = parser.get<std::string>("file");
  return ret;
}

void PrintJson(const nlohmann::json& doc) {
  // captured output is not necessarily valid UTF-8
  std::cout << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  Options opt = ParseArgs(argc, argv);
  std::string code;
  if (!ReadCode(opt.file, code)) {
    spdlog::error("Cannot read {}", opt.file);
    return kExitBadUsage;
  }
  try {
    auto registry = MakeDefaultRegistry(opt.config);
    auto runtime = registry->Resolve(opt.language);
    Language lang = *ParseLanguage(opt.language);
    if (opt.validate_only) {
      bool valid = runtime->Validate(code, lang);
      PrintJson({{"language", LanguageName(lang)}, {"valid", valid}});
      return valid ? 0 : kExitCodeFailure;
    }
    ExecutionResult result = runtime->Execute(code, lang, opt.timeout_ms, opt.ext);
    nlohmann::json doc = result.ToJson();
    const auto& stats = result.GetStats();
    doc["stats"] = {
      {"exit_code", stats.exit_code},
      {"signal", stats.term_signal},
      {"elapsed_us", stats.elapsed_us},
      {"output_truncated", stats.output_truncated},
    };
    PrintJson(doc);
    return result.IsSuccess() ? 0 : kExitCodeFailure;
  } catch (const UnsupportedLanguageError& e) {
    spdlog::error("{}", e.what());
    return kExitPlatformError;
  } catch (const SandboxError& e) {
    spdlog::error("Sandbox failure: {}", e.what());
    return kExitPlatformError;
  } catch (const std::invalid_argument& e) {
    spdlog::error("Bad configuration: {}", e.what());
    return kExitBadUsage;
  }
}
