#ifndef CONFIG_H_
#define CONFIG_H_

#include <istream>
#include <filesystem>

#include <codebox/config.h>

namespace fs = std::filesystem;

extern const char kDefaultConfigPath[];

// INI format; keys of the unnamed section override the fields of
// RuntimeConfig with the same name, [policy] blocked is a ';'-separated
// list of patterns ("none" for no pattern). Unset keys keep their value.
bool ParseConfig(std::istream&, RuntimeConfig&);
bool ParseConfigFile(const fs::path&, RuntimeConfig&);

#endif  // CONFIG_H_
