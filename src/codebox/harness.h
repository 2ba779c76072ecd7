#ifndef CODEBOX_HARNESS_H_
#define CODEBOX_HARNESS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <codebox/config.h>
#include <codebox/execution_result.h>
#include "sandbox.h"

namespace fs = std::filesystem;

// The harness scripts write their outcome to BoxResult(box):
//   {"ok": true, "value": "<serialized return value>"}
//   {"ok": false, "kind": "exception" | "entry_point" | "serialization", "message": "..."}

// Jail, limits and environment common to all runtimes; command and
// language-specific limits are filled in by the caller. The system
// directories and the installation prefix of interpreter are bind-mounted.
SandboxOptions HarnessOptions(const RuntimeConfig&, const fs::path& box, int uid,
                              long wall_time_us, const fs::path& interpreter);

// Wall time in microseconds for a requested timeout; non-positive selects the default.
long EffectiveWallTime(const RuntimeConfig&, long timeout_ms);

// Resolves an interpreter; throws SandboxError if missing.
fs::path RequireExecutable(const std::string& name);

// Combines the sandbox outcome with the result file of the harness.
ExecutionResult CollectResult(SandboxResult&&, const fs::path& result_file, size_t limit);

#endif  // CODEBOX_HARNESS_H_
