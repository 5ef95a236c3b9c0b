#pragma once
#include <string>

namespace pipeguard {

class Runtime;

// Operator command handlers used by the REPL (main.cpp). Each returns a
// string result (pretty JSON or a short message) for the caller to print.

std::string cmd_status(Runtime& runtime);
std::string cmd_cache(Runtime& runtime);
std::string cmd_breakers(Runtime& runtime);
std::string cmd_limits(Runtime& runtime);
std::string cmd_task(Runtime& runtime, const std::string& task_id);

// These mutate state.
std::string cmd_cache_clear(Runtime& runtime);
std::string cmd_breaker_reset(Runtime& runtime, const std::string& name);
std::string cmd_reset_client(Runtime& runtime, const std::string& client_id);
std::string cmd_sweep(Runtime& runtime);

// Dispatch a "/command args" line. Returns "Unknown command: ..." when unmatched.
std::string handle_command(Runtime& runtime, const std::string& line);

} // namespace pipeguard
