#pragma once

#include <string>
#include <core/types.hpp>

// Debug log file: $REMOTEFS_LOG if set, else <tmp>/remotefs_debug.log
std::string remotefs_log_path();

// Append a timestamped line to the debug log. Safe to call from any thread.
void remotefs_log(const std::string& msg);

// Log one remote command and what came back from it.
void remotefs_log_cmd(const std::string& label, const std::string& cmd,
                      const SSHResult& r);
