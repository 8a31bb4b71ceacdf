#pragma once

#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// Run exactly one command line on `channel`, feeding `input` to its stdin.
//
// Returns the captured stdout on exit status 0. On a non-zero exit the
// error is ErrorKind::Command and carries the exact command text, the
// exit cause, and the raw stderr bytes, so callers can match on the
// remote error output. Transport failures come back unchanged.
Result<std::string> run_command(ExecChannel& channel, const std::string& command,
                                const std::string& input = "");

// True if a failed command reported that its target does not exist.
bool is_not_found(const Error& error);
