#pragma once

#include <string>
#include <vector>
#include <plughost/core/types.h>
#include <plughost/host/command_registry.h>
#include <plughost/host/value.h>

namespace plughost::host {

/**
 * Convert console tokens into the argument kinds declared by `signature`.
 *
 * Runs entirely on the host side; a mismatch never reaches the plugin.
 * @return BadArguments on arity or type mismatch
 */
Result<std::vector<Argument>> marshalArguments(const CommandSignature& signature,
                                               const std::vector<std::string>& tokens);

// Usage line derived from the signature, e.g. "<string> <int> [args...]"
std::string describeSignature(const CommandSignature& signature);

} // namespace plughost::host
