#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <plughost/core/types.h>

namespace plughost::host {

/**
 * Split a console line on whitespace.
 *
 * Single quotes group literally, double quotes group and honour backslash escapes, and a
 * backslash outside quotes escapes the next character. An empty quoted pair yields an
 * empty token.
 * @return BadArguments for an unterminated quote or a trailing backslash
 */
Result<std::vector<std::string>> tokenize(std::string_view line);

} // namespace plughost::host
