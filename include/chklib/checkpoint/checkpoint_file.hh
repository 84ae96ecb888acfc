#pragma once

#include <chklib/checkpoint/checkpoint_config.hh>
#include <stdexcept>
#include <string>

namespace chk {

class CheckpointFileError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/**
 * @brief Parses a checkpoint definition written in ConfigFile syntax
 * @details Recognized variables (others are ignored):
 *   - `type`: "static" (the default) or "execution", stored verbatim
 *   - `checks`: array of `<kind> <required|optional> <pattern> <message>`
 *     where kind is `regex` (or `pattern`) or `ast_contains` (or `structure`)
 *     and pattern and message are string literals, e.g.
 *     `'regex required r"raise\s+ValueError" "Must raise ValueError"'`
 *   - `function_name`: the entry point
 *   - `timeout`: in seconds, e.g. `2` or `0.5`
 *   - `tests`: array of `<input> -> <expected>[, <description>]` where input
 *     is a dict literal with str keys, expected a literal and description a
 *     string literal, e.g. `'{"x": 2} -> 4, "doubles 2"'`. A tuple expected
 *     value has to be parenthesized.
 *
 * @errors Throws ConfigFile::ParseError on a syntax error of the file and
 *   CheckpointFileError on an invalid value; both messages name the line
 */
CheckpointConfig parse_checkpoint_config(std::string contents);

// Like parse_checkpoint_config() on the contents of the file @p path
CheckpointConfig load_checkpoint_config(const std::string& path);

} // namespace chk
