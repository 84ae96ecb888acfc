#pragma once

#include <chrono>
#include <cstddef>

// Engine limits, no runtime input can widen them
namespace chk::limits {

constexpr auto default_execution_timeout = std::chrono::milliseconds{5000};
constexpr auto max_execution_timeout = std::chrono::milliseconds{10000};

constexpr size_t max_submission_size_in_bytes = 32 << 10;

// Syntax
constexpr size_t max_bracket_nesting = 200;
constexpr size_t max_indentation_levels = 100;
constexpr size_t max_syntax_nesting = 200;
// Links of a flat chain like `a + b + c`, `f()()` or `elif` branches, each deepens the tree
constexpr size_t max_syntax_chain_links = 1000;

// Runtime
constexpr size_t max_call_depth = 1000;
// Recursion is stopped earlier if less than this much of the thread's stack is left
constexpr size_t min_free_stack_in_bytes = 256 << 10;
constexpr size_t heap_limit_in_bytes = 64 << 20;
constexpr size_t max_string_length = 16 << 20;
constexpr size_t max_print_output_in_bytes = 64 << 10;

} // namespace chk::limits
