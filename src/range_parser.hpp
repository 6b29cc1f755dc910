#pragma once
/*
 * Range parsing for prompt callbacks.
 * parse_range accepts "2-5", "2:5" or "2 5" (half-open, start < end);
 * anything else throws InvalidUserInput.
 */
#include <string>
#include "types.hpp"

IndexRange parse_range(const std::string& text);
int parse_count(const std::string& text, const char* what);
