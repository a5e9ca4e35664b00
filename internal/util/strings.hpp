#pragma once

#include <string>
#include <string_view>

namespace heartbeat::util {

// Strips ASCII whitespace from both ends.
std::string Trim(std::string_view value);

bool IsBlank(std::string_view value);

std::string ToLower(std::string_view value);

// True for an http:// or https:// URL with a non-empty remainder.
bool IsHttpUrl(std::string_view value);

} // namespace heartbeat::util
