#pragma once

#include <string>
#include <string_view>

namespace issues
{

/// Fallback identifier for titles with no ASCII letters or digits
inline constexpr std::string_view kUntitled = "UNTITLED";

/// Turn an arbitrary title into an uppercase identifier made of ASCII letters,
/// digits and single underscores, e.g. "Memory leak (heap)" -> "MEMORY_LEAK_HEAP".
/// Never returns an empty string.
[[nodiscard]] std::string sanitize_title(std::string_view title);

} // namespace issues
