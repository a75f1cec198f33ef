#pragma once

#include <optional>
#include <string>

namespace krbmic {

// Very small JSON helpers for the flat one-line objects krbmicd speaks.
// Only string values are extracted; numbers travel as strings.

std::optional<std::string> extract_json_string(const std::string &json, const std::string &key);

std::string json_escape(const std::string &s);

} // namespace krbmic
