#pragma once

// Helpers shared by the implementation files; not part of the public API.

#include "agentcoord/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace agentcoord::detail {

// Random RFC 4122 version 4 identifier
std::string generate_uuid();

std::int64_t to_micros(Timestamp t);
Timestamp from_micros(std::int64_t us);
std::int64_t duration_micros(Duration d);

std::string join(const std::vector<std::string>& parts, char sep);
std::vector<std::string> split(const std::string& text, char sep);

// At most `max_bytes` bytes of `text`, cut on a UTF-8 code point boundary
std::string truncate(const std::string& text, std::size_t max_bytes);

std::string to_lower(std::string text);

} // namespace agentcoord::detail
