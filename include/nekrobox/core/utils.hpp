#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nekrobox::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;

/// Returns the last line of `text` that is not blank, trimmed.
auto last_nonempty_line(std::string_view text) -> std::string;

/// Truncates `s` to at most `max_bytes`, appending a marker when cut.
auto truncate(std::string_view s, std::size_t max_bytes) -> std::string;

} // namespace nekrobox::utils
