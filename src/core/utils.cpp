#include "nekrobox/core/utils.hpp"

#include <random>

namespace nekrobox::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto last_nonempty_line(std::string_view text) -> std::string {
    auto lines = split(text, '\n');
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto line = trim(*it);
        if (!line.empty()) return line;
    }
    return {};
}

auto truncate(std::string_view s, std::size_t max_bytes) -> std::string {
    if (s.size() <= max_bytes) return std::string(s);
    std::string result(s.substr(0, max_bytes));
    result += "\n...[truncated]";
    return result;
}

} // namespace nekrobox::utils
