#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nekrobox::sandbox {

/// File extensions reported as task artifacts.
inline constexpr std::array<std::string_view, 5> kArtifactExtensions = {
    ".png", ".jpg", ".csv", ".json", ".txt",
};

/// Directory inside a workdir reserved for runtime bookkeeping.
inline constexpr std::string_view kPrivateDirName = ".nekrobox";

[[nodiscard]] auto is_artifact(const std::filesystem::path& path) -> bool;

/// Lists regular files under `workdir` with an allow-listed extension,
/// relative to `workdir` and sorted. The runtime's private directory is
/// skipped, as are entries that cannot be read.
[[nodiscard]] auto collect_artifacts(const std::filesystem::path& workdir)
    -> std::vector<std::string>;

} // namespace nekrobox::sandbox
