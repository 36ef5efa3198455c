#include "nekrobox/sandbox/artifacts.hpp"

#include <algorithm>
#include <system_error>

#include "nekrobox/core/logger.hpp"

namespace nekrobox::sandbox {

namespace fs = std::filesystem;

auto is_artifact(const fs::path& path) -> bool {
    auto ext = path.extension().string();
    return std::ranges::find(kArtifactExtensions, ext) != kArtifactExtensions.end();
}

auto collect_artifacts(const fs::path& workdir) -> std::vector<std::string> {
    std::vector<std::string> artifacts;

    std::error_code ec;
    if (!fs::is_directory(workdir, ec)) {
        return artifacts;
    }

    fs::recursive_directory_iterator it(
        workdir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("Cannot scan workdir {}: {}", workdir.string(), ec.message());
        return artifacts;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN("Artifact scan stopped in {}: {}", workdir.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        if (entry.is_directory(ec) && entry.path().filename() == kPrivateDirName) {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec) || !is_artifact(entry.path())) {
            continue;
        }
        artifacts.push_back(entry.path().lexically_relative(workdir).generic_string());
    }

    std::ranges::sort(artifacts);
    return artifacts;
}

} // namespace nekrobox::sandbox
