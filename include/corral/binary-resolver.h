#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace corral {

enum class LaunchKind {
    Executable,  // exec the path directly
    Script,      // run as "<interpreter> <path>"
};

struct ResolvedBinary {
    std::filesystem::path path;
    LaunchKind kind = LaunchKind::Executable;
    std::string label;
};

// Locates the browser worker. Candidates are probed in the order they were
// added; the first one that exists on disk wins. Resolution only checks for
// existence and never throws.
class BinaryResolver {
public:
    struct Candidate {
        std::string label;
        std::filesystem::path path;
    };

    BinaryResolver() = default;
    explicit BinaryResolver(std::vector<Candidate> candidates)
        : _candidates(std::move(candidates)) {}

    // Default deployment order:
    //   explicit override, bundled binaries/, packaged next to baseDir,
    //   container path, interpretable entry script
    static BinaryResolver defaults(const std::filesystem::path& baseDir,
                                   const std::filesystem::path& containerPath,
                                   const std::filesystem::path& script,
                                   const std::filesystem::path& explicitBinary = {});

    // "browser-worker-<os>-<arch>[.exe]" for the host platform
    static std::string platformBinaryName();

    static LaunchKind launchKindFor(const std::filesystem::path& path);

    void addCandidate(std::string label, std::filesystem::path path);

    std::optional<ResolvedBinary> resolve() const;

    const std::vector<Candidate>& candidates() const { return _candidates; }

private:
    std::vector<Candidate> _candidates;
};

} // namespace corral
