#include <corral/binary-resolver.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace corral {

static const char* platformOs() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

static const char* platformArch() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#else
    return "x64";
#endif
}

std::string BinaryResolver::platformBinaryName() {
    std::string name = std::string("browser-worker-") + platformOs() + "-" + platformArch();
#ifdef _WIN32
    name += ".exe";
#endif
    return name;
}

LaunchKind BinaryResolver::launchKindFor(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs") {
        return LaunchKind::Script;
    }
    return LaunchKind::Executable;
}

BinaryResolver BinaryResolver::defaults(const std::filesystem::path& baseDir,
                                        const std::filesystem::path& containerPath,
                                        const std::filesystem::path& script,
                                        const std::filesystem::path& explicitBinary) {
    BinaryResolver resolver;
    if (!explicitBinary.empty()) {
        resolver.addCandidate("configured", explicitBinary);
    }
    const auto binaryName = platformBinaryName();
    resolver.addCandidate("bundled", baseDir / "binaries" / binaryName);
    resolver.addCandidate("packaged", baseDir / binaryName);
    if (!containerPath.empty()) {
        resolver.addCandidate("container", containerPath);
    }
    if (!script.empty()) {
        resolver.addCandidate("script", script);
    }
    return resolver;
}

void BinaryResolver::addCandidate(std::string label, std::filesystem::path path) {
    _candidates.push_back({std::move(label), std::move(path)});
}

std::optional<ResolvedBinary> BinaryResolver::resolve() const {
    for (const auto& candidate : _candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate.path, ec) || ec) {
            ytrace("BinaryResolver: {} candidate {} not found", candidate.label, candidate.path.string());
            continue;
        }
        ydebug("BinaryResolver: using {} candidate {}", candidate.label, candidate.path.string());
        return ResolvedBinary{candidate.path, launchKindFor(candidate.path), candidate.label};
    }
    return std::nullopt;
}

} // namespace corral
