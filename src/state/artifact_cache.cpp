// artifact_cache.cpp - On-disk cache of finished frameworks
// Part of fatpack - Framework Packaging Build Tool

#include "state/artifact_cache.hpp"
#include "core/build_orchestrator.hpp"

#include <cstdlib>
#include <system_error>

namespace fatpack {

ArtifactCache::ArtifactCache(const fs::path& cache_root)
    : root_(cache_root) {
}

fs::path ArtifactCache::artifact_root(const std::string& target_name,
                                      const std::string& version,
                                      DistributionMode mode) const {
    fs::path dir = root_;
    std::string variant = cache_variant_name(mode);
    if (!variant.empty()) {
        dir /= variant;
    }
    return dir / target_name / version;
}

fs::path ArtifactCache::artifact_path(const std::string& target_name,
                                      const std::string& version,
                                      DistributionMode mode) const {
    return artifact_root(target_name, version, mode) /
           (real_framework_name(target_name) + XCFRAMEWORK_EXTENSION);
}

std::optional<fs::path> ArtifactCache::lookup(const std::string& target_name,
                                              const std::string& version,
                                              DistributionMode mode) const {
    fs::path path = artifact_path(target_name, version, mode);
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return path;
    }
    return std::nullopt;
}

CacheResult ArtifactCache::store(const std::string& target_name,
                                 const std::string& version,
                                 const fs::path& built_path,
                                 DistributionMode mode) {
    CacheResult result;
    fs::path root = artifact_root(target_name, version, mode);
    fs::path destination = artifact_path(target_name, version, mode);
    std::error_code ec;

    if (!fs::exists(built_path, ec)) {
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Built framework does not exist: " + built_path.string());
        return result;
    }

    // The move below requires the destination to be absent
    if (fs::exists(fs::symlink_status(destination, ec))) {
        fs::remove_all(destination, ec);
        if (ec) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Could not remove previously cached framework " +
                destination.string() + ": " + ec.message());
            return result;
        }
    }

    fs::create_directories(root, ec);
    if (ec) {
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not create cache directory " + root.string() + ": " + ec.message());
        return result;
    }

    move_path(built_path, destination, ec);
    if (ec) {
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not move built framework into the cached frameworks directory " +
            destination.string() + ": " + ec.message());
        return result;
    }

    result.path = destination;
    return result;
}

BuildStatus ArtifactCache::remove(const std::string& target_name,
                                  const std::string& version,
                                  DistributionMode mode) {
    fs::path destination = artifact_path(target_name, version, mode);
    std::error_code ec;
    fs::remove_all(destination, ec);
    if (ec) {
        return BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not remove cached framework " + destination.string() + ": " + ec.message());
    }
    return BuildStatus{};
}

fs::path ArtifactCache::default_cache_root() {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".cache";
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
    }
    return base / CACHE_DIR_NAME / FRAMEWORKS_DIR_NAME;
}

void ArtifactCache::move_path(const fs::path& from, const fs::path& to, std::error_code& ec) {
    fs::rename(from, to, ec);
    if (ec != std::errc::cross_device_link) {
        return;
    }

    ec.clear();
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(to, cleanup);
        return;
    }
    fs::remove_all(from, ec);
}

} // namespace fatpack
