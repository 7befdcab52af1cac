#ifndef FATPACK_ARTIFACT_CACHE_HPP
#define FATPACK_ARTIFACT_CACHE_HPP

// artifact_cache.hpp - On-disk cache of finished frameworks
// Part of fatpack - Framework Packaging Build Tool
//
// Layout: <root>/<variant>/<target>/<version>/<real name>.xcframework
//
// The variant directory is empty for zip distributions and "carthage" for
// Carthage distributions. Entries are replaced whole on rebuild and never
// modified in place. No locking: concurrent builds of the same target and
// version must be serialized by the caller.

#include "core/build_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fatpack {

namespace fs = std::filesystem;

struct CacheResult {
    fs::path path;          // Location of the cached framework
    BuildStatus status;

    bool ok() const { return status.ok(); }
};

class ArtifactCache {
public:
    // Directory under the user cache home
    static constexpr const char* CACHE_DIR_NAME = "fatpack";
    static constexpr const char* FRAMEWORKS_DIR_NAME = "frameworks";

    explicit ArtifactCache(const fs::path& cache_root);

    const fs::path& root() const { return root_; }

    // <root>/<variant>/<target>/<version>
    fs::path artifact_root(const std::string& target_name,
                           const std::string& version,
                           DistributionMode mode) const;

    // <artifact_root>/<real name>.xcframework
    fs::path artifact_path(const std::string& target_name,
                           const std::string& version,
                           DistributionMode mode) const;

    // Cached framework for this target and version, if one exists
    std::optional<fs::path> lookup(const std::string& target_name,
                                   const std::string& version,
                                   DistributionMode mode) const;

    /**
     * Move a freshly built framework into the cache.
     *
     * Any previous entry is removed first, the directory tree is created,
     * then built_path is moved (not copied) to artifact_path(). Moves across
     * filesystems fall back to copy + delete of the source.
     *
     * @return CacheResult with the cached path, or FILESYSTEM_ERROR
     */
    CacheResult store(const std::string& target_name,
                      const std::string& version,
                      const fs::path& built_path,
                      DistributionMode mode);

    // Drop the cached framework for a target and version
    BuildStatus remove(const std::string& target_name,
                       const std::string& version,
                       DistributionMode mode);

    /**
     * Default cache root:
     * $XDG_CACHE_HOME/fatpack/frameworks, else $HOME/.cache/fatpack/frameworks,
     * else <tmp>/fatpack/frameworks.
     */
    static fs::path default_cache_root();

private:
    // rename(), or copy + remove_all when crossing filesystems
    static void move_path(const fs::path& from, const fs::path& to, std::error_code& ec);

    fs::path root_;
};

} // namespace fatpack

#endif // FATPACK_ARTIFACT_CACHE_HPP
