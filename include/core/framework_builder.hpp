/**
 * framework_builder.hpp
 * Cached framework builds for fatpack
 *
 * Build Flow:
 * 1. Look up <cache>/<variant>/<target>/<version> (skipped with force_rebuild)
 * 2. Assemble the .xcframework for the configured architectures
 * 3. Move it into the cache, replacing any previous entry
 * 4. Return the cached path
 *
 * Copyright (c) 2025 fatpack Project
 */

#ifndef FATPACK_FRAMEWORK_BUILDER_HPP
#define FATPACK_FRAMEWORK_BUILDER_HPP

#include "core/framework_assembler.hpp"
#include "state/artifact_cache.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fatpack {

namespace fs = std::filesystem;

struct FrameworkBuildResult {
    fs::path framework_path;                    // Cached .xcframework
    bool from_cache = false;                    // No build was needed
    std::vector<ThinBinaryLocation> slices;     // Slices built this run
    BuildStatus status;
    std::chrono::milliseconds total_time{0};

    bool ok() const { return status.ok(); }
};

class FrameworkBuilder {
public:
    /**
     * Create a builder. An empty cache_root in the config selects
     * ArtifactCache::default_cache_root().
     */
    explicit FrameworkBuilder(BuildConfig config);

    FrameworkBuilder(const FrameworkBuilder&) = delete;
    FrameworkBuilder& operator=(const FrameworkBuilder&) = delete;

    /**
     * Build a fat framework for a target, or return the cached one.
     *
     * @param target_name Scheme / pod name
     * @param version Version string used as the cache key
     */
    FrameworkBuildResult build_framework(const std::string& target_name,
                                         const std::string& version);

    void set_progress_callback(ProgressCallback cb);

    const BuildConfig& config() const { return config_; }
    ArtifactCache& cache() { return cache_; }
    FrameworkAssembler& assembler() { return assembler_; }

private:
    void report_progress(BuildPhase phase, const std::string& target,
                         const std::string& message);

    BuildConfig config_;
    ArtifactCache cache_;
    FrameworkAssembler assembler_;
    ProgressCallback progress_cb_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/**
 * Build one framework with the given configuration.
 */
FrameworkBuildResult build_framework(const BuildConfig& config,
                                     const std::string& target_name,
                                     const std::string& version);

} // namespace fatpack

#endif // FATPACK_FRAMEWORK_BUILDER_HPP
