/**
 * framework_builder.cpp
 * Implementation of cached framework builds
 *
 * Copyright (c) 2025 fatpack Project
 */

#include "core/framework_builder.hpp"

namespace fatpack {

namespace {

fs::path resolve_cache_root(const BuildConfig& config) {
    return config.cache_root.empty() ? ArtifactCache::default_cache_root() : config.cache_root;
}

} // namespace

FrameworkBuilder::FrameworkBuilder(BuildConfig config)
    : config_(std::move(config))
    , cache_(resolve_cache_root(config_))
    , assembler_(config_)
{
}

void FrameworkBuilder::set_progress_callback(ProgressCallback cb) {
    progress_cb_ = cb;
    assembler_.set_progress_callback(std::move(cb));
}

FrameworkBuildResult FrameworkBuilder::build_framework(const std::string& target_name,
                                                       const std::string& version) {
    auto start_time = std::chrono::steady_clock::now();
    FrameworkBuildResult result;

    auto finish = [&]() -> FrameworkBuildResult& {
        result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    };

    report_progress(BuildPhase::CHECKING_CACHE, target_name, "Building " + target_name);

    if (!config_.force_rebuild) {
        if (auto cached = cache_.lookup(target_name, version, config_.mode)) {
            result.framework_path = *cached;
            result.from_cache = true;
            report_progress(BuildPhase::COMPLETE, target_name,
                            "Using cached " + target_name + " " + version +
                            " at " + cached->string());
            return finish();
        }
    }

    AssembleResult assembled = assembler_.assemble(target_name, config_.architectures);
    result.slices = assembled.slices;
    if (!assembled.ok()) {
        result.status = assembled.status;
        return finish();
    }

    report_progress(BuildPhase::CACHING, target_name,
                    "Caching " + target_name + " " + version + " in " + cache_.root().string());
    CacheResult cached = cache_.store(target_name, version, assembled.framework_path, config_.mode);
    if (!cached.ok()) {
        result.status = cached.status;
        return finish();
    }

    result.framework_path = cached.path;
    report_progress(BuildPhase::COMPLETE, target_name,
                    "Built " + target_name + " " + version + " at " + cached.path.string());
    return finish();
}

void FrameworkBuilder::report_progress(BuildPhase phase,
                                       const std::string& target,
                                       const std::string& message) {
    if (progress_cb_) {
        BuildProgress progress;
        progress.phase = phase;
        progress.current_target = target;
        progress.message = message;
        progress_cb_(progress);
    }
}

// =============================================================================
// Convenience Functions
// =============================================================================

FrameworkBuildResult build_framework(const BuildConfig& config,
                                     const std::string& target_name,
                                     const std::string& version) {
    FrameworkBuilder builder(config);
    return builder.build_framework(target_name, version);
}

} // namespace fatpack
