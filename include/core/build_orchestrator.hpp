/**
 * build_orchestrator.hpp
 * Per-slice Build Orchestrator for fatpack
 *
 * Drives xcodebuild once per architecture group:
 * - Groups requested architectures so legacy 32/64-bit pairs share one pass
 * - Builds the fixed xcodebuild argument list for a group
 * - Runs the toolchain with output capture and writes the build log
 * - Computes where the toolchain placed the thin .framework
 *
 * Build Flow (one group):
 * 1. Derive platform, SDK and output folder from the group's first architecture
 * 2. Assemble arguments (release, no debug symbols, library evolution, ...)
 * 3. Run xcodebuild, capturing combined output
 * 4. Write <target>-<arch>-<sdk>.txt to the log directory
 * 5. Return Release-<folder>/<target>/<name>.framework under the build dir
 *
 * Copyright (c) 2025 fatpack Project
 */

#ifndef FATPACK_BUILD_ORCHESTRATOR_HPP
#define FATPACK_BUILD_ORCHESTRATOR_HPP

#include "core/architecture.hpp"
#include "core/build_types.hpp"
#include "core/process_executor.hpp"
#include <filesystem>
#include <vector>
#include <string>
#include <set>
#include <unordered_map>

namespace fatpack {

namespace fs = std::filesystem;

// =============================================================================
// Build Configuration
// =============================================================================
struct BuildConfig {
    // Directory containing the Xcode workspace and Pods folder
    fs::path project_root;

    // Root of the framework cache (empty = ArtifactCache::default_cache_root())
    fs::path cache_root;

    // Where build logs are written (empty = <tmp>/build_logs)
    fs::path logs_dir;

    // Scratch directory for the merged framework (empty = <tmp>/frameworks_being_built)
    fs::path output_dir;

    // Toolchain used for both slice builds and -create-xcframework
    std::string toolchain = "/usr/bin/xcodebuild";

    // Workspace inside project_root
    std::string workspace = "FrameworkMaker.xcworkspace";

    // Zip or Carthage distribution
    DistributionMode mode = DistributionMode::ZIP;

    // Architectures to build
    std::set<Architecture> architectures;

    // Build behavior
    bool force_rebuild = false;       // Ignore cached frameworks
    bool verbose = false;             // Echo toolchain output
    bool quiet = false;               // Minimal output
};

// =============================================================================
// Build Products
// =============================================================================

// Architectures compiled together in one toolchain invocation
using ArchitectureGroup = std::vector<Architecture>;

// Thin framework produced for one architecture group
struct ThinBinaryLocation {
    fs::path path;              // .../Release-<folder>/<target>/<name>.framework
    ArchitectureGroup group;    // Group that produced it
    fs::path log_file;          // Build log for the group
};

struct ThinBuildResult {
    ThinBinaryLocation location;
    BuildStatus status;

    bool ok() const { return status.ok(); }
};

// Extension of per-slice build products
constexpr const char* THIN_FRAMEWORK_EXTENSION = ".framework";

// Extension of the merged multi-architecture container
constexpr const char* XCFRAMEWORK_EXTENSION = ".xcframework";

// =============================================================================
// Grouping and Naming
// =============================================================================

/**
 * Split requested architectures into toolchain invocations.
 *
 * The fixed pairs (armv7, arm64) and (i386, x86_64) are tried in that
 * order; a pair whose members are both requested becomes one group.
 * Every remaining architecture becomes its own group, in canonical order.
 * The result covers the input exactly once and depends only on the set.
 */
std::vector<ArchitectureGroup> group_architectures(const std::set<Architecture>& requested);

// Space-separated architecture identifiers ("armv7 arm64")
std::string group_to_string(const ArchitectureGroup& group);

/**
 * Product name the toolchain uses for a target.
 * A few pods build a framework whose name differs from the scheme;
 * any other name maps to itself.
 */
std::string real_framework_name(const std::string& target_name);

// The exceptions consulted by real_framework_name
const std::unordered_map<std::string, std::string>& framework_name_overrides();

// =============================================================================
// Build Orchestrator
// =============================================================================
class BuildOrchestrator {
public:
    explicit BuildOrchestrator(BuildConfig config);

    // No copying
    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    /**
     * Build one thin framework for a group of architectures.
     *
     * On toolchain failure the captured output is written to the log file
     * and a TOOLCHAIN_FAILED status is returned. If that log cannot be
     * written the status is FILESYSTEM_ERROR instead. On success the log is
     * written best-effort.
     *
     * @param target_name Scheme to build
     * @param group Non-empty architecture group
     * @param build_dir BUILD_DIR passed to the toolchain
     * @param log_dir Existing directory for build logs
     */
    ThinBuildResult build_group(const std::string& target_name,
                                const ArchitectureGroup& group,
                                const fs::path& build_dir,
                                const fs::path& log_dir);

    /**
     * Verify the configured toolchain can be run.
     * A path containing '/' must name an executable file; bare names are
     * left to the PATH search at spawn time.
     *
     * @return SPAWN_FAILED status if the toolchain is missing
     */
    BuildStatus check_toolchain() const;

    // Full toolchain argument list for a group (without the toolchain path)
    std::vector<std::string> build_arguments(const std::string& target_name,
                                             const ArchitectureGroup& group,
                                             const fs::path& build_dir) const;

    // <log_dir>/<target>-<arch>-<sdk>.txt for the group's first architecture
    static fs::path log_file_path(const fs::path& log_dir,
                                  const std::string& target_name,
                                  const ArchitectureGroup& group);

    // Where the toolchain places the thin framework for a group
    static fs::path thin_framework_path(const fs::path& build_dir,
                                        const std::string& target_name,
                                        const ArchitectureGroup& group);

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    const BuildConfig& config() const { return config_; }

    ProcessExecutor& executor() { return executor_; }

private:
    // Write captured output to a log file. Returns false on any I/O error.
    static bool write_log(const fs::path& log_file, const std::string& output);

    void report_progress(BuildPhase phase, const std::string& target,
                         const std::string& message);

    BuildConfig config_;
    ProcessExecutor executor_;
    ProgressCallback progress_cb_;
};

} // namespace fatpack

#endif // FATPACK_BUILD_ORCHESTRATOR_HPP
