/**
 * framework_assembler.hpp
 * Multi-architecture Framework Assembler for fatpack
 *
 * Builds every architecture group of a target through the BuildOrchestrator
 * and merges the thin frameworks into one .xcframework with
 * `xcodebuild -create-xcframework`.
 *
 * Notes:
 * - Groups are built one at a time, in the order group_architectures returns
 * - The first failing group aborts the assembly; nothing is combined
 * - -create-xcframework accepts one framework per platform. Paired groups
 *   keep armv7/arm64 and i386/x86_64 in one fat slice; any rejection by the
 *   toolchain is returned as COMBINE_FAILED with its output.
 *
 * Copyright (c) 2025 fatpack Project
 */

#ifndef FATPACK_FRAMEWORK_ASSEMBLER_HPP
#define FATPACK_FRAMEWORK_ASSEMBLER_HPP

#include "core/build_orchestrator.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fatpack {

namespace fs = std::filesystem;

struct AssembleResult {
    fs::path framework_path;                    // <output_dir>/<target>.xcframework
    std::vector<ThinBinaryLocation> slices;     // One per architecture group
    BuildStatus status;

    bool ok() const { return status.ok(); }
};

class FrameworkAssembler {
public:
    // Scratch directory names under the system temp directory
    static constexpr const char* DEFAULT_OUTPUT_DIR_NAME = "frameworks_being_built";
    static constexpr const char* DEFAULT_LOGS_DIR_NAME = "build_logs";

    /**
     * Empty output_dir / logs_dir in the config select the defaults under
     * std::filesystem::temp_directory_path().
     */
    explicit FrameworkAssembler(BuildConfig config);

    FrameworkAssembler(const FrameworkAssembler&) = delete;
    FrameworkAssembler& operator=(const FrameworkAssembler&) = delete;

    /**
     * Build and merge a target for the given architectures.
     *
     * The output directory is emptied first; the logs directory is created
     * if missing. Each group is built into <project_root>/<first arch>.
     *
     * @param target_name Scheme to build
     * @param architectures Architectures to include (must not be empty)
     * @return AssembleResult with the merged framework path or the failure
     */
    AssembleResult assemble(const std::string& target_name,
                            const std::set<Architecture>& architectures);

    // Arguments for -create-xcframework (without the toolchain path)
    static std::vector<std::string> combine_arguments(
        const fs::path& output,
        const std::vector<ThinBinaryLocation>& slices);

    void set_progress_callback(ProgressCallback cb);

    const fs::path& output_dir() const { return output_dir_; }
    const fs::path& logs_dir() const { return logs_dir_; }

    BuildOrchestrator& orchestrator() { return orchestrator_; }

private:
    // Recreate the output directory and make sure the logs directory exists
    BuildStatus prepare_directories(const std::string& target_name);

    BuildStatus combine(const std::string& target_name,
                        const fs::path& output,
                        const std::vector<ThinBinaryLocation>& slices);

    void report_progress(BuildPhase phase, size_t current, size_t total,
                         const std::string& target,
                         const std::string& message);

    BuildConfig config_;
    fs::path output_dir_;
    fs::path logs_dir_;
    BuildOrchestrator orchestrator_;
    ProgressCallback progress_cb_;
};

} // namespace fatpack

#endif // FATPACK_FRAMEWORK_ASSEMBLER_HPP
