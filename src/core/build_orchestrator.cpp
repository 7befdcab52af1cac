/**
 * build_orchestrator.cpp
 * Implementation of the per-slice Build Orchestrator
 *
 * Copyright (c) 2025 fatpack Project
 */

#include "core/build_orchestrator.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <array>
#include <utility>

namespace fatpack {

// =============================================================================
// Grouping and Naming
// =============================================================================

std::vector<ArchitectureGroup> group_architectures(const std::set<Architecture>& requested) {
    // Legacy pairs are built in a single pass. Order matters for determinism.
    static const std::array<std::pair<Architecture, Architecture>, 2> pairs = {{
        {Architecture::ARMV7, Architecture::ARM64},
        {Architecture::I386, Architecture::X86_64}
    }};

    std::set<Architecture> remaining = requested;
    std::vector<ArchitectureGroup> groups;

    for (const auto& [first, second] : pairs) {
        if (remaining.count(first) && remaining.count(second)) {
            groups.push_back({first, second});
            remaining.erase(first);
            remaining.erase(second);
        }
    }

    // std::set iterates in enum order, which is the canonical order
    for (Architecture arch : remaining) {
        groups.push_back({arch});
    }

    return groups;
}

std::string group_to_string(const ArchitectureGroup& group) {
    std::string joined;
    for (size_t i = 0; i < group.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += architecture_name(group[i]);
    }
    return joined;
}

const std::unordered_map<std::string, std::string>& framework_name_overrides() {
    static const std::unordered_map<std::string, std::string> overrides = {
        {"PromisesObjC", "FBLPromises"},
        {"Protobuf", "protobuf"}
    };
    return overrides;
}

std::string real_framework_name(const std::string& target_name) {
    const auto& overrides = framework_name_overrides();
    auto it = overrides.find(target_name);
    return it != overrides.end() ? it->second : target_name;
}

// =============================================================================
// Build Orchestrator Implementation
// =============================================================================

BuildOrchestrator::BuildOrchestrator(BuildConfig config)
    : config_(std::move(config))
{
}

BuildStatus BuildOrchestrator::check_toolchain() const {
    const std::string& toolchain = config_.toolchain;
    if (toolchain.find('/') != std::string::npos &&
        !ProcessExecutor::is_executable(toolchain)) {
        return BuildStatus::failure(
            BuildError::SPAWN_FAILED,
            "Toolchain not found or not executable: " + toolchain);
    }
    return BuildStatus{};
}

std::vector<std::string> BuildOrchestrator::build_arguments(
    const std::string& target_name,
    const ArchitectureGroup& group,
    const fs::path& build_dir) const {

    Architecture primary = group.front();
    TargetPlatform platform = platform_for(primary);
    bool is_catalyst = primary == Architecture::X86_64H;

    // Catalyst builds the plain x86_64 slice with Mac Catalyst support enabled
    std::string archs = is_catalyst
        ? architecture_name(Architecture::X86_64)
        : group_to_string(group);

    // OTHER_CFLAGS keeps inherited flags and adds the distribution marker
    std::string c_flags = std::string("OTHER_CFLAGS=$(value) ") + distribution_flag(config_.mode);
    for (const auto& flag : extra_compiler_flags(platform)) {
        c_flags += " " + flag;
    }

    fs::path workspace = config_.project_root / config_.workspace;

    return {
        "build",
        "-configuration", "release",
        "-workspace", workspace.string(),
        "-scheme", target_name,
        "GCC_GENERATE_DEBUGGING_SYMBOLS=No",
        "ARCHS=" + archs,
        "VALID_ARCHS=" + archs,
        "ONLY_ACTIVE_ARCH=NO",
        "BUILD_LIBRARIES_FOR_DISTRIBUTION=YES",
        std::string("SUPPORTS_MACCATALYST=") + (is_catalyst ? "YES" : "NO"),
        "BUILD_DIR=" + build_dir.string(),
        "-sdk", sdk_name(platform),
        c_flags
    };
}

fs::path BuildOrchestrator::log_file_path(const fs::path& log_dir,
                                          const std::string& target_name,
                                          const ArchitectureGroup& group) {
    Architecture primary = group.front();
    std::string file_name = target_name + "-" + architecture_name(primary) + "-" +
                            sdk_name(platform_for(primary)) + ".txt";
    return log_dir / file_name;
}

fs::path BuildOrchestrator::thin_framework_path(const fs::path& build_dir,
                                                const std::string& target_name,
                                                const ArchitectureGroup& group) {
    std::string folder = std::string("Release-") +
                         output_folder_name(platform_for(group.front()));
    return build_dir / folder / target_name /
           (real_framework_name(target_name) + THIN_FRAMEWORK_EXTENSION);
}

ThinBuildResult BuildOrchestrator::build_group(
    const std::string& target_name,
    const ArchitectureGroup& group,
    const fs::path& build_dir,
    const fs::path& log_dir) {

    ThinBuildResult result;

    if (group.empty()) {
        result.status = BuildStatus::failure(
            BuildError::INVALID_REQUEST,
            "Cannot build " + target_name + " for an empty architecture group");
        return result;
    }

    result.status = check_toolchain();
    if (!result.ok()) {
        return result;
    }

    const std::string arch = architecture_name(group.front());
    std::vector<std::string> args = build_arguments(target_name, group, build_dir);

    std::ostringstream cmd;
    cmd << config_.toolchain;
    for (const auto& arg : args) {
        cmd << " " << arg;
    }
    report_progress(BuildPhase::COMPILING, target_name,
                    "Compiling " + target_name + " for " + arch +
                    " with command:\n" + cmd.str());

    fs::path log_file = log_file_path(log_dir, target_name, group);

    ProcessExecutor::ExecResult exec;
    try {
        exec = executor_.run(config_.toolchain, args, true);
    } catch (const std::runtime_error& e) {
        result.status = BuildStatus::failure(
            BuildError::SPAWN_FAILED,
            "Could not run " + config_.toolchain + " for " + target_name + ": " + e.what());
        return result;
    }

    if (!exec.success()) {
        // The log is the only record of why the build failed
        if (!write_log(log_file, exec.output)) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Error building " + target_name + " for " + arch +
                " and the build log could not be written to " + log_file.string());
        } else {
            result.status = BuildStatus::failure(
                BuildError::TOOLCHAIN_FAILED,
                "Error building " + target_name + " for " + arch +
                ". Code: " + std::to_string(exec.exit_code) +
                ". See the build log at " + log_file.string());
        }
        result.status.exit_code = exec.exit_code;
        result.status.output = exec.output;
        result.status.log_file = log_file;
        return result;
    }

    // A missing log is not worth failing a successful build over
    write_log(log_file, exec.output);

    result.location.path = thin_framework_path(build_dir, target_name, group);
    result.location.group = group;
    result.location.log_file = log_file;

    report_progress(BuildPhase::COMPILING, target_name,
                    "Successfully built " + target_name + " for " + arch +
                    ". Build log can be found at " + log_file.string());

    return result;
}

// =============================================================================
// Helper Functions
// =============================================================================

bool BuildOrchestrator::write_log(const fs::path& log_file, const std::string& output) {
    std::ofstream file(log_file, std::ios::trunc);
    if (!file) {
        return false;
    }

    file << output;
    return file.good();
}

void BuildOrchestrator::report_progress(BuildPhase phase,
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

} // namespace fatpack
