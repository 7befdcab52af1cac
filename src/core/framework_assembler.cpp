/**
 * framework_assembler.cpp
 * Implementation of the multi-architecture Framework Assembler
 *
 * Copyright (c) 2025 fatpack Project
 */

#include "core/framework_assembler.hpp"

#include <system_error>

namespace fatpack {

namespace {

fs::path or_temp_default(const fs::path& configured, const char* name) {
    if (!configured.empty()) {
        return configured;
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / name;
}

} // namespace

FrameworkAssembler::FrameworkAssembler(BuildConfig config)
    : config_(std::move(config))
    , output_dir_(or_temp_default(config_.output_dir, DEFAULT_OUTPUT_DIR_NAME))
    , logs_dir_(or_temp_default(config_.logs_dir, DEFAULT_LOGS_DIR_NAME))
    , orchestrator_(config_)
{
}

void FrameworkAssembler::set_progress_callback(ProgressCallback cb) {
    progress_cb_ = cb;
    orchestrator_.set_progress_callback(std::move(cb));
}

AssembleResult FrameworkAssembler::assemble(
    const std::string& target_name,
    const std::set<Architecture>& architectures) {

    AssembleResult result;

    if (architectures.empty()) {
        result.status = BuildStatus::failure(
            BuildError::INVALID_REQUEST,
            "No architectures requested for " + target_name);
        return result;
    }

    // Fail before the output directory is touched
    result.status = orchestrator_.check_toolchain();
    if (!result.status.ok()) {
        return result;
    }

    report_progress(BuildPhase::PREPARING, 0, 1, target_name,
                    "Preparing " + output_dir_.string());
    result.status = prepare_directories(target_name);
    if (!result.status.ok()) {
        return result;
    }

    // Build every group; xcframework accepts one (possibly fat) framework per platform
    std::vector<ArchitectureGroup> groups = group_architectures(architectures);

    for (size_t i = 0; i < groups.size(); ++i) {
        const ArchitectureGroup& group = groups[i];
        report_progress(BuildPhase::COMPILING, i, groups.size(), target_name,
                        "Building " + target_name + " [" + group_to_string(group) + "]");

        fs::path build_dir = config_.project_root / architecture_name(group.front());
        ThinBuildResult thin = orchestrator_.build_group(target_name, group, build_dir, logs_dir_);
        if (!thin.ok()) {
            result.status = thin.status;
            return result;
        }
        result.slices.push_back(std::move(thin.location));
    }

    fs::path framework = output_dir_ / (target_name + XCFRAMEWORK_EXTENSION);

    report_progress(BuildPhase::COMBINING, 0, 1, target_name,
                    "About to create xcframework for " + framework.string());
    result.status = combine(target_name, framework, result.slices);
    if (!result.status.ok()) {
        return result;
    }

    result.framework_path = framework;
    return result;
}

std::vector<std::string> FrameworkAssembler::combine_arguments(
    const fs::path& output,
    const std::vector<ThinBinaryLocation>& slices) {

    std::vector<std::string> args = {"-create-xcframework", "-output", output.string()};
    for (const auto& slice : slices) {
        args.push_back("-framework");
        args.push_back(slice.path.string());
    }
    return args;
}

// =============================================================================
// Internal Helpers
// =============================================================================

BuildStatus FrameworkAssembler::prepare_directories(const std::string& target_name) {
    std::error_code ec;

    // The output directory is scratch space, not the cache
    if (fs::exists(output_dir_, ec)) {
        fs::remove_all(output_dir_, ec);
        if (ec) {
            return BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Failure removing temporary directory " + output_dir_.string() +
                " while building " + target_name + ": " + ec.message());
        }
    }

    fs::create_directories(output_dir_, ec);
    if (ec) {
        return BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Failure creating temporary directory " + output_dir_.string() +
            " while building " + target_name + ": " + ec.message());
    }

    fs::create_directories(logs_dir_, ec);
    if (ec) {
        return BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Failure creating logs directory " + logs_dir_.string() +
            " while building " + target_name + ": " + ec.message());
    }

    return BuildStatus{};
}

BuildStatus FrameworkAssembler::combine(const std::string& target_name,
                                        const fs::path& output,
                                        const std::vector<ThinBinaryLocation>& slices) {
    std::vector<std::string> args = combine_arguments(output, slices);

    ProcessExecutor::ExecResult exec;
    try {
        exec = orchestrator_.executor().run(config_.toolchain, args, true);
    } catch (const std::runtime_error& e) {
        return BuildStatus::failure(
            BuildError::SPAWN_FAILED,
            "Could not run " + config_.toolchain + " -create-xcframework for " +
            target_name + ": " + e.what());
    }

    if (!exec.success()) {
        BuildStatus status = BuildStatus::failure(
            BuildError::COMBINE_FAILED,
            "xcodebuild -create-xcframework command exited with " +
            std::to_string(exec.exit_code) + " when trying to build " + target_name);
        status.exit_code = exec.exit_code;
        status.output = exec.output;
        return status;
    }

    report_progress(BuildPhase::COMBINING, 1, 1, target_name,
                    "xcodebuild -create-xcframework command for " + target_name + " succeeded.");
    return BuildStatus{};
}

void FrameworkAssembler::report_progress(BuildPhase phase, size_t current, size_t total,
                                         const std::string& target,
                                         const std::string& message) {
    if (progress_cb_) {
        BuildProgress progress;
        progress.phase = phase;
        progress.current = current;
        progress.total = total;
        progress.current_target = target;
        progress.message = message;
        progress_cb_(progress);
    }
}

} // namespace fatpack
