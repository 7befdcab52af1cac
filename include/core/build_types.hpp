#ifndef FATPACK_BUILD_TYPES_HPP
#define FATPACK_BUILD_TYPES_HPP

// build_types.hpp - Shared result, mode and progress types
// Part of fatpack - Framework Packaging Build Tool

#include <string>
#include <filesystem>
#include <functional>
#include <cstddef>

namespace fatpack {

namespace fs = std::filesystem;

// =============================================================================
// Errors
// =============================================================================

// Every error aborts the pipeline; none of them are retried.
enum class BuildError {
    OK = 0,
    INVALID_REQUEST,          // Nothing to build, bad arguments
    SPAWN_FAILED,             // Could not start an external process
    TOOLCHAIN_FAILED,         // xcodebuild exited non-zero for a slice
    COMBINE_FAILED,           // -create-xcframework exited non-zero
    FILESYSTEM_ERROR,         // Temp, log or cache directory operation failed
    MALFORMED_HEADER_PATH     // Header path lacks the expected anchor
};

inline const char* error_to_string(BuildError error) {
    switch (error) {
        case BuildError::OK:                    return "ok";
        case BuildError::INVALID_REQUEST:       return "invalid_request";
        case BuildError::SPAWN_FAILED:          return "spawn_failed";
        case BuildError::TOOLCHAIN_FAILED:      return "toolchain_failed";
        case BuildError::COMBINE_FAILED:        return "combine_failed";
        case BuildError::FILESYSTEM_ERROR:      return "filesystem_error";
        case BuildError::MALFORMED_HEADER_PATH: return "malformed_header_path";
        default:                                return "unknown";
    }
}

// Outcome of a pipeline step, with the diagnostics needed to act on a failure
struct BuildStatus {
    BuildError error = BuildError::OK;
    std::string message;
    int exit_code = 0;          // External command exit code, if any
    std::string output;         // Captured command output, if any
    fs::path log_file;          // Build log written for the failing step, if any

    bool ok() const { return error == BuildError::OK; }

    static BuildStatus failure(BuildError error, const std::string& message) {
        BuildStatus status;
        status.error = error;
        status.message = message;
        return status;
    }
};

// =============================================================================
// Distribution Mode
// =============================================================================

// The two distribution flavours of the same framework. Each is cached
// separately and compiled with its own marker define.
enum class DistributionMode {
    ZIP,
    CARTHAGE
};

// Cache sub-directory for a mode ("" for the default zip distribution)
inline const char* cache_variant_name(DistributionMode mode) {
    return mode == DistributionMode::CARTHAGE ? "carthage" : "";
}

// Define added to OTHER_CFLAGS so sources can tell the flavours apart
inline const char* distribution_flag(DistributionMode mode) {
    return mode == DistributionMode::CARTHAGE
        ? "-DFIREBASE_BUILD_CARTHAGE"
        : "-DFIREBASE_BUILD_ZIP_FILE";
}

// =============================================================================
// Progress Callback
// =============================================================================
enum class BuildPhase {
    CHECKING_CACHE,    // Looking for a cached framework
    PREPARING,         // Creating temp and log directories
    COMPILING,         // Building one slice per architecture group
    COMBINING,         // Running -create-xcframework
    CACHING,           // Moving the result into the cache
    COMPLETE
};

struct BuildProgress {
    BuildPhase phase = BuildPhase::CHECKING_CACHE;
    size_t current = 0;
    size_t total = 0;
    std::string current_target;
    std::string message;
};

using ProgressCallback = std::function<void(const BuildProgress&)>;

} // namespace fatpack

#endif // FATPACK_BUILD_TYPES_HPP
