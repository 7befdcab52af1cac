#ifndef FATPACK_ARCHITECTURE_HPP
#define FATPACK_ARCHITECTURE_HPP

// architecture.hpp - Architecture and target platform model
// Part of fatpack - Framework Packaging Build Tool
//
// Static mapping from CPU architectures to the SDK/platform they are built
// against and the extra compiler flags each platform needs. All values are
// fixed at compile time.

#include <string>
#include <vector>
#include <optional>

namespace fatpack {

// Architectures a framework slice can be built for.
// Declaration order is the canonical order used when grouping.
enum class Architecture {
    ARM64,
    ARMV7,
    I386,
    X86_64,
    X86_64H     // Haswell, used for Mac Catalyst
};

// Platform (SDK) an architecture is built against
enum class TargetPlatform {
    DEVICE,
    SIMULATOR,
    CATALYST
};

// Architecture identifier as passed to the toolchain ("arm64", "x86_64h", ...)
inline const char* architecture_name(Architecture arch) {
    switch (arch) {
        case Architecture::ARM64:   return "arm64";
        case Architecture::ARMV7:   return "armv7";
        case Architecture::I386:    return "i386";
        case Architecture::X86_64:  return "x86_64";
        case Architecture::X86_64H: return "x86_64h";
        default:                    return "unknown";
    }
}

// Human-readable platform name for progress output
inline const char* platform_name(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::DEVICE:    return "device";
        case TargetPlatform::SIMULATOR: return "simulator";
        case TargetPlatform::CATALYST:  return "catalyst";
        default:                        return "unknown";
    }
}

/**
 * Platform an architecture is built for.
 *
 * armv7, arm64   -> DEVICE
 * i386, x86_64   -> SIMULATOR
 * x86_64h        -> CATALYST
 */
TargetPlatform platform_for(Architecture arch);

/**
 * SDK identifier passed to the toolchain with -sdk.
 * Also used as the platform id in build log file names.
 */
const char* sdk_name(TargetPlatform platform);

/**
 * Folder suffix the toolchain uses for build products (Release-<folder>).
 * Catalyst builds land in "maccatalyst" rather than the SDK name.
 */
const char* output_folder_name(TargetPlatform platform);

// Extra C flags appended to OTHER_CFLAGS for a platform
std::vector<std::string> extra_compiler_flags(TargetPlatform platform);

// Parse an identifier such as "arm64". Returns nullopt if unknown.
std::optional<Architecture> parse_architecture(const std::string& name);

// Every architecture, in canonical order
const std::vector<Architecture>& all_architectures();

} // namespace fatpack

#endif // FATPACK_ARCHITECTURE_HPP
