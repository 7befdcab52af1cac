// architecture.cpp - Architecture and target platform model
// Part of fatpack - Framework Packaging Build Tool

#include "core/architecture.hpp"

namespace fatpack {

TargetPlatform platform_for(Architecture arch) {
    switch (arch) {
        case Architecture::ARMV7:
        case Architecture::ARM64:
            return TargetPlatform::DEVICE;
        case Architecture::I386:
        case Architecture::X86_64:
            return TargetPlatform::SIMULATOR;
        case Architecture::X86_64H:
            return TargetPlatform::CATALYST;
    }
    return TargetPlatform::DEVICE;
}

const char* sdk_name(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::DEVICE:    return "iphoneos";
        case TargetPlatform::SIMULATOR: return "iphonesimulator";
        case TargetPlatform::CATALYST:  return "macosx";
    }
    return "iphoneos";
}

const char* output_folder_name(TargetPlatform platform) {
    if (platform == TargetPlatform::CATALYST) {
        return "maccatalyst";
    }
    return sdk_name(platform);
}

std::vector<std::string> extra_compiler_flags(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::DEVICE:
            // Device slices ship with embedded bitcode
            return {"-fembed-bitcode"};
        case TargetPlatform::SIMULATOR:
        case TargetPlatform::CATALYST:
            return {};
    }
    return {};
}

std::optional<Architecture> parse_architecture(const std::string& name) {
    for (Architecture arch : all_architectures()) {
        if (name == architecture_name(arch)) {
            return arch;
        }
    }
    return std::nullopt;
}

const std::vector<Architecture>& all_architectures() {
    static const std::vector<Architecture> archs = {
        Architecture::ARM64,
        Architecture::ARMV7,
        Architecture::I386,
        Architecture::X86_64,
        Architecture::X86_64H
    };
    return archs;
}

} // namespace fatpack
