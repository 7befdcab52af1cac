/**
 * main.cpp
 * fatpack - Framework Packaging Build Tool CLI
 *
 * Usage:
 *   fatpack [command] [options] [arguments]
 *
 * Commands:
 *   build <target> <version>     Build (or fetch from cache) a fat framework
 *   headers <source> <dest>      Flatten an aliased headers tree
 *   cache-path <target> <version> Print where a framework is cached
 *   clean <target> <version>     Remove a cached framework
 *   archs                        List supported architectures
 *
 * Options:
 *   -C <dir>            Project directory (default: current directory)
 *   -a, --arch <id>     Architecture to build (repeatable, default: all)
 *   --cache-dir <dir>   Framework cache root
 *   --logs-dir <dir>    Build log directory
 *   --output-dir <dir>  Scratch directory for the merged framework
 *   --toolchain <path>  xcodebuild to use
 *   --workspace <name>  Workspace inside the project directory
 *   --anchor <text>     Anchor for header paths (default: Pods/Headers/)
 *   --carthage          Build the Carthage distribution
 *   --force             Ignore cached frameworks
 *   -v                  Verbose output
 *   -q                  Quiet mode
 *   --help              Show this help
 *   --version           Show version
 *
 * Copyright (c) 2025 fatpack Project
 */

#include "core/framework_builder.hpp"
#include "headers/header_resolver.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace fatpack;

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version() {
    std::cout << "fatpack 0.1.0\n";
    std::cout << "Framework Packaging Build Tool\n";
    std::cout << "Copyright (c) 2025 fatpack Project\n";
}

void print_help() {
    std::cout << R"(
fatpack - Framework Packaging Build Tool

USAGE:
    fatpack [COMMAND] [OPTIONS] [ARGUMENTS...]

COMMANDS:
    build <target> <version>        Build a fat .xcframework, or reuse the cached one
                                    (default if no command given)
    headers <source> <dest>         Copy an aliased headers tree as real files
    cache-path <target> <version>   Print the cache location of a framework
    clean <target> <version>        Remove a cached framework
    archs                           List supported architectures

OPTIONS:
    -C <dir>              Project directory with the workspace and Pods
    -a, --arch <id>       Architecture to build; repeat for more (default: all)
    --cache-dir <dir>     Framework cache root (default: ~/.cache/fatpack/frameworks)
    --logs-dir <dir>      Build log directory (default: <tmp>/build_logs)
    --output-dir <dir>    Scratch output directory (default: <tmp>/frameworks_being_built)
    --toolchain <path>    xcodebuild binary (default: /usr/bin/xcodebuild)
    --workspace <name>    Workspace name (default: FrameworkMaker.xcworkspace)
    --anchor <text>       Header path anchor (default: Pods/Headers/)
    --carthage            Build and cache the Carthage distribution
    --force               Rebuild even if the framework is cached
    -v, --verbose         Verbose output (show commands and toolchain output)
    -q, --quiet           Quiet mode (minimal output)

    -h, --help            Show this help message
    --version             Show version information

EXAMPLES:
    fatpack build FirebaseCore 6.3.0 -C ~/FrameworkMaker
    fatpack build PromisesObjC 1.2.8 -a arm64 -a x86_64 --carthage
    fatpack headers Pods/Headers/Public/FirebaseCore out/Headers
    fatpack cache-path GoogleUtilities 6.3.0

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleProgress {
public:
    explicit ConsoleProgress(bool verbose = false, bool quiet = false)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(const BuildProgress& progress) {
        if (quiet_) return;

        switch (progress.phase) {
            case BuildPhase::CHECKING_CACHE:
                std::cout << progress.message << "\n";
                break;

            case BuildPhase::PREPARING:
                if (verbose_) {
                    std::cout << progress.message << "\n";
                }
                break;

            case BuildPhase::COMPILING:
                if (progress.total > 0) {
                    std::cout << "[" << (progress.current + 1) << "/"
                              << progress.total << "] " << progress.message << "\n";
                } else if (verbose_) {
                    std::cout << progress.message << "\n";
                }
                break;

            case BuildPhase::COMBINING:
            case BuildPhase::CACHING:
                if (verbose_) {
                    std::cout << progress.message << "\n";
                }
                break;

            case BuildPhase::COMPLETE:
                std::cout << progress.message << "\n";
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;
};

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

enum class Command {
    BUILD,
    HEADERS,
    CACHE_PATH,
    CLEAN,
    ARCHS
};

struct Options {
    Command command = Command::BUILD;
    BuildConfig config;
    headers::HeaderOptions header_options;
    std::vector<std::string> positional;
    bool show_help = false;
    bool show_version = false;
};

bool takes_value(const std::string& arg) {
    static const std::vector<std::string> options = {
        "-C", "-a", "--arch", "--cache-dir", "--logs-dir", "--output-dir",
        "--toolchain", "--workspace", "--anchor"
    };
    return std::find(options.begin(), options.end(), arg) != options.end();
}

bool parse_args(int argc, char* argv[], Options& opts) {
    opts.config.project_root = fs::current_path();
    bool command_seen = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }

        // Commands
        if (!command_seen && opts.positional.empty()) {
            if (arg == "build") {
                opts.command = Command::BUILD;
                command_seen = true;
                continue;
            }
            if (arg == "headers") {
                opts.command = Command::HEADERS;
                command_seen = true;
                continue;
            }
            if (arg == "cache-path") {
                opts.command = Command::CACHE_PATH;
                command_seen = true;
                continue;
            }
            if (arg == "clean") {
                opts.command = Command::CLEAN;
                command_seen = true;
                continue;
            }
            if (arg == "archs") {
                opts.command = Command::ARCHS;
                command_seen = true;
                continue;
            }
        }

        // Options with arguments
        if (takes_value(arg) && i + 1 >= argc) {
            std::cerr << "Option " << arg << " requires a value\n";
            return false;
        }
        if (arg == "-C" && i + 1 < argc) {
            opts.config.project_root = argv[++i];
            continue;
        }
        if ((arg == "-a" || arg == "--arch") && i + 1 < argc) {
            std::string name = argv[++i];
            auto arch = parse_architecture(name);
            if (!arch) {
                std::cerr << "Unknown architecture: " << name << "\n";
                return false;
            }
            opts.config.architectures.insert(*arch);
            continue;
        }
        if (arg == "--cache-dir" && i + 1 < argc) {
            opts.config.cache_root = argv[++i];
            continue;
        }
        if (arg == "--logs-dir" && i + 1 < argc) {
            opts.config.logs_dir = argv[++i];
            continue;
        }
        if (arg == "--output-dir" && i + 1 < argc) {
            opts.config.output_dir = argv[++i];
            continue;
        }
        if (arg == "--toolchain" && i + 1 < argc) {
            opts.config.toolchain = argv[++i];
            continue;
        }
        if (arg == "--workspace" && i + 1 < argc) {
            opts.config.workspace = argv[++i];
            continue;
        }
        if (arg == "--anchor" && i + 1 < argc) {
            opts.header_options.anchor = argv[++i];
            continue;
        }

        // Boolean options
        if (arg == "--carthage") {
            opts.config.mode = DistributionMode::CARTHAGE;
            continue;
        }
        if (arg == "--force") {
            opts.config.force_rebuild = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.config.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.config.quiet = true;
            continue;
        }

        // Unknown option
        if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Try 'fatpack --help' for more information.\n";
            return false;
        }

        opts.positional.push_back(arg);
    }

    if (opts.config.architectures.empty()) {
        const auto& all = all_architectures();
        opts.config.architectures.insert(all.begin(), all.end());
    }

    return true;
}

bool expect_arguments(const Options& opts, size_t count, const char* usage) {
    if (opts.positional.size() != count) {
        std::cerr << "Usage: fatpack " << usage << "\n";
        return false;
    }
    return true;
}

void print_failure(const BuildStatus& status) {
    std::cerr << "Error (" << error_to_string(status.error) << "): "
              << status.message << "\n";
    if (!status.log_file.empty()) {
        std::cerr << "  Build log: " << status.log_file.string() << "\n";
    }
    if (status.error == BuildError::COMBINE_FAILED && !status.output.empty()) {
        std::cerr << "Output:\n" << status.output << "\n";
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    if (opts.show_version) {
        print_version();
        return 0;
    }

    switch (opts.command) {
        case Command::BUILD: {
            if (!expect_arguments(opts, 2, "build <target> <version> [options]")) {
                return 1;
            }

            FrameworkBuilder builder(opts.config);
            builder.set_progress_callback(ConsoleProgress(opts.config.verbose, opts.config.quiet));
            if (opts.config.verbose && !opts.config.quiet) {
                builder.assembler().orchestrator().executor().set_line_callback(
                    [](const std::string& line) { std::cout << "  | " << line << "\n"; });
            }

            FrameworkBuildResult result = builder.build_framework(opts.positional[0],
                                                                  opts.positional[1]);
            if (!result.ok()) {
                print_failure(result.status);
                return 1;
            }

            if (opts.config.quiet) {
                std::cout << result.framework_path.string() << "\n";
            } else {
                std::cout << "\n" << (result.from_cache ? "Cached: " : "Built: ")
                          << result.framework_path.string()
                          << " (" << result.total_time.count() << "ms)\n";
            }
            return 0;
        }

        case Command::HEADERS: {
            if (!expect_arguments(opts, 2, "headers <source> <dest> [--anchor <text>]")) {
                return 1;
            }

            headers::HeaderResult result = headers::flatten_headers(
                opts.positional[0], opts.positional[1], opts.header_options);
            if (!result.ok()) {
                print_failure(result.status);
                return 1;
            }

            if (!opts.config.quiet) {
                std::cout << "Copied " << result.headers.size() << " headers to "
                          << opts.positional[1] << "\n";
                if (opts.config.verbose) {
                    for (const auto& header : result.headers) {
                        std::cout << "  " << header.relative_path << " <- "
                                  << header.resolved_location.string() << "\n";
                    }
                }
            }
            return 0;
        }

        case Command::CACHE_PATH: {
            if (!expect_arguments(opts, 2, "cache-path <target> <version> [--carthage]")) {
                return 1;
            }

            ArtifactCache cache(opts.config.cache_root.empty()
                                    ? ArtifactCache::default_cache_root()
                                    : opts.config.cache_root);
            const std::string& target = opts.positional[0];
            const std::string& version = opts.positional[1];

            std::cout << cache.artifact_path(target, version, opts.config.mode).string() << "\n";
            return cache.lookup(target, version, opts.config.mode) ? 0 : 2;
        }

        case Command::CLEAN: {
            if (!expect_arguments(opts, 2, "clean <target> <version> [--carthage]")) {
                return 1;
            }

            ArtifactCache cache(opts.config.cache_root.empty()
                                    ? ArtifactCache::default_cache_root()
                                    : opts.config.cache_root);
            BuildStatus status = cache.remove(opts.positional[0], opts.positional[1],
                                              opts.config.mode);
            if (!status.ok()) {
                print_failure(status);
                return 1;
            }
            if (!opts.config.quiet) {
                std::cout << "Removed "
                          << cache.artifact_path(opts.positional[0], opts.positional[1],
                                                 opts.config.mode).string()
                          << "\n";
            }
            return 0;
        }

        case Command::ARCHS: {
            for (Architecture arch : all_architectures()) {
                TargetPlatform platform = platform_for(arch);
                std::cout << "  " << architecture_name(arch)
                          << " [" << platform_name(platform) << ", sdk "
                          << sdk_name(platform) << "]\n";
            }
            return 0;
        }
    }

    return 0;
}
