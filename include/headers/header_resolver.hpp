/**
 * Header Resolver for fatpack
 *
 * Copies a CocoaPods-style public headers tree, where directories and files
 * are symlinks into the pod sources, into a flat tree of real files.
 *
 * Features:
 * - Recursive discovery that follows directory aliases, entering each real
 *   directory once (aliases that loop back are skipped)
 * - Relative import paths preserved (Headers/A/b.h stays A/b.h)
 * - Paths compared after normalization, so /var and /private/var style
 *   prefixes of the same tree do not matter
 * - Canonical sorting for reproducible output
 *
 * Copyright (c) 2025 fatpack Project
 */

#ifndef FATPACK_HEADER_RESOLVER_HPP
#define FATPACK_HEADER_RESOLVER_HPP

#include "core/build_types.hpp"

#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace fatpack::headers {

namespace fs = std::filesystem;

/**
 * One header to copy
 */
struct HeaderMapping {
    std::string relative_path;      // Path below the destination root
    fs::path resolved_location;     // Real file behind the alias
};

/**
 * Result of mapping or flattening a headers tree
 */
struct HeaderResult {
    std::vector<HeaderMapping> headers;
    BuildStatus status;

    bool ok() const { return status.ok(); }
};

/**
 * Resolver options
 */
struct HeaderOptions {
    // Every path handled must contain this; relative paths start after it
    std::string anchor = "Pods/Headers/";
    std::vector<std::string> extensions = {".h", ".hh", ".hpp"};
};

/**
 * Compute where each header under source_root should be copied.
 *
 * @param source_root Headers directory (may itself be reached through aliases)
 * @param options Optional configuration
 * @return HeaderResult with sorted mappings, or MALFORMED_HEADER_PATH if a
 *         path does not contain the anchor
 */
HeaderResult map_headers(
    const fs::path& source_root,
    const HeaderOptions& options = HeaderOptions{}
);

/**
 * Copy every header under source_root into destination_root, resolving
 * aliases and keeping paths relative to source_root.
 *
 * Intermediate directories are created as needed; existing files at the
 * destination are overwritten.
 */
HeaderResult flatten_headers(
    const fs::path& source_root,
    const fs::path& destination_root,
    const HeaderOptions& options = HeaderOptions{}
);

/**
 * Everything after the first occurrence of anchor in the normalized path.
 * Returns nullopt if the anchor does not occur.
 */
std::optional<std::string> strip_anchor(const fs::path& path, const std::string& anchor);

/**
 * Check if a file name has one of the header extensions.
 */
bool is_header(const fs::path& path, const HeaderOptions& options = HeaderOptions{});

} // namespace fatpack::headers

#endif // FATPACK_HEADER_RESOLVER_HPP
