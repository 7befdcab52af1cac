/**
 * Header Resolver Implementation
 *
 * Copyright (c) 2025 fatpack Project
 */

#include "headers/header_resolver.hpp"
#include <algorithm>
#include <set>
#include <system_error>

namespace fatpack::headers {

namespace {

// Absolute, lexically normalized, '/'-separated
std::string normalized(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return absolute.lexically_normal().generic_string();
}

BuildStatus malformed(const fs::path& path, const std::string& anchor) {
    return BuildStatus::failure(
        BuildError::MALFORMED_HEADER_PATH,
        "Could not copy headers: full path does not contain `" + anchor + "`: " +
        normalized(path));
}

} // namespace

std::optional<std::string> strip_anchor(const fs::path& path, const std::string& anchor) {
    std::string full = normalized(path);

    // Directories are matched with a trailing separator so ".../Pods/Headers"
    // matches the "Pods/Headers/" anchor
    if (!full.empty() && full.back() != '/') {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            full += '/';
        }
    }

    size_t pos = full.find(anchor);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return full.substr(pos + anchor.size());
}

bool is_header(const fs::path& path, const HeaderOptions& options) {
    std::string ext = path.extension().string();
    return std::find(options.extensions.begin(), options.extensions.end(), ext)
        != options.extensions.end();
}

HeaderResult map_headers(const fs::path& source_root, const HeaderOptions& options) {
    HeaderResult result;

    std::optional<std::string> trimmed_dir = strip_anchor(source_root, options.anchor);
    if (!trimmed_dir) {
        result.status = malformed(source_root, options.anchor);
        return result;
    }
    // Compare without the trailing separator added for directories
    while (!trimmed_dir->empty() && trimmed_dir->back() == '/') {
        trimmed_dir->pop_back();
    }

    // Collect aliased headers, following directory symlinks
    std::vector<fs::path> aliased;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        source_root,
        fs::directory_options::follow_directory_symlink |
        fs::directory_options::skip_permission_denied,
        ec);
    if (ec) {
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not search for headers in " + source_root.string() + ": " + ec.message());
        return result;
    }

    // Real directories already entered; an alias back into one of them is
    // not descended again
    std::set<fs::path> visited;
    fs::path real_root = fs::canonical(source_root, ec);
    if (ec) {
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not resolve headers directory " + source_root.string() + ": " + ec.message());
        return result;
    }
    visited.insert(real_root);

    for (fs::recursive_directory_iterator end; it != end; ) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            fs::path real_dir = fs::canonical(it->path(), entry_ec);
            if (entry_ec || !visited.insert(real_dir).second) {
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(entry_ec) && is_header(it->path(), options)) {
            aliased.push_back(it->path());
        }

        it.increment(ec);
        if (ec) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Could not search for headers in " + source_root.string() + ": " + ec.message());
            return result;
        }
    }

    // Canonical sort for reproducibility
    std::sort(aliased.begin(), aliased.end());

    for (const auto& header : aliased) {
        std::optional<std::string> trimmed_header = strip_anchor(header, options.anchor);
        if (!trimmed_header) {
            result.status = malformed(header, options.anchor);
            return result;
        }

        std::string relative = *trimmed_header;
        const size_t dir_len = trimmed_dir->size();
        if (relative.compare(0, dir_len, *trimmed_dir) == 0 &&
            (relative.size() == dir_len || dir_len == 0 || relative[dir_len] == '/')) {
            relative.erase(0, dir_len);
        }

        // Remove any leading '/' for the relative path
        while (!relative.empty() && relative.front() == '/') {
            relative.erase(0, 1);
        }

        // Resolve the alias to the real file
        fs::path resolved = fs::canonical(header, ec);
        if (ec) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Could not resolve header " + header.string() + ": " + ec.message());
            return result;
        }

        result.headers.push_back({relative, resolved});
    }

    return result;
}

HeaderResult flatten_headers(
    const fs::path& source_root,
    const fs::path& destination_root,
    const HeaderOptions& options
) {
    std::error_code ec;
    fs::create_directories(destination_root, ec);
    if (ec) {
        HeaderResult result;
        result.status = BuildStatus::failure(
            BuildError::FILESYSTEM_ERROR,
            "Could not create headers directory " + destination_root.string() +
            ": " + ec.message());
        return result;
    }

    HeaderResult result = map_headers(source_root, options);
    if (!result.ok()) {
        return result;
    }

    for (const auto& mapping : result.headers) {
        fs::path final_path = destination_root / mapping.relative_path;

        fs::create_directories(final_path.parent_path(), ec);
        if (ec) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Could not create directory " + final_path.parent_path().string() +
                ": " + ec.message());
            return result;
        }

        fs::copy_file(mapping.resolved_location, final_path,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            result.status = BuildStatus::failure(
                BuildError::FILESYSTEM_ERROR,
                "Could not copy header " + mapping.resolved_location.string() +
                " to " + final_path.string() + ": " + ec.message());
            return result;
        }
    }

    return result;
}

} // namespace fatpack::headers
