#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Manifest format: one "<size>\t<relative path>\n" line per regular file,
// sorted by path (byte order). Sizes only; contents are never hashed.

// Parse one manifest line. nullopt when it is not "<digits>\t<path>".
std::optional<ManifestEntry> parse_manifest_line(const std::string& line);

std::string format_manifest(const std::vector<ManifestEntry>& entries);

// Regular files under root, sorted by path, skipping the relative paths in exclude.
std::vector<ManifestEntry> scan_manifest(const fs::path& root,
                                         const std::vector<std::string>& exclude = {});

// Remote shell command writing <remote_dir>/<manifest_name>. filter (a glob)
// limits the listing to files matching by basename or relative path. The
// manifest never lists itself.
std::string remote_manifest_command(const std::string& remote_dir,
                                    const std::string& manifest_name,
                                    const std::string& filter);

// Check local_dir against a manifest file. Never throws for content
// problems: parse failures, missing files and size mismatches are counted
// in the result.
TransferResult verify_against_manifest(const fs::path& local_dir,
                                       const fs::path& manifest_path);
