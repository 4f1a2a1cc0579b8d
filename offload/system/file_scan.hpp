/*
 * file_scan.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-9

Description: Listing of transferable files on a mounted volume

**************************************************/

#ifndef OFFLOAD_SYSTEM_FILE_SCAN_HPP
#define OFFLOAD_SYSTEM_FILE_SCAN_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace offload::system {

struct FileEntry {
    std::string name;  ///< Path relative to the volume root, '/' separated
    std::uint64_t size{0};
    std::string sizeHuman;

    bool operator==(const FileEntry& other) const = default;
};

void to_json(nlohmann::json& j, const FileEntry& entry);

struct ScanOptions {
    std::uint64_t minSize{1024 * 1024};  ///< Smaller files are skipped
};

/**
 * @brief True for names that are hidden or camera/OS metadata, such as
 * ".DS_Store" or "System Volume Information".
 */
[[nodiscard]] auto isHiddenName(std::string_view name) -> bool;

/**
 * @brief Recursively lists regular files under @p root, sorted by path.
 *
 * Hidden entries and their subtrees are skipped, as are files below
 * ScanOptions::minSize. An entry or directory that cannot be read is
 * logged and skipped; the scan carries on with its siblings.
 */
[[nodiscard]] auto scanFiles(const std::filesystem::path& root,
                             const ScanOptions& options = {})
    -> std::vector<FileEntry>;

}  // namespace offload::system

#endif  // OFFLOAD_SYSTEM_FILE_SCAN_HPP
