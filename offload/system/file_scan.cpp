/*
 * file_scan.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-9

Description: Listing of transferable files on a mounted volume

**************************************************/

#include "file_scan.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "offload/utils/format.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace offload::system {

namespace {
constexpr std::array<std::string_view, 11> K_METADATA_NAMES = {
    ".Spotlight-V100", ".fseventsd",        ".Trashes",
    ".TemporaryItems", ".DS_Store",         "._.Trashes",
    ".journal",        ".VolumeIcon.icns",  "System Volume Information",
    "$RECYCLE.BIN",    "RECYCLER"};
}  // namespace

void to_json(json& j, const FileEntry& entry) {
    j = json{{"name", entry.name},
             {"size", entry.size},
             {"size_human", entry.sizeHuman}};
}

auto isHiddenName(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    if (name.front() == '.') {
        return true;
    }
    return std::find(K_METADATA_NAMES.begin(), K_METADATA_NAMES.end(), name) !=
           K_METADATA_NAMES.end();
}

namespace {
// Walks one directory level. An entry or subdirectory that cannot be read
// is logged and skipped; the rest of the tree is still visited.
void scanDirectory(const fs::path& root, const fs::path& directory,
                   const ScanOptions& options, std::vector<FileEntry>& files) {
    std::error_code ec;
    fs::directory_iterator it(
        directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Skipping unreadable directory {}: {}", directory.string(),
                     ec.message());
        return;
    }

    for (const fs::directory_iterator end; !ec && it != end;
         it.increment(ec)) {
        const auto& entry = *it;
        if (isHiddenName(entry.path().filename().string())) {
            continue;
        }

        std::error_code statEc;
        if (entry.is_directory(statEc) && !entry.is_symlink(statEc)) {
            scanDirectory(root, entry.path(), options, files);
            continue;
        }
        const bool regular = entry.is_regular_file(statEc);
        const std::uintmax_t size =
            regular ? entry.file_size(statEc) : std::uintmax_t{0};
        if (statEc) {
            spdlog::warn("Skipping {}: {}", entry.path().string(),
                         statEc.message());
            continue;
        }
        if (regular && size >= options.minSize) {
            FileEntry file;
            file.name = entry.path().lexically_relative(root).generic_string();
            file.size = size;
            file.sizeHuman = utils::humanSize(static_cast<double>(size));
            files.push_back(std::move(file));
        }
    }
    if (ec) {
        spdlog::warn("Listing of {} ended early: {}", directory.string(),
                     ec.message());
    }
}
}  // namespace

auto scanFiles(const fs::path& root, const ScanOptions& options)
    -> std::vector<FileEntry> {
    std::vector<FileEntry> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("Cannot scan {}: {}", root.string(),
                     ec ? ec.message() : std::string("not a directory"));
        return files;
    }

    scanDirectory(root, root, options, files);
    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) {
                  return a.name < b.name;
              });
    return files;
}

}  // namespace offload::system
