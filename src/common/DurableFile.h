#pragma once

#include <filesystem>
#include <string>

namespace crawl_archiver {

/**
 * Replace `target` with `content` atomically: write a sibling temp file, fsync it,
 * rename it over the target and fsync the parent directory.
 * @param target Destination path
 * @param content Bytes to write
 * @param error Receives a description of the failing step
 * @return true on success
 */
bool writeFileDurably(const std::filesystem::path& target,
                      const std::string& content,
                      std::string& error);

// Durably replace `target` with a copy of `source`
bool copyFileDurably(const std::filesystem::path& source,
                     const std::filesystem::path& target,
                     std::string& error);

} // namespace crawl_archiver
