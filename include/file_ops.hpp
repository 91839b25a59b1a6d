#pragma once

#include <cstdint>
#include <filesystem>

/**
 * Filesystem operations used by a transfer: staging, cleanup and publish.
 */

/**
 * Ensure the directory for a file path exists, creating it if needed.
 * Idempotent; a path without a parent is accepted as-is.
 *
 * @throws std::filesystem::filesystem_error if the directory cannot be created
 */
void ensureParentDirectory(const std::filesystem::path &filePath);

/**
 * Size of an existing regular file, 0 if it does not exist.
 *
 * @throws std::filesystem::filesystem_error if the size cannot be read
 */
std::uintmax_t existingFileSize(const std::filesystem::path &filePath);

/**
 * Delete a file if present without throwing.
 *
 * @return true if the file is gone afterwards
 */
bool removeQuietly(const std::filesystem::path &filePath) noexcept;

/**
 * Publish a finished working file under its final name.
 * Any existing file at the destination is removed first (last writer wins).
 *
 * @throws std::filesystem::filesystem_error on failure
 */
void replaceFile(const std::filesystem::path &workingPath,
                 const std::filesystem::path &finalPath);

/**
 * Check if there's enough disk space for a download.
 * A 10% margin is required on top of the requested bytes. Filesystems that
 * cannot report free space are assumed to have room.
 *
 * @param filePath Path where file will be saved
 * @param requiredBytes Number of bytes needed
 * @return true if enough space is available
 */
bool hasDiskSpaceFor(const std::filesystem::path &filePath, std::uintmax_t requiredBytes);
