#include "file_ops.hpp"
#include "format_utils.hpp"
#include "logging.hpp"

#include <system_error>

void ensureParentDirectory(const std::filesystem::path &filePath)
{
    // Get the parent directory of the file
    auto directory = filePath.parent_path();

    // If parent directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    // Create all parent directories (like mkdir -p)
    std::filesystem::create_directories(directory);
}

std::uintmax_t existingFileSize(const std::filesystem::path &filePath)
{
    if (!std::filesystem::exists(filePath))
    {
        return 0;
    }
    return std::filesystem::file_size(filePath);
}

bool removeQuietly(const std::filesystem::path &filePath) noexcept
{
    std::error_code ec;
    std::filesystem::remove(filePath, ec);
    if (ec)
    {
        logWarning("Could not remove {}: {}", filePath.string(), ec.message());
        return false;
    }
    return true;
}

void replaceFile(const std::filesystem::path &workingPath,
                 const std::filesystem::path &finalPath)
{
    // Not an atomic swap: the gap between remove and rename is the accepted failure window
    if (std::filesystem::exists(finalPath))
    {
        std::filesystem::remove(finalPath);
    }
    std::filesystem::rename(workingPath, finalPath);
}

bool hasDiskSpaceFor(const std::filesystem::path &filePath, std::uintmax_t requiredBytes)
{
    // If size is unknown (0), skip the check
    if (requiredBytes == 0)
    {
        return true;
    }

    // Get the directory where file will be saved
    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        directory = "."; // Current directory
    }

    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries
        logWarning("Unable to check disk space for {}: {}", directory.string(), ec.message());
        return true;
    }

    // spaceInfo.available = bytes available to non-privileged process
    std::uintmax_t requiredWithBuffer = requiredBytes + (requiredBytes / 10);
    if (spaceInfo.available < requiredWithBuffer)
    {
        logWarning("Insufficient disk space in {}: need {} (+ 10% buffer) but only {} available",
                   directory.string(), formatBytes(requiredBytes), formatBytes(spaceInfo.available));
        return false;
    }

    return true;
}
