#include "transfer_spec.hpp"

#include <cstring>

namespace
{
    constexpr const char *RESERVED_CHARACTERS = "<>:\"/\\|?*";
    constexpr char REPLACEMENT_CHARACTER = '_';
}

std::filesystem::path sanitizeDestination(const std::filesystem::path &destination)
{
    std::string name = destination.filename().string();
    for (char &ch : name)
    {
        if (ch != '\0' && std::strchr(RESERVED_CHARACTERS, ch) != nullptr)
        {
            ch = REPLACEMENT_CHARACTER;
        }
    }

    std::filesystem::path sanitized = destination;
    sanitized.replace_filename(name);
    return sanitized;
}

std::filesystem::path workingPathFor(const std::filesystem::path &destination)
{
    // Simply append ".part" to the filename
    std::filesystem::path partPath = destination;
    partPath += WORKING_FILE_SUFFIX;
    return partPath;
}

std::string taskLabelFor(const TransferSpec &spec)
{
    std::filesystem::path destination = sanitizeDestination(spec.destinationPath);
    std::filesystem::path parent = destination.parent_path().filename();
    if (parent.empty() || parent == "." || parent == "..")
    {
        return destination.filename().string();
    }
    // "a/data.bin" and "b/data.bin" must not share a progress line
    return (parent / destination.filename()).generic_string();
}
