#include "manifest.hpp"
#include "checksum.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

bool isSupportedUrl(const std::string &url)
{
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::vector<TransferSpec> parseManifest(std::istream &input)
{
    std::vector<TransferSpec> specs;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(input, line))
    {
        ++lineNumber;

        std::istringstream fields(line);
        std::string url;
        if (!(fields >> url) || url[0] == '#')
        {
            continue;
        }

        std::string destination;
        if (!(fields >> destination))
        {
            throw std::runtime_error(
                fmt::format("Manifest line {}: missing destination for {}", lineNumber, url));
        }
        if (!isSupportedUrl(url))
        {
            throw std::runtime_error(
                fmt::format("Manifest line {}: URL must start with http:// or https://", lineNumber));
        }

        TransferSpec spec;
        spec.sourceUrl = url;
        spec.destinationPath = destination;

        std::string checksum;
        if (fields >> checksum)
        {
            try
            {
                auto [algorithm, hexHash] = ChecksumVerifier::parseChecksum(checksum);
                spec.digestAlgorithm = algorithm;
                spec.expectedDigest = hexHash;
            }
            catch (const std::runtime_error &e)
            {
                throw std::runtime_error(fmt::format("Manifest line {}: {}", lineNumber, e.what()));
            }
        }

        std::string extra;
        if (fields >> extra)
        {
            throw std::runtime_error(
                fmt::format("Manifest line {}: unexpected field '{}'", lineNumber, extra));
        }

        specs.push_back(std::move(spec));
    }

    return specs;
}

std::vector<TransferSpec> loadManifest(const std::filesystem::path &manifestPath)
{
    std::ifstream file(manifestPath);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open manifest: {}", manifestPath.string()));
    }
    return parseManifest(file);
}
