#include "checksum.hpp"
#include "cancellation.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

// OpenSSL EVP digests
#include <openssl/evp.h>

namespace
{
    const EVP_MD *evpDigest(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::MD5:
            return EVP_md5();
        case ChecksumVerifier::Algorithm::SHA1:
            return EVP_sha1();
        case ChecksumVerifier::Algorithm::SHA256:
            return EVP_sha256();
        case ChecksumVerifier::Algorithm::SHA512:
            return EVP_sha512();
        }
        throw std::runtime_error("Unsupported digest algorithm");
    }
}

std::string ChecksumVerifier::computeDigest(const std::filesystem::path &filePath,
                                            Algorithm algorithm,
                                            std::size_t chunkSize,
                                            const CancellationToken *cancel)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), evpDigest(algorithm), nullptr) != 1)
    {
        throw std::runtime_error(
            fmt::format("Failed to initialize {} digest", algorithmName(algorithm)));
    }

    // Memory stays bounded by one chunk; cancellation is polled between reads
    std::vector<char> buffer(chunkSize > 0 ? chunkSize : CHUNK_SIZE);

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        if (cancel && cancel->isCancelled())
        {
            throw OperationCancelled();
        }

        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error(
                fmt::format("Failed to update {} digest", algorithmName(algorithm)));
        }
    }

    if (file.bad())
    {
        throw std::runtime_error(
            fmt::format("Read error while hashing: {}", filePath.string()));
    }

    if (cancel && cancel->isCancelled())
    {
        throw OperationCancelled();
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(
            fmt::format("Failed to finalize {} digest", algorithmName(algorithm)));
    }

    std::vector<unsigned char> hashVector(hash, hash + hashLength);
    return toHex(hashVector);
}

std::string ChecksumVerifier::computeSHA256(const std::filesystem::path &filePath)
{
    return computeDigest(filePath, Algorithm::SHA256);
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              Algorithm algorithm,
                              const std::string &expectedHex,
                              std::size_t chunkSize,
                              const CancellationToken *cancel)
{
    std::string normalizedExpected = normalizeHex(expectedHex);
    std::string actualChecksum = computeDigest(filePath, algorithm, chunkSize, cancel);

    return normalizedExpected == actualChecksum;
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              const std::string &expectedChecksum)
{
    // Parse the checksum string to get algorithm and hash
    auto [algorithm, expectedHash] = parseChecksum(expectedChecksum);

    return verify(filePath, algorithm, expectedHash);
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    // Expected format: "algorithm:hexhash"
    // Example: "sha256:abc123..."

    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::string hexHash = checksumString.substr(colonPos + 1);

    Algorithm algorithm = parseAlgorithm(algorithmStr);

    // Normalize the hex string
    std::string normalizedHex = normalizeHex(hexHash);

    // Validate length based on algorithm
    size_t expectedLength = hexLength(algorithm);
    if (normalizedHex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmName(algorithm), expectedLength, normalizedHex.length()));
    }

    return {algorithm, normalizedHex};
}

ChecksumVerifier::Algorithm ChecksumVerifier::parseAlgorithm(const std::string &name)
{
    // Lowercase and drop dashes so "SHA-256" and "sha256" both match
    std::string key;
    for (char ch : name)
    {
        if (ch == '-' || std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (key == "md5")
    {
        return Algorithm::MD5;
    }
    else if (key == "sha1")
    {
        return Algorithm::SHA1;
    }
    else if (key == "sha256")
    {
        return Algorithm::SHA256;
    }
    else if (key == "sha512")
    {
        return Algorithm::SHA512;
    }

    throw std::runtime_error(
        fmt::format("Unsupported algorithm: '{}'", name));
}

std::string ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::MD5:
        return "md5";
    case Algorithm::SHA1:
        return "sha1";
    case Algorithm::SHA256:
        return "sha256";
    case Algorithm::SHA512:
        return "sha512";
    }
    return "unknown";
}

std::size_t ChecksumVerifier::hexLength(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::MD5:
        return 32; // 128 bits / 4 bits per hex digit
    case Algorithm::SHA1:
        return 40; // 160 bits / 4
    case Algorithm::SHA256:
        return 64; // 256 bits / 4
    case Algorithm::SHA512:
        return 128; // 512 bits / 4
    }
    return 0;
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }

        // Keep only hex digits
        if (std::isxdigit(uch))
        {
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
