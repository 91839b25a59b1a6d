#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

class CancellationToken;

/**
 * File integrity verification using cryptographic hashes.
 * Supports MD5, SHA-1, SHA-256 and SHA-512 through the OpenSSL EVP API.
 */
class ChecksumVerifier
{
public:
    /**
     * Supported hash algorithms.
     */
    enum class Algorithm
    {
        MD5,
        SHA1,
        SHA256,
        SHA512
    };

    /**
     * Compute the digest of a file.
     * Reads file in chunks so memory use does not grow with file size.
     *
     * @param filePath Path to file to hash
     * @param algorithm Digest kind
     * @param chunkSize Read size per iteration
     * @param cancel Optional token checked between chunks
     * @return Lower-case hex digest
     * @throws std::runtime_error if file cannot be read
     * @throws OperationCancelled if the token fires before the digest is complete
     */
    static std::string computeDigest(const std::filesystem::path &filePath,
                                     Algorithm algorithm,
                                     std::size_t chunkSize = CHUNK_SIZE,
                                     const CancellationToken *cancel = nullptr);

    /**
     * Compute SHA-256 hash of a file.
     */
    static std::string computeSHA256(const std::filesystem::path &filePath);

    /**
     * Verify a file against an expected hex digest (case-insensitive).
     *
     * @return true if checksums match, false otherwise
     * @throws std::runtime_error if the file cannot be read or the digest is malformed
     * @throws OperationCancelled if cancelled mid-computation
     */
    static bool verify(const std::filesystem::path &filePath,
                       Algorithm algorithm,
                       const std::string &expectedHex,
                       std::size_t chunkSize = CHUNK_SIZE,
                       const CancellationToken *cancel = nullptr);

    /**
     * Verify a file matches an expected checksum.
     *
     * @param filePath Path to file to verify
     * @param expectedChecksum Expected hash in format "algorithm:hexhash"
     *                         Example: "sha256:abc123..."
     * @return true if checksums match, false otherwise
     * @throws std::runtime_error if format is invalid or algorithm unsupported
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Parse checksum string into algorithm and hash.
     * Format: "algorithm:hexhash"
     *
     * @param checksumStr Input string (e.g., "sha256:abc123...")
     * @return Pair of (algorithm, normalized hex hash)
     * @throws std::runtime_error if format is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

    /**
     * Map a name such as "sha256" or "SHA-256" to an algorithm.
     * @throws std::runtime_error for unknown names
     */
    static Algorithm parseAlgorithm(const std::string &name);

    static std::string algorithmName(Algorithm algorithm);

    /**
     * Number of hex characters in a digest of this kind.
     */
    static std::size_t hexLength(Algorithm algorithm);

    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);

    // Default chunk size for file reading (64 KB)
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);
};
