#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 *
 * @param bytes Number of bytes
 * @return Formatted string
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 *
 * @param seconds Duration in seconds (negative means unknown)
 * @return Formatted string
 */
std::string formatDuration(long seconds);

/**
 * Get human-readable HTTP status text for a status code.
 *
 * @param code HTTP status code (e.g., 200, 404, 500)
 * @return Descriptive text for the status code
 */
std::string httpStatusText(long code);
