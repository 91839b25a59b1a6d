#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "transfer_spec.hpp"

/**
 * Parse a batch manifest, one transfer per line:
 *
 *     URL DESTINATION [algorithm:hexhash]
 *
 * Blank lines and lines starting with '#' are ignored.
 *
 * @param input Manifest text
 * @return Transfers in file order
 * @throws std::runtime_error naming the line number of the first malformed line
 */
std::vector<TransferSpec> parseManifest(std::istream &input);

/**
 * Read and parse a manifest file.
 * @throws std::runtime_error if the file cannot be opened or is malformed
 */
std::vector<TransferSpec> loadManifest(const std::filesystem::path &manifestPath);

/**
 * Check that a URL uses a scheme the transport supports (http or https).
 */
bool isSupportedUrl(const std::string &url);
