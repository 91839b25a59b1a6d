#include "config.hpp"

#include <stdexcept>

#include <fmt/core.h>

void EngineConfig::validate() const
{
    if (maxConcurrency < 1)
    {
        throw std::invalid_argument("maxConcurrency must be at least 1");
    }
    if (maxRetries < 1)
    {
        throw std::invalid_argument(
            fmt::format("maxRetries must be at least 1, got {}", maxRetries));
    }
    if (backoffUnit.count() < 0)
    {
        throw std::invalid_argument("backoffUnit must not be negative");
    }
    if (timeoutSeconds < 0 || stallTimeoutSeconds < 0 || connectTimeoutSeconds < 0)
    {
        throw std::invalid_argument("timeouts must not be negative");
    }
    if (chunkSize < 1024)
    {
        throw std::invalid_argument(
            fmt::format("chunkSize must be at least 1024 bytes, got {}", chunkSize));
    }
    if (maxRedirects < 0)
    {
        throw std::invalid_argument("maxRedirects must not be negative");
    }
}
