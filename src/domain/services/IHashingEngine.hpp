/**
 * @file IHashingEngine.hpp
 * @brief Interface for streaming content digests.
 */

#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "domain/Digest.hpp"
#include "domain/services/StepContext.hpp"

namespace forker::domain {

/**
 * @class IHashingEngine
 * @brief Computes digests with bounded memory, whatever the input size.
 */
class IHashingEngine {
public:
    virtual ~IHashingEngine() = default;

    /** @brief Name of the configured algorithm ("sha256", "sha512"). */
    virtual std::string algorithm() const = 0;

    /**
     * @brief Digests a stream in fixed-size chunks.
     * @throws TransientIOError on read failure, StepAbandonedError when the context says stop.
     */
    virtual Digest digest(std::istream& in, const StepContext& ctx) = 0;

    /** @brief Digests a regular file. Symbolic links are refused with PathPolicyViolation. */
    virtual Digest digestFile(const std::filesystem::path& path, const StepContext& ctx) = 0;

    /**
     * @brief Like digestFile, but with a named algorithm instead of the configured one.
     * Used to re-check content against a digest recorded under an older configuration.
     * @throws std::invalid_argument for an unsupported algorithm.
     */
    virtual Digest digestFileWith(const std::string& algorithm,
                                  const std::filesystem::path& path,
                                  const StepContext& ctx) = 0;

    virtual Digest digestText(const std::string& text) = 0;
};

} // namespace forker::domain
