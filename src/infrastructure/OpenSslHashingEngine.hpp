/**
 * @file OpenSslHashingEngine.hpp
 * @brief Hashing engine backed by OpenSSL EVP digests.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/services/IHashingEngine.hpp"

namespace forker::infrastructure {

/**
 * @class OpenSslHashingEngine
 * @brief Streams input through an EVP digest in 1 MiB chunks.
 *
 * A Boost CRC-32 is accumulated in the same pass and attached to the
 * result as a quick-check value for logs.
 */
class OpenSslHashingEngine : public domain::IHashingEngine {
public:
    static constexpr std::size_t kChunkSize = 1024 * 1024;

    /**
     * @param algorithm "sha256" or "sha512".
     * @throws std::invalid_argument for any other name.
     */
    explicit OpenSslHashingEngine(std::string algorithm = "sha256");

    std::string algorithm() const override { return m_algorithm; }
    domain::Digest digest(std::istream& in, const domain::StepContext& ctx) override;
    domain::Digest digestFile(const std::filesystem::path& path, const domain::StepContext& ctx) override;
    domain::Digest digestFileWith(const std::string& algorithm,
                                  const std::filesystem::path& path,
                                  const domain::StepContext& ctx) override;
    domain::Digest digestText(const std::string& text) override;

private:
    std::string m_algorithm;
};

} // namespace forker::infrastructure
