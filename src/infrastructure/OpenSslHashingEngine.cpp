/**
 * @file OpenSslHashingEngine.cpp
 * @brief Implementation of OpenSslHashingEngine.
 */

#include "infrastructure/OpenSslHashingEngine.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/crc.hpp>
#include <openssl/evp.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace forker::infrastructure {

using namespace forker::domain;

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

const EVP_MD* ResolveDigest(const std::string& algorithm) {
    if (algorithm == "sha256") return EVP_sha256();
    if (algorithm == "sha512") return EVP_sha512();
    return nullptr;
}

/// One EVP digest plus the CRC-32 quick check, fed chunk by chunk.
class Hasher {
public:
    explicit Hasher(const std::string& algorithm)
        : m_algorithm(algorithm), m_ctx(EVP_MD_CTX_new()) {
        const EVP_MD* md = ResolveDigest(algorithm);
        if (!md) throw std::invalid_argument("Unsupported hash algorithm: " + algorithm);
        if (!m_ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
        if (EVP_DigestInit_ex(m_ctx.get(), md, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void update(const char* data, std::size_t size) {
        if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        m_crc.process_bytes(data, size);
    }

    Digest finish() {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(m_ctx.get(), out, &outLen) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        Digest d;
        d.algorithm = m_algorithm;
        d.bytes.assign(out, out + outLen);
        d.quickCheckCrc32 = m_crc.checksum();
        return d;
    }

private:
    std::string m_algorithm;
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> m_ctx;
    boost::crc_32_type m_crc;
};

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() {
        if (m_fd >= 0) ::close(m_fd);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    int get() const { return m_fd; }

private:
    int m_fd;
};

} // namespace

OpenSslHashingEngine::OpenSslHashingEngine(std::string algorithm)
    : m_algorithm(std::move(algorithm)) {
    if (!ResolveDigest(m_algorithm)) {
        throw std::invalid_argument("Unsupported hash algorithm: " + m_algorithm);
    }
}

Digest OpenSslHashingEngine::digest(std::istream& in, const StepContext& ctx) {
    Hasher hasher(m_algorithm);
    std::vector<char> buffer(kChunkSize);

    while (in) {
        ctx.throwIfAbandoned("hash");
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0) hasher.update(buffer.data(), static_cast<std::size_t>(n));
    }
    if (in.bad()) {
        throw TransientIOError("Read error while hashing");
    }
    return hasher.finish();
}

Digest OpenSslHashingEngine::digestFile(const std::filesystem::path& path, const StepContext& ctx) {
    return digestFileWith(m_algorithm, path, ctx);
}

Digest OpenSslHashingEngine::digestFileWith(const std::string& algorithm,
                                            const std::filesystem::path& path,
                                            const StepContext& ctx) {
    Hasher hasher(algorithm);

    // O_NOFOLLOW plus fstat: the checked file is the one that gets read.
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK));
    if (fd.get() < 0) {
        if (errno == ELOOP) throw PathPolicyViolation("Refusing to hash a symbolic link");
        throw TransientIOError(std::string("Cannot open file to hash: ") + std::strerror(errno));
    }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        throw TransientIOError(std::string("Cannot stat file to hash: ") + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw PathPolicyViolation("Refusing to hash a non-regular file");
    }

    std::vector<char> buffer(kChunkSize);
    for (;;) {
        ctx.throwIfAbandoned("hash");
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransientIOError(std::string("Read error while hashing: ") + std::strerror(errno));
        }
        if (n == 0) break;
        hasher.update(buffer.data(), static_cast<std::size_t>(n));
    }
    return hasher.finish();
}

Digest OpenSslHashingEngine::digestText(const std::string& text) {
    std::istringstream in(text);
    return digest(in, StepContext::Unbounded());
}

} // namespace forker::infrastructure
