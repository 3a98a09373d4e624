/**
 * @file LocalCopyEngine.cpp
 * @brief Implementation of LocalCopyEngine.
 */

#include "infrastructure/LocalCopyEngine.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "domain/ReplicationErrors.hpp"

namespace forker::infrastructure {

namespace fs = std::filesystem;
using namespace forker::domain;

namespace {

std::string ErrnoText(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

/// Owns a POSIX file descriptor.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() {
        if (m_fd >= 0) ::close(m_fd);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    /** @brief Closes explicitly so that a deferred write error is not lost. */
    int close() {
        int rc = ::close(m_fd);
        m_fd = -1;
        return rc;
    }

private:
    int m_fd;
};

/// Removes a partially written staging file unless the stage committed.
class StagingGuard {
public:
    explicit StagingGuard(fs::path path) : m_path(std::move(path)) {}
    ~StagingGuard() {
        if (!m_committed) {
            std::error_code ec;
            fs::remove(m_path, ec);
        }
    }
    void commit() { m_committed = true; }

private:
    fs::path m_path;
    bool m_committed = false;
};

/**
 * @return False if nothing exists at @p path.
 * @throws TransientIOError for any other lstat failure.
 */
bool LStat(const fs::path& path, struct stat& st) {
    if (::lstat(path.c_str(), &st) == 0) return true;
    if (errno == ENOENT || errno == ENOTDIR) return false;
    throw TransientIOError(ErrnoText("lstat failed", errno));
}

void SyncDirectory(const fs::path& dir) {
    FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) {
        throw TransientIOError(ErrnoText("Cannot open directory for fsync", errno));
    }
    if (::fsync(fd.get()) != 0) {
        throw TransientIOError(ErrnoText("Directory fsync failed", errno));
    }
}

/// Destination roots and the staging directory must be real directories, not links.
void RequireDirectory(const fs::path& dir, const char* what) {
    struct stat st{};
    if (!LStat(dir, st)) {
        throw TransientIOError(std::string(what) + " is unavailable");
    }
    if (S_ISLNK(st.st_mode)) {
        throw PathPolicyViolation(std::string(what) + " is a symbolic link");
    }
    if (!S_ISDIR(st.st_mode)) {
        throw PathPolicyViolation(std::string(what) + " is not a directory");
    }
}

void WriteAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransientIOError(ErrnoText("Write to staging file failed", errno));
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool SameFile(const struct stat& a, const struct stat& b) {
    return a.st_dev == b.st_dev && a.st_ino == b.st_ino;
}

/// Same nanosecond mtime the source scanner records.
SourceIdentity IdentityOf(const struct stat& st) {
    SourceIdentity id;
    id.sizeBytes = static_cast<std::uintmax_t>(st.st_size);
    id.modifiedAtNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    return id;
}

void UnlinkStaged(const fs::path& stagedPath) {
    if (::unlink(stagedPath.c_str()) != 0 && errno != ENOENT) {
        throw TransientIOError(ErrnoText("Cannot remove staged name after publish", errno));
    }
}

} // namespace

fs::path LocalCopyEngine::stagingPathFor(const fs::path& destinationRoot, const std::string& stagingName) const {
    return destinationRoot / kStagingDirName / (stagingName + kStagingSuffix);
}

StageResult LocalCopyEngine::stage(const fs::path& sourcePath,
                                   const fs::path& destinationRoot,
                                   const std::string& stagingName,
                                   const StepContext& ctx) {
    struct stat st{};
    if (!LStat(sourcePath, st)) {
        throw TransientIOError("Source file is missing");
    }
    if (S_ISLNK(st.st_mode)) {
        throw PathPolicyViolation("Source is a symbolic link");
    }
    if (!S_ISREG(st.st_mode)) {
        throw PathPolicyViolation("Source is not a regular file");
    }

    RequireDirectory(destinationRoot, "Destination root");
    fs::path stagingDir = destinationRoot / kStagingDirName;
    if (::mkdir(stagingDir.c_str(), 0750) != 0 && errno != EEXIST) {
        throw TransientIOError(ErrnoText("Cannot create staging directory", errno));
    }
    RequireDirectory(stagingDir, "Staging directory");

    FileDescriptor in(::open(sourcePath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!in.valid()) {
        if (errno == ELOOP) throw PathPolicyViolation("Source is a symbolic link");
        throw TransientIOError(ErrnoText("Cannot open source", errno));
    }

    StageResult result;
    result.stagedPath = stagingPathFor(destinationRoot, stagingName);

    FileDescriptor out(::open(result.stagedPath.c_str(),
                              O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0640));
    if (!out.valid()) {
        if (errno == ELOOP) throw PathPolicyViolation("Staging file is a symbolic link");
        throw TransientIOError(ErrnoText("Cannot create staging file", errno));
    }
    StagingGuard guard(result.stagedPath);

    std::vector<char> buffer(kCopyBufferSize);
    while (true) {
        ctx.throwIfAbandoned("stage");
        ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransientIOError(ErrnoText("Read from source failed", errno));
        }
        if (n == 0) break;
        WriteAll(out.get(), buffer.data(), static_cast<size_t>(n));
        result.bytesCopied += static_cast<std::uintmax_t>(n);
    }

    if (::fsync(out.get()) != 0) {
        throw TransientIOError(ErrnoText("fsync of staging file failed", errno));
    }
    if (out.close() != 0) {
        throw TransientIOError(ErrnoText("close of staging file failed", errno));
    }
    SyncDirectory(stagingDir);

    guard.commit();
    return result;
}

PublishOutcome LocalCopyEngine::publish(const fs::path& stagedPath, const fs::path& finalPath) {
    struct stat stagedSt{};
    struct stat finalSt{};
    bool stagedPresent = LStat(stagedPath, stagedSt);
    bool finalPresent = LStat(finalPath, finalSt);

    if (finalPresent && S_ISLNK(finalSt.st_mode)) {
        throw PathPolicyViolation("Final name is a symbolic link");
    }

    if (!stagedPresent) {
        if (finalPresent && S_ISREG(finalSt.st_mode)) {
            // An earlier publish completed before its state write.
            return PublishOutcome::AlreadyPublished;
        }
        throw TransientIOError("Staged file is missing and the final name is absent");
    }
    if (S_ISLNK(stagedSt.st_mode)) {
        throw PathPolicyViolation("Staged file is a symbolic link");
    }
    if (finalPresent) {
        if (SameFile(stagedSt, finalSt)) {
            // Linked but not yet unlinked when the last publish was interrupted.
            UnlinkStaged(stagedPath);
            return PublishOutcome::AlreadyPublished;
        }
        throw PathPolicyViolation("Final name is already taken, refusing to overwrite");
    }

    fs::path finalDir = finalPath.parent_path();
    RequireDirectory(finalDir, "Final directory");
    struct stat dirSt{};
    if (!LStat(finalDir, dirSt)) {
        throw TransientIOError("Final directory disappeared before publish");
    }
    if (dirSt.st_dev != stagedSt.st_dev) {
        throw CrossVolumeRenameError("Staging area and final directory are on different filesystems");
    }

    if (::link(stagedPath.c_str(), finalPath.c_str()) == 0) {
        UnlinkStaged(stagedPath);
    } else {
        int err = errno;
        if (err == EEXIST) {
            throw PathPolicyViolation("Final name appeared during publish, refusing to overwrite");
        }
        if (err == EXDEV) {
            throw CrossVolumeRenameError("link crossed a filesystem boundary");
        }
        if (err != EPERM && err != EOPNOTSUPP && err != ENOSYS) {
            throw TransientIOError(ErrnoText("link failed", err));
        }
        // No hard links on this file system: check again and rename.
        if (LStat(finalPath, finalSt)) {
            throw PathPolicyViolation("Final name appeared during publish, refusing to overwrite");
        }
        if (::rename(stagedPath.c_str(), finalPath.c_str()) != 0) {
            if (errno == EXDEV) {
                throw CrossVolumeRenameError("rename crossed a filesystem boundary");
            }
            throw TransientIOError(ErrnoText("rename failed", errno));
        }
    }

    SyncDirectory(finalDir);
    if (stagedPath.parent_path() != finalDir) {
        SyncDirectory(stagedPath.parent_path());
    }
    return PublishOutcome::Published;
}

void LocalCopyEngine::removeStaged(const fs::path& stagedPath) {
    struct stat st{};
    if (!LStat(stagedPath, st)) return;
    if (::unlink(stagedPath.c_str()) != 0 && errno != ENOENT) {
        throw TransientIOError(ErrnoText("Cannot remove staging file", errno));
    }
}

SourceCleanup LocalCopyEngine::deleteSource(const fs::path& sourcePath, const SourceIdentity& admitted) {
    struct stat st{};
    if (!LStat(sourcePath, st)) return SourceCleanup::AlreadyGone;
    if (S_ISLNK(st.st_mode)) {
        throw PathPolicyViolation("Source is a symbolic link");
    }
    if (!S_ISREG(st.st_mode) || IdentityOf(st) != admitted) {
        return SourceCleanup::Replaced;
    }
    if (::unlink(sourcePath.c_str()) != 0) {
        if (errno == ENOENT) return SourceCleanup::AlreadyGone;
        throw TransientIOError(ErrnoText("Cannot delete source", errno));
    }
    SyncDirectory(sourcePath.parent_path());
    return SourceCleanup::Removed;
}

std::optional<SourceIdentity> LocalCopyEngine::identify(const fs::path& path) const {
    struct stat st{};
    if (!LStat(path, st) || !S_ISREG(st.st_mode)) return std::nullopt;
    return IdentityOf(st);
}

std::size_t LocalCopyEngine::cleanupOrphans(const fs::path& destinationRoot, const std::set<std::string>& keep) {
    fs::path stagingDir = destinationRoot / kStagingDirName;
    struct stat st{};
    if (!LStat(stagingDir, st) || !S_ISDIR(st.st_mode)) {
        return 0;
    }

    std::size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(stagingDir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        std::string name = p.filename().string();
        if (!EndsWith(name, kStagingSuffix) || keep.count(name) > 0) continue;

        std::error_code statEc;
        if (!fs::is_regular_file(it->symlink_status(statEc)) || statEc) continue;

        std::error_code rmEc;
        if (fs::remove(p, rmEc)) {
            ++removed;
        } else if (rmEc) {
            std::cerr << "[LocalCopyEngine] Cannot remove orphaned staging file " << name
                      << ": " << rmEc.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[LocalCopyEngine] Orphan scan of " << stagingDir << " stopped: " << ec.message() << std::endl;
    }
    if (removed > 0) {
        SyncDirectory(stagingDir);
        std::cout << "[LocalCopyEngine] Removed " << removed << " orphaned staging file(s) under "
                  << destinationRoot << std::endl;
    }
    return removed;
}

bool LocalCopyEngine::pathExists(const fs::path& path) const {
    struct stat st{};
    return LStat(path, st);
}

} // namespace forker::infrastructure
