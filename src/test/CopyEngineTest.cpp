#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>

#include "domain/ReplicationErrors.hpp"
#include "infrastructure/LocalCopyEngine.hpp"
#include "TestSupport.hpp"

using namespace forker::domain;
using forker::infrastructure::LocalCopyEngine;
using forker::test::ReadFile;
using forker::test::WriteFile;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Copy Engine Test..." << std::endl;

    forker::test::ScratchDir dir("copy");
    fs::path source = dir.sub("source");
    fs::path primary = dir.sub("primary");

    LocalCopyEngine engine;
    std::string content = forker::test::Pattern(LocalCopyEngine::kCopyBufferSize + 4097);
    fs::path src = source / "sample.raw";
    WriteFile(src, content);

    // 1. Stage: byte-for-byte copy inside the destination root
    StageResult staged = engine.stage(src, primary, "job1.primary", StepContext::Unbounded());
    assert(staged.stagedPath == engine.stagingPathFor(primary, "job1.primary"));
    assert(staged.stagedPath.parent_path() == primary / LocalCopyEngine::kStagingDirName);
    assert(staged.bytesCopied == content.size());
    assert(ReadFile(staged.stagedPath) == content);
    assert(ReadFile(src) == content); // source untouched
    std::cout << "[PASS] Staged copy is complete and lives under the destination root." << std::endl;

    // 2. Publish, then publish again: the second call recognises the completed rename.
    fs::path finalPath = primary / "sample.raw";
    assert(engine.publish(staged.stagedPath, finalPath) == PublishOutcome::Published);
    assert(!engine.pathExists(staged.stagedPath));
    assert(ReadFile(finalPath) == content);
    assert(engine.publish(staged.stagedPath, finalPath) == PublishOutcome::AlreadyPublished);
    std::cout << "[PASS] Publish is atomic and idempotent." << std::endl;

    // 3. Never overwrite an existing final name
    StageResult again = engine.stage(src, primary, "job2.primary", StepContext::Unbounded());
    bool refused = false;
    try {
        engine.publish(again.stagedPath, finalPath);
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    assert(ReadFile(finalPath) == content);
    std::cout << "[PASS] Existing final file is never overwritten." << std::endl;

    // 4. Both staged and final missing is transient
    bool transient = false;
    try {
        engine.publish(primary / "nowhere.forker-tmp", primary / "nowhere.raw");
    } catch (const TransientIOError&) {
        transient = true;
    }
    assert(transient);

    // 5. Symbolic links are refused as sources and as final names
    fs::path link = source / "link.raw";
    fs::create_symlink(src, link);
    refused = false;
    try {
        engine.stage(link, primary, "job3.primary", StepContext::Unbounded());
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    assert(!engine.pathExists(engine.stagingPathFor(primary, "job3.primary")));

    fs::path linkedFinal = primary / "linked.raw";
    fs::create_symlink(src, linkedFinal);
    refused = false;
    try {
        engine.publish(again.stagedPath, linkedFinal);
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    assert(ReadFile(src) == content);
    std::cout << "[PASS] Links are never read or written through." << std::endl;

    // 6. An abandoned stage leaves nothing behind
    std::atomic<bool> hardStop{true};
    StepContext stopped(StepContext::Clock::now() + std::chrono::hours(1), &hardStop, nullptr);
    bool abandoned = false;
    try {
        engine.stage(src, primary, "job4.primary", stopped);
    } catch (const StepAbandonedError&) {
        abandoned = true;
    }
    assert(abandoned);
    assert(!engine.pathExists(engine.stagingPathFor(primary, "job4.primary")));

    bool missing = false;
    try {
        engine.stage(source / "absent.raw", primary, "job5.primary", StepContext::Unbounded());
    } catch (const TransientIOError&) {
        missing = true;
    }
    assert(missing);
    std::cout << "[PASS] Failed stages leave no partial file." << std::endl;

    // 7. Orphan cleanup removes only unowned staging files
    fs::path stagingDir = primary / LocalCopyEngine::kStagingDirName;
    WriteFile(stagingDir / "orphan.primary.forker-tmp", "x");
    WriteFile(stagingDir / "notes.txt", "keep me");
    std::set<std::string> keep = {again.stagedPath.filename().string()};
    assert(engine.cleanupOrphans(primary, keep) == 1);
    assert(engine.pathExists(again.stagedPath));
    assert(engine.pathExists(stagingDir / "notes.txt"));
    assert(!engine.pathExists(stagingDir / "orphan.primary.forker-tmp"));
    assert(engine.cleanupOrphans(dir.sub("research"), {}) == 0);
    std::cout << "[PASS] Orphan cleanup is limited to unowned staging files." << std::endl;

    engine.removeStaged(again.stagedPath);
    assert(!engine.pathExists(again.stagedPath));
    engine.removeStaged(again.stagedPath); // already gone

    // 8. Publish interrupted between link and unlink: both names share one inode.
    StageResult linked = engine.stage(src, primary, "job6.primary", StepContext::Unbounded());
    fs::path linkedPath = primary / "interrupted.raw";
    assert(::link(linked.stagedPath.c_str(), linkedPath.c_str()) == 0);
    assert(engine.publish(linked.stagedPath, linkedPath) == PublishOutcome::AlreadyPublished);
    assert(!engine.pathExists(linked.stagedPath));
    assert(ReadFile(linkedPath) == content);
    std::cout << "[PASS] Interrupted link publish completes without a copy." << std::endl;

    // 9. Source deletion only removes the admitted generation of the file
    std::optional<SourceIdentity> admitted = engine.identify(src);
    assert(admitted && admitted->sizeBytes == content.size());
    assert(!engine.identify(link));
    assert(!engine.identify(source / "absent.raw"));

    SourceIdentity stale = *admitted;
    stale.sizeBytes += 1;
    assert(engine.deleteSource(src, stale) == SourceCleanup::Replaced);
    assert(ReadFile(src) == content);

    assert(engine.deleteSource(src, *admitted) == SourceCleanup::Removed);
    assert(!engine.pathExists(src));
    assert(engine.deleteSource(src, *admitted) == SourceCleanup::AlreadyGone);
    refused = false;
    try {
        engine.deleteSource(link, *admitted);
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    std::cout << "[PASS] Source deletion is idempotent, refuses links and spares replaced files." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
