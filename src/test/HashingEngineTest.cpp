#include <atomic>
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "domain/ReplicationErrors.hpp"
#include "infrastructure/OpenSslHashingEngine.hpp"
#include "TestSupport.hpp"

using namespace forker::domain;
using forker::infrastructure::OpenSslHashingEngine;

int main() {
    std::cout << "[Test] Starting Hashing Engine Test..." << std::endl;

    OpenSslHashingEngine sha256("sha256");
    OpenSslHashingEngine sha512("sha512");

    // Known vectors
    assert(sha256.digestText("abc").hex() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(sha256.digestText("").hex() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(sha512.digestText("abc").hex() ==
           "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
           "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    Digest abc = sha256.digestText("abc");
    assert(abc.algorithm == "sha256");
    assert(abc.quickCheckCrc32 && *abc.quickCheckCrc32 == 0x352441C2u);
    std::cout << "[PASS] SHA-256, SHA-512 and CRC-32 known vectors." << std::endl;

    bool rejected = false;
    try {
        OpenSslHashingEngine md5("md5");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Unsupported algorithm rejected." << std::endl;

    // Digest equality ignores the quick-check value but not the algorithm.
    Digest copy = abc;
    copy.quickCheckCrc32.reset();
    assert(copy == abc);
    Digest parsed = Digest::FromHex("sha256", abc.hex());
    assert(parsed == abc);
    Digest otherAlgo = abc;
    otherAlgo.algorithm = "sha512";
    assert(otherAlgo != abc);
    std::cout << "[PASS] Digest comparison." << std::endl;

    forker::test::ScratchDir dir("hashing");

    // Multi-chunk file: stream digest equals whole-text digest.
    std::string big = forker::test::Pattern(OpenSslHashingEngine::kChunkSize * 2 + 123);
    auto bigPath = dir.path() / "big.bin";
    forker::test::WriteFile(bigPath, big);
    Digest fromFile = sha256.digestFile(bigPath, StepContext::Unbounded());
    assert(fromFile == sha256.digestText(big));
    std::cout << "[PASS] Chunked file digest matches in-memory digest." << std::endl;

    // A recorded algorithm overrides the configured one.
    Digest recorded = sha512.digestFile(bigPath, StepContext::Unbounded());
    Digest reverified = sha256.digestFileWith("sha512", bigPath, StepContext::Unbounded());
    assert(reverified.algorithm == "sha512");
    assert(reverified == recorded);
    assert(sha256.algorithm() == "sha256");
    rejected = false;
    try {
        sha256.digestFileWith("md5", bigPath, StepContext::Unbounded());
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] File digest under a recorded algorithm." << std::endl;

    // Any single-byte change is detected.
    std::string flipped = big;
    flipped[OpenSslHashingEngine::kChunkSize + 7] ^= 0x01;
    assert(sha256.digestText(flipped) != fromFile);
    std::cout << "[PASS] Single-bit change detected." << std::endl;

    // Symbolic links are refused.
    auto link = dir.path() / "link.bin";
    std::filesystem::create_symlink(bigPath, link);
    bool refused = false;
    try {
        sha256.digestFile(link, StepContext::Unbounded());
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    refused = false;
    try {
        sha256.digestFileWith("sha512", link, StepContext::Unbounded());
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);
    refused = false;
    try {
        sha256.digestFile(dir.path(), StepContext::Unbounded());
    } catch (const PathPolicyViolation&) {
        refused = true;
    }
    assert(refused);

    bool missing = false;
    try {
        sha256.digestFile(dir.path() / "absent.bin", StepContext::Unbounded());
    } catch (const TransientIOError&) {
        missing = true;
    }
    assert(missing);
    std::cout << "[PASS] Links refused, missing file is transient." << std::endl;

    // Cancellation between chunks
    std::atomic<bool> hardStop{true};
    std::atomic<bool> shutdown{false};
    StepContext stopped(StepContext::Clock::now() + std::chrono::hours(1), &hardStop, &shutdown);
    bool abandoned = false;
    try {
        sha256.digestFile(bigPath, stopped);
    } catch (const StepAbandonedError&) {
        abandoned = true;
    }
    assert(abandoned);

    hardStop = false;
    shutdown = true;
    // Shutdown alone does not stop a plain context...
    assert(sha256.digestFile(bigPath, stopped) == fromFile);
    // ...but does stop one that abandons on shutdown.
    abandoned = false;
    try {
        sha256.digestFile(bigPath, stopped.abandoningOnShutdown());
    } catch (const StepAbandonedError&) {
        abandoned = true;
    }
    assert(abandoned);

    StepContext expired(StepContext::Clock::now() - std::chrono::milliseconds(1), nullptr, nullptr);
    abandoned = false;
    try {
        sha256.digestFile(bigPath, expired);
    } catch (const StepAbandonedError&) {
        abandoned = true;
    }
    assert(abandoned);
    std::cout << "[PASS] Hard stop, shutdown and deadline abandon hashing." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
