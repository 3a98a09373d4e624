#include <cassert>
#include <iostream>

#include "application/RetryPolicy.hpp"

using forker::application::RetryPolicy;
using forker::application::RetrySettings;
using std::chrono::milliseconds;

int main() {
    std::cout << "[Test] Starting Retry Policy Test..." << std::endl;

    RetrySettings settings;
    settings.maxAttempts = 3;
    settings.baseDelay = milliseconds(100);
    settings.backoffMultiplier = 2.0;
    settings.maxDelay = milliseconds(1000);
    settings.jitterFactor = 0.0;

    // Exact exponential progression without jitter, capped at the maximum
    RetryPolicy exact(settings, 1);
    assert(exact.delayAfter(1) == milliseconds(100));
    assert(exact.delayAfter(2) == milliseconds(200));
    assert(exact.delayAfter(3) == milliseconds(400));
    assert(exact.delayAfter(4) == milliseconds(800));
    assert(exact.delayAfter(5) == milliseconds(1000));
    assert(exact.delayAfter(30) == milliseconds(1000));
    std::cout << "[PASS] base * multiplier^(n-1), capped." << std::endl;

    // Budget
    assert(!exact.isExhausted(0));
    assert(!exact.isExhausted(2));
    assert(exact.isExhausted(3));
    assert(exact.isExhausted(4));
    assert(exact.maxAttempts() == 3);
    std::cout << "[PASS] Retry budget." << std::endl;

    // Jitter stays inside +/- factor and never exceeds the cap
    settings.jitterFactor = 0.25;
    RetryPolicy jittered(settings, 42);
    bool sawDifferent = false;
    milliseconds first = jittered.delayAfter(2);
    for (int i = 0; i < 500; ++i) {
        milliseconds d = jittered.delayAfter(2);
        assert(d >= milliseconds(150) && d <= milliseconds(250));
        if (d != first) sawDifferent = true;

        milliseconds capped = jittered.delayAfter(10);
        assert(capped >= milliseconds(750) && capped <= milliseconds(1000));
    }
    assert(sawDifferent);
    std::cout << "[PASS] Jitter bounded and varied." << std::endl;

    // Same seed, same sequence
    RetryPolicy a(settings, 7);
    RetryPolicy b(settings, 7);
    for (int n = 1; n <= 6; ++n) {
        assert(a.delayAfter(n) == b.delayAfter(n));
    }
    std::cout << "[PASS] Deterministic for a fixed seed." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
