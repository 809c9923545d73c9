#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace voicegate {
namespace core {

enum class WaitStatus {
    SATISFIED,
    TIMED_OUT,
    FAILED      // the predicate or the pump threw
};

struct WaitResult {
    WaitStatus status = WaitStatus::TIMED_OUT;
    int64_t elapsedMs = 0;
    size_t pumpCalls = 0;
    std::string description;

    bool satisfied() const { return status == WaitStatus::SATISFIED; }
    bool failed() const { return status == WaitStatus::FAILED; }
};

/**
 * Bounded polling loop for drivers feeding an engine on the same thread.
 *
 * Between predicate checks the driver's pump is called so it can feed
 * pending records. A pump returning false has nothing to deliver and the
 * waiter sleeps for the poll interval. Timing out is a normal result,
 * never an exception.
 */
class ConditionWaiter {
public:
    using Predicate = std::function<bool()>;
    using Pump = std::function<bool()>;
    using Clock = std::function<int64_t()>;
    using Sleeper = std::function<void(int64_t)>;

    ConditionWaiter();
    ConditionWaiter(Clock clock, Sleeper sleeper);

    WaitResult waitFor(const Predicate& predicate,
                       const Pump& pump,
                       int64_t timeoutMs,
                       int64_t pollIntervalMs = 50,
                       const std::string& description = "condition") const;

    static int64_t steadyNowMs();

private:
    Clock clock_;
    Sleeper sleeper_;
};

std::string waitStatusToString(WaitStatus status);

} // namespace core
} // namespace voicegate
