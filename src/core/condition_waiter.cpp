#include "core/condition_waiter.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace voicegate {
namespace core {

ConditionWaiter::ConditionWaiter()
    : clock_(&ConditionWaiter::steadyNowMs)
    , sleeper_([](int64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }) {
}

ConditionWaiter::ConditionWaiter(Clock clock, Sleeper sleeper)
    : clock_(std::move(clock)), sleeper_(std::move(sleeper)) {
}

int64_t ConditionWaiter::steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

WaitResult ConditionWaiter::waitFor(const Predicate& predicate,
                                    const Pump& pump,
                                    int64_t timeoutMs,
                                    int64_t pollIntervalMs,
                                    const std::string& description) const {
    WaitResult result;
    const int64_t start = clock_();
    const int64_t interval = std::max<int64_t>(1, pollIntervalMs);

    try {
        while (true) {
            if (predicate()) {
                result.status = WaitStatus::SATISFIED;
                break;
            }

            int64_t elapsed = clock_() - start;
            if (elapsed >= timeoutMs) {
                result.status = WaitStatus::TIMED_OUT;
                break;
            }

            bool progressed = false;
            if (pump) {
                progressed = pump();
                result.pumpCalls++;
            }
            if (!progressed) {
                sleeper_(std::min(interval, std::max<int64_t>(1, timeoutMs - elapsed)));
            }
        }
    } catch (const std::exception& e) {
        result.status = WaitStatus::FAILED;
        result.elapsedMs = clock_() - start;
        result.description = "Stopped waiting for " + description + ": " + e.what();
        utils::Logger::error(result.description);
        return result;
    }

    result.elapsedMs = clock_() - start;
    if (result.satisfied()) {
        result.description = description + " satisfied after " + std::to_string(result.elapsedMs) + "ms";
    } else {
        result.description = "Timed out after " + std::to_string(result.elapsedMs) +
                             "ms waiting for " + description;
        utils::Logger::warn(result.description);
    }
    return result;
}

std::string waitStatusToString(WaitStatus status) {
    switch (status) {
        case WaitStatus::SATISFIED: return "SATISFIED";
        case WaitStatus::TIMED_OUT: return "TIMED_OUT";
        case WaitStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace voicegate
