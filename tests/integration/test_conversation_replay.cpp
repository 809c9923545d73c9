#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/telemetry_engine.hpp"
#include "telemetry/capture_reader.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"
#include <fstream>
#include <random>
#include <thread>

namespace voicegate {
namespace integration {

using core::BargeInOutcome;
using core::TelemetryEngine;
using telemetry::DomainEvent;
using telemetry::RawRecord;
using ::testing::HasSubstr;

namespace {

std::string fixturePath(const std::string& name) {
    return std::string(VOICEGATE_FIXTURES_DIR) + "/" + name;
}

size_t replayFile(TelemetryEngine& engine, const std::string& path) {
    std::ifstream input(path);
    EXPECT_TRUE(input.is_open()) << path;

    telemetry::CaptureReader reader(input);
    RawRecord record;
    size_t records = 0;
    while (reader.next(record)) {
        engine.recordEvent(record);
        ++records;
    }
    return records;
}

} // namespace

class ConversationReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::OFF);
    }

    void TearDown() override {
        utils::Logger::setLevel(utils::LogLevel::INFO);
    }
};

// One uninterrupted turn ended naturally
TEST_F(ConversationReplayTest, SingleNaturalTurn) {
    TelemetryEngine engine;
    engine.recordDomainEvent(DomainEvent::speechStarted(0));
    engine.recordDomainEvent(DomainEvent::transcriptComplete(500, "hello"));
    engine.recordDomainEvent(DomainEvent::responseStarted(700));
    engine.recordDomainEvent(DomainEvent::stateTransition(4200, "speaking", "listening", "natural"));
    engine.recordDomainEvent(DomainEvent::responseComplete(4200));

    ASSERT_EQ(engine.getTurns().size(), 1u);
    const core::Turn& turn = engine.getTurns()[0];
    EXPECT_EQ(turn.transcriptText.value_or(""), "hello");
    EXPECT_DOUBLE_EQ(turn.turnLatencyMs().value_or(-1), 4200);
    EXPECT_FALSE(engine.getBargeInOutcome().confirmed);
}

// The same turn fed as raw log lines
TEST_F(ConversationReplayTest, SingleNaturalTurnFromLogLines) {
    TelemetryEngine engine;
    engine.recordEvent(RawRecord::log(0, "[VAD] Speech started"));
    engine.recordEvent(RawRecord::log(500, "[STT] transcript.complete: \"hello\""));
    engine.recordEvent(RawRecord::log(700, "[ThinkerTalker] Pipeline state: processing -> speaking"));
    engine.recordEvent(RawRecord::log(4200, "[ThinkerTalker] Pipeline state: speaking -> listening reason=natural"));

    ASSERT_EQ(engine.getTurns().size(), 1u);
    EXPECT_EQ(engine.getTurns()[0].transcriptText.value_or(""), "hello");
    EXPECT_DOUBLE_EQ(engine.getTurns()[0].turnLatencyMs().value_or(-1), 4200);
}

// Probes followed by an explicit barge-in transition
TEST_F(ConversationReplayTest, ProbesThenConfirmedBargeIn) {
    TelemetryEngine engine;
    engine.recordDomainEvent(DomainEvent::bargeInProbe(1000, true, 1, false));
    engine.recordDomainEvent(DomainEvent::bargeInProbe(1020, true, 1, true));
    engine.recordDomainEvent(DomainEvent::stateTransition(1100, "speaking", "listening", "barge_in"));

    BargeInOutcome outcome = engine.getBargeInOutcome();
    EXPECT_TRUE(outcome.confirmed);
    EXPECT_TRUE(outcome.attempted);
}

// Median within target, latest measurement far outside it
TEST_F(ConversationReplayTest, BargeInTargetBreach) {
    TelemetryEngine engine;
    for (double sample : {100.0, 120.0, 130.0, 900.0}) {
        ASSERT_TRUE(engine.addLatencySample("bargeIn", sample));
    }

    metrics::TargetResult result = engine.assertTargets("bargeIn", {{"p50", 150}});

    EXPECT_FALSE(result.pass);
    EXPECT_EQ(result.sampleCount, 4u);
    ASSERT_FALSE(result.failures.empty());
    std::string failures;
    for (const auto& failure : result.failures) {
        failures += failure + "\n";
    }
    EXPECT_THAT(failures, HasSubstr("120.0ms"));
    EXPECT_THAT(failures, HasSubstr("150.0ms"));
}

// No samples is reported, not silently passed
TEST_F(ConversationReplayTest, EmptySampleSetIsDistinguishable) {
    TelemetryEngine engine;
    metrics::TargetResult result = engine.assertTargets("bargeIn", {{"p50", 150}});

    EXPECT_TRUE(result.pass);
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(result.sampleCount, 0u);
    EXPECT_TRUE(result.noData);
}

TEST_F(ConversationReplayTest, NaturalOnlyStreamNeverConfirms) {
    TelemetryEngine engine;
    for (int turn = 0; turn < 3; ++turn) {
        int64_t base = turn * 10000;
        engine.recordEvent(RawRecord::log(base, "[VAD] Speech started"));
        engine.recordEvent(RawRecord::log(base + 500, "transcript.complete: \"go on\""));
        engine.recordEvent(RawRecord::log(base + 700, "[ThinkerTalker] Pipeline state: processing -> speaking"));
        engine.recordEvent(RawRecord::log(base + 2000, "[VAD] Speech started"));
        engine.recordEvent(RawRecord::log(base + 2010, "BARGE_IN_TRIGGERED: stopping playback"));
        engine.recordEvent(RawRecord::log(base + 2100, "[ThinkerTalker] state: speaking -> listening reason=natural"));
    }

    BargeInOutcome outcome = engine.getBargeInOutcome();
    EXPECT_TRUE(outcome.attempted);
    EXPECT_FALSE(outcome.confirmed);
    EXPECT_EQ(engine.getMetrics().successfulBargeIns, 0u);
    EXPECT_EQ(engine.getMetrics().bargeInAttempts, 3u);
}

TEST_F(ConversationReplayTest, CompletedTurnsGrowByOnePerAcceptedResponseComplete) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> pick(0, 4);

    TelemetryEngine engine;
    int64_t now = 0;
    size_t previous = 0;

    for (int i = 0; i < 2000; ++i) {
        now += 10;
        DomainEvent event = DomainEvent::speechStarted(now);
        switch (pick(rng)) {
            case 0: event = DomainEvent::speechStarted(now); break;
            case 1: event = DomainEvent::transcriptComplete(now, "utterance"); break;
            case 2: event = DomainEvent::responseStarted(now); break;
            case 3: event = DomainEvent::responseComplete(now); break;
            default: event = DomainEvent::stateTransition(now, "a", "b"); break;
        }

        bool readyToSeal = event.kind == telemetry::EventKind::RESPONSE_COMPLETE &&
                           engine.getCurrentTurn().transcriptCompleteAt.has_value();
        engine.recordDomainEvent(event);

        size_t completed = engine.getTurns().size();
        ASSERT_GE(completed, previous);
        ASSERT_EQ(completed - previous, readyToSeal ? 1u : 0u) << "event " << i;
        previous = completed;
    }

    for (size_t i = 0; i < engine.getTurns().size(); ++i) {
        EXPECT_EQ(engine.getTurns()[i].index, i + 1);
    }
    EXPECT_EQ(engine.getMetrics().totalTurns, engine.getTurns().size());
}

TEST_F(ConversationReplayTest, ReplayCaptureFile) {
    utils::EngineConfig config = utils::EngineConfig::loadFromFile(fixturePath("gate_config.json"));
    utils::Logger::setLevel(utils::LogLevel::OFF);
    TelemetryEngine engine(config);

    size_t records = replayFile(engine, fixturePath("barge_in_session.capture"));
    EXPECT_EQ(records, 14u);

    ASSERT_EQ(engine.getTurns().size(), 2u);
    EXPECT_EQ(engine.getTurns()[0].transcriptText.value_or(""), "what's the weather");
    EXPECT_EQ(engine.getTurns()[1].transcriptText.value_or(""), "never mind");
    EXPECT_DOUBLE_EQ(engine.getTurns()[0].turnLatencyMs().value_or(-1), 2980);
    EXPECT_DOUBLE_EQ(engine.getTurns()[1].turnLatencyMs().value_or(-1), 2500);

    BargeInOutcome outcome = engine.getBargeInOutcome();
    EXPECT_TRUE(outcome.confirmed);
    EXPECT_TRUE(outcome.attempted);
    EXPECT_DOUBLE_EQ(outcome.latencyMs.value_or(-1), 80);
    EXPECT_DOUBLE_EQ(outcome.detectionToFadeMs.value_or(-1), 6);
    EXPECT_DOUBLE_EQ(outcome.fadeToSilenceMs.value_or(-1), 42);

    metrics::ConversationMetrics metrics = engine.getMetrics();
    EXPECT_EQ(metrics.totalTurns, 2u);
    EXPECT_EQ(metrics.userUtterances, 2u);
    EXPECT_EQ(metrics.aiResponses, 2u);
    EXPECT_EQ(metrics.bargeInAttempts, 1u);
    EXPECT_EQ(metrics.successfulBargeIns, 1u);
    EXPECT_EQ(metrics.queueOverflows, 1u);
    EXPECT_EQ(metrics.errors, 0u);
    EXPECT_EQ(metrics.malformedMessages, 0u);
    EXPECT_EQ(metrics.recordsProcessed, 14u);
    EXPECT_EQ(metrics.audioInterruptions, 1u);
    EXPECT_DOUBLE_EQ(metrics.averageResponseLatencyMs.value_or(-1), 350);

    auto targets = engine.assertConfiguredTargets();
    EXPECT_EQ(targets.size(), 5u);
    for (const auto& target : targets) {
        EXPECT_TRUE(target.pass) << target.metric;
        EXPECT_FALSE(target.noData) << target.metric;
    }
    EXPECT_EQ(engine.getHistogram().getSampleCount("e2eLatency"), 2u);

    metrics::GateResult gate = engine.assertConfiguredThresholds();
    EXPECT_TRUE(gate.pass);
    EXPECT_TRUE(gate.notes.empty());
}

TEST_F(ConversationReplayTest, SummaryIsStableAcrossRuns) {
    TelemetryEngine first;
    TelemetryEngine second;
    replayFile(first, fixturePath("barge_in_session.capture"));
    replayFile(second, fixturePath("barge_in_session.capture"));

    EXPECT_EQ(first.getSummary(), second.getSummary());
    EXPECT_THAT(first.getSummary(), HasSubstr("#2 \"never mind\""));
    EXPECT_THAT(first.getSummary(), HasSubstr("confirmed: yes"));
}

TEST_F(ConversationReplayTest, ParallelEnginesAreIndependent) {
    const size_t workers = 4;
    std::vector<size_t> turns(workers, 0);
    std::vector<size_t> errors(workers, 0);
    std::vector<std::thread> threads;

    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back([i, &turns, &errors]() {
            TelemetryEngine engine;
            replayFile(engine, fixturePath("barge_in_session.capture"));
            // Only even workers see an observed error
            if (i % 2 == 0) {
                engine.recordEvent(RawRecord::log(9000, "[TTS] ERROR: synthesis failed"));
            }
            turns[i] = engine.getTurns().size();
            errors[i] = engine.getMetrics().errors;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (size_t i = 0; i < workers; ++i) {
        EXPECT_EQ(turns[i], 2u);
        EXPECT_EQ(errors[i], i % 2 == 0 ? 1u : 0u);
    }
}

TEST_F(ConversationReplayTest, StalledConversationIsDiagnosed) {
    TelemetryEngine engine;
    int64_t clock = 0;
    engine.setConditionWaiter(core::ConditionWaiter([&clock]() { return clock; },
                                                    [&clock](int64_t ms) { clock += ms; }));

    std::vector<RawRecord> records = {
        RawRecord::log(0, "[VAD] Speech started"),
        RawRecord::log(500, "[STT] transcript.complete: \"hello\""),
        RawRecord::log(700, "[ThinkerTalker] Pipeline state: processing -> speaking")
    };
    size_t next = 0;

    core::TurnWaitResult result = engine.waitForTurns(1, [&]() {
        if (next >= records.size()) {
            return false;
        }
        engine.recordEvent(records[next++]);
        return true;
    }, 5000);

    EXPECT_FALSE(result.satisfied());
    EXPECT_EQ(result.diagnosis.missing, core::MissingField::RESPONSE_COMPLETE);
    EXPECT_EQ(engine.getCurrentTurn().transcriptText.value_or(""), "hello");
    EXPECT_THAT(result.wait.description, HasSubstr("responseComplete not observed"));
}

} // namespace integration
} // namespace voicegate
