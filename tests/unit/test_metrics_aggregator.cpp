#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "metrics/metrics_aggregator.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace voicegate {
namespace metrics {

using telemetry::DomainEvent;
using ::testing::HasSubstr;

class MetricsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::OFF);
    }

    void TearDown() override {
        utils::Logger::setLevel(utils::LogLevel::INFO);
    }

    core::TurnUpdate sealedTurn(int64_t speech, int64_t transcript, int64_t start, int64_t complete) {
        core::Turn turn(1);
        turn.speechStartedAt = speech;
        turn.transcriptCompleteAt = transcript;
        turn.transcriptText = "hello";
        turn.responseStartedAt = start;
        turn.responseCompleteAt = complete;

        core::TurnUpdate update;
        update.accepted = true;
        update.sealed = true;
        update.sealedTurn = turn;
        return update;
    }

    MetricsAggregator aggregator_;
};

TEST_F(MetricsAggregatorTest, EventCounters) {
    aggregator_.onEvent(DomainEvent::error(1, "failed"));
    aggregator_.onEvent(DomainEvent::error(2, "failed again"));
    aggregator_.onEvent(DomainEvent::queueOverflow(3));
    aggregator_.onEvent(DomainEvent::scheduleReset(4));
    aggregator_.onEvent(DomainEvent::bargeInCancelled(5));
    aggregator_.onEvent(DomainEvent::speechStarted(6));
    aggregator_.onEvent(DomainEvent::playbackInterrupted(7));
    aggregator_.onEvent(DomainEvent::fadeStarted(8));

    ConversationMetrics metrics = aggregator_.getMetrics();
    EXPECT_EQ(metrics.errors, 2u);
    EXPECT_EQ(metrics.queueOverflows, 1u);
    EXPECT_EQ(metrics.scheduleResets, 1u);
    EXPECT_EQ(metrics.falseBargeIns, 1u);
    EXPECT_EQ(metrics.audioInterruptions, 1u);
    EXPECT_DOUBLE_EQ(aggregator_.getValue("audioInterruptions").value_or(-1), 1);
}

TEST_F(MetricsAggregatorTest, RecordCounters) {
    aggregator_.onRecordClassified(2, false);
    aggregator_.onRecordClassified(0, false);
    aggregator_.onRecordClassified(0, true);

    ConversationMetrics metrics = aggregator_.getMetrics();
    EXPECT_EQ(metrics.recordsProcessed, 3u);
    EXPECT_EQ(metrics.unclassifiedRecords, 1u);
    EXPECT_EQ(metrics.malformedMessages, 1u);
}

TEST_F(MetricsAggregatorTest, SealedTurnRecordsLatencies) {
    core::TurnUpdate transcript;
    transcript.transcriptOpened = true;
    aggregator_.onTurnUpdate(transcript);

    core::TurnUpdate response;
    response.responseOpened = true;
    aggregator_.onTurnUpdate(response);

    aggregator_.onTurnUpdate(sealedTurn(0, 500, 700, 4200));

    ConversationMetrics metrics = aggregator_.getMetrics();
    EXPECT_EQ(metrics.userUtterances, 1u);
    EXPECT_EQ(metrics.aiResponses, 1u);
    EXPECT_EQ(metrics.totalTurns, 1u);
    EXPECT_DOUBLE_EQ(metrics.averageTurnLatencyMs.value_or(-1), 4200);
    EXPECT_DOUBLE_EQ(metrics.averageResponseLatencyMs.value_or(-1), 200);
    EXPECT_FALSE(metrics.averageBargeInLatencyMs.has_value());

    LatencyStats endToEnd = aggregator_.getHistogram().getStats(METRIC_E2E_LATENCY);
    EXPECT_EQ(endToEnd.count, 1u);
    EXPECT_DOUBLE_EQ(endToEnd.latest, 700);
}

TEST_F(MetricsAggregatorTest, BackfilledResponseStartIsNotAResponseLatency) {
    core::TurnUpdate update = sealedTurn(0, 500, 2000, 2000);
    update.sealedTurn->responseStartBackfilled = true;
    aggregator_.onTurnUpdate(update);

    EXPECT_EQ(aggregator_.getHistogram().getSampleCount(METRIC_RESPONSE_LATENCY), 0u);
    EXPECT_EQ(aggregator_.getHistogram().getSampleCount(METRIC_TURN_LATENCY), 1u);
    EXPECT_EQ(aggregator_.getHistogram().getSampleCount(METRIC_E2E_LATENCY), 0u);
}

TEST_F(MetricsAggregatorTest, BargeInUpdates) {
    core::BargeInUpdate opened;
    opened.attemptOpened = true;
    aggregator_.onBargeInUpdate(opened);

    core::BargeInUpdate closed;
    closed.attemptClosed = true;
    closed.confirmed = true;
    closed.latencyMs = 90.0;
    aggregator_.onBargeInUpdate(closed);

    ConversationMetrics metrics = aggregator_.getMetrics();
    EXPECT_EQ(metrics.bargeInAttempts, 1u);
    EXPECT_EQ(metrics.successfulBargeIns, 1u);
    EXPECT_DOUBLE_EQ(metrics.averageBargeInLatencyMs.value_or(-1), 90);
}

TEST_F(MetricsAggregatorTest, FadeTimingsBecomeSamples) {
    core::BargeInUpdate fadeStart;
    fadeStart.detectionToFadeMs = 6.0;
    aggregator_.onBargeInUpdate(fadeStart);

    core::BargeInUpdate silent;
    silent.fadeToSilenceMs = 42.0;
    aggregator_.onBargeInUpdate(silent);

    const LatencyHistogram& histogram = aggregator_.getHistogram();
    EXPECT_EQ(histogram.getSampleCount(METRIC_DETECTION_TO_FADE), 1u);
    EXPECT_EQ(histogram.getSampleCount(METRIC_FADE_TO_SILENCE), 1u);
    EXPECT_EQ(histogram.getSampleCount(METRIC_BARGE_IN_LATENCY), 0u);

    TargetResult fade = aggregator_.assertTargets(METRIC_FADE_TO_SILENCE, {{"p50", 50.0}});
    EXPECT_TRUE(fade.pass);
    EXPECT_FALSE(fade.noData);
}

TEST_F(MetricsAggregatorTest, QualityThresholdsPass) {
    aggregator_.onTurnUpdate(sealedTurn(0, 500, 700, 4200));

    QualityThresholds thresholds;
    thresholds.setMax("errors", 0).setMin("totalTurns", 1).setMax("averageTurnLatencyMs", 5000);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_TRUE(result.pass);
    EXPECT_TRUE(result.failures.empty());
    EXPECT_TRUE(result.notes.empty());
}

TEST_F(MetricsAggregatorTest, QualityThresholdsFail) {
    aggregator_.onEvent(DomainEvent::error(1, "failed"));
    aggregator_.onEvent(DomainEvent::error(2, "failed"));

    QualityThresholds thresholds;
    thresholds.setMax("errors", 0).setMin("totalTurns", 1);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_FALSE(result.pass);
    ASSERT_EQ(result.failures.size(), 2u);
    EXPECT_EQ(result.failures[0], "errors 2 exceeds maximum 0");
    EXPECT_EQ(result.failures[1], "totalTurns 0 is below minimum 1");
}

TEST_F(MetricsAggregatorTest, DerivedAverageWithoutSamplesIsANote) {
    QualityThresholds thresholds;
    thresholds.setMax("averageBargeInLatencyMs", 150);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_TRUE(result.pass);
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.notes.size(), 1u);
    EXPECT_THAT(result.notes[0], HasSubstr("averageBargeInLatencyMs"));
    EXPECT_THAT(result.notes[0], HasSubstr("no samples collected"));
}

TEST_F(MetricsAggregatorTest, UnknownThresholdNameFails) {
    QualityThresholds thresholds;
    thresholds.setMax("averageVibes", 1);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_FALSE(result.pass);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_THAT(result.failures[0], HasSubstr("averageVibes"));
}

TEST_F(MetricsAggregatorTest, HugeBoundIsFormattedWithoutOverflow) {
    QualityThresholds thresholds;
    thresholds.setMin("totalTurns", 1e20);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_FALSE(result.pass);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_THAT(result.failures[0], HasSubstr("totalTurns 0 is below minimum 100000000000000000000"));
}

TEST_F(MetricsAggregatorTest, EmptyThresholdsAreUnconstrained) {
    aggregator_.onEvent(DomainEvent::error(1, "failed"));
    EXPECT_TRUE(aggregator_.assertQualityThresholds(QualityThresholds()).pass);
}

TEST_F(MetricsAggregatorTest, DerivedAverageBreach) {
    aggregator_.onTurnUpdate(sealedTurn(0, 500, 2500, 4200));

    QualityThresholds thresholds;
    thresholds.setMax("averageResponseLatencyMs", 1500);

    GateResult result = aggregator_.assertQualityThresholds(thresholds);
    EXPECT_FALSE(result.pass);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0], "averageResponseLatencyMs 2000.0ms exceeds maximum 1500.0ms");
}

TEST_F(MetricsAggregatorTest, ValueLookup) {
    aggregator_.onEvent(DomainEvent::queueOverflow(1));

    EXPECT_DOUBLE_EQ(aggregator_.getValue("queueOverflows").value_or(-1), 1);
    EXPECT_FALSE(aggregator_.getValue("averageTurnLatencyMs").has_value());
    EXPECT_FALSE(aggregator_.getValue("nope").has_value());
    EXPECT_TRUE(MetricsAggregator::isKnownMetric("recordsProcessed"));
    EXPECT_TRUE(MetricsAggregator::isDerivedMetric("averageTurnLatencyMs"));
    EXPECT_FALSE(MetricsAggregator::isKnownMetric("nope"));
}

TEST_F(MetricsAggregatorTest, SummaryIsDeterministic) {
    aggregator_.onTurnUpdate(sealedTurn(0, 500, 700, 4200));
    aggregator_.addLatencySample(METRIC_BARGE_IN_LATENCY, 90);

    std::ostringstream first;
    std::ostringstream second;
    aggregator_.appendSummary(first);
    aggregator_.appendSummary(second);
    EXPECT_EQ(first.str(), second.str());

    std::string summary = first.str();
    EXPECT_LT(summary.find("  errors:"), summary.find("  queueOverflows:"));
    EXPECT_LT(summary.find("  bargeIn:"), summary.find("  responseLatency:"));
    EXPECT_LT(summary.find("  responseLatency:"), summary.find("  turnLatency:"));
    EXPECT_THAT(summary, HasSubstr("averageBargeInLatencyMs: 90.0ms"));
}

TEST_F(MetricsAggregatorTest, ExportJson) {
    aggregator_.onEvent(DomainEvent::error(1, "failed"));

    nlohmann::json j = nlohmann::json::parse(aggregator_.exportJson());
    EXPECT_EQ(j["counters"]["errors"].get<int>(), 1);
    EXPECT_TRUE(j["averages"]["averageTurnLatencyMs"].is_null());
}

TEST_F(MetricsAggregatorTest, Reset) {
    aggregator_.onEvent(DomainEvent::error(1, "failed"));
    aggregator_.addLatencySample(METRIC_BARGE_IN_LATENCY, 90);
    aggregator_.reset();

    EXPECT_EQ(aggregator_.getMetrics().errors, 0u);
    EXPECT_TRUE(aggregator_.getHistogram().getMetricNames().empty());
}

} // namespace metrics
} // namespace voicegate
