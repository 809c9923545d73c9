#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <fstream>

using namespace voicegate;
using utils::EngineConfig;
using utils::ConfigurationException;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::OFF);
        path_ = ::testing::TempDir() + "voicegate_config_test.json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        utils::Logger::setLevel(utils::LogLevel::INFO);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::string path_;
};

TEST_F(ConfigTest, DefaultValues) {
    EngineConfig config;

    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::INFO);
    EXPECT_TRUE(config.getQualityThresholds().empty());

    const auto& targets = config.getLatencyTargets();
    ASSERT_EQ(targets.count("bargeIn"), 1u);
    EXPECT_DOUBLE_EQ(targets.at("bargeIn").at("p50"), 100.0);
    EXPECT_DOUBLE_EQ(targets.at("bargeIn").at("p90"), 150.0);
    EXPECT_DOUBLE_EQ(targets.at("bargeIn").at("p99"), 250.0);
    ASSERT_EQ(targets.count("responseLatency"), 1u);
    EXPECT_DOUBLE_EQ(targets.at("responseLatency").at("p50"), 800.0);
    EXPECT_DOUBLE_EQ(targets.at("responseLatency").at("p90"), 1500.0);
    EXPECT_DOUBLE_EQ(targets.at("responseLatency").at("p99"), 2500.0);
    ASSERT_EQ(targets.count("e2eLatency"), 1u);
    EXPECT_DOUBLE_EQ(targets.at("e2eLatency").at("p50"), 1200.0);
    EXPECT_DOUBLE_EQ(targets.at("e2eLatency").at("p90"), 2000.0);
    EXPECT_DOUBLE_EQ(targets.at("e2eLatency").at("p99"), 3500.0);
    ASSERT_EQ(targets.count("detectionToFade"), 1u);
    EXPECT_DOUBLE_EQ(targets.at("detectionToFade").at("p50"), 10.0);
    ASSERT_EQ(targets.count("fadeToSilence"), 1u);
    EXPECT_DOUBLE_EQ(targets.at("fadeToSilence").at("p50"), 50.0);
}

TEST_F(ConfigTest, LoadMissingFileFallsBackToDefaults) {
    EngineConfig config = EngineConfig::load("nonexistent.json");
    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::INFO);
    EXPECT_EQ(config.getLatencyTargets().size(), 5u);
}

TEST_F(ConfigTest, LoadFromFileMissingThrows) {
    EXPECT_THROW(EngineConfig::loadFromFile("nonexistent.json"), ConfigurationException);
}

TEST_F(ConfigTest, LoadFromFile) {
    writeFile(R"({
        "logLevel": "debug",
        "latencyTargets": { "bargeIn": {"p50": 120, "max": 400} },
        "qualityThresholds": { "errors": {"max": 0}, "totalTurns": {"min": 2} }
    })");

    EngineConfig config = EngineConfig::loadFromFile(path_);

    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::DEBUG);

    const auto& bargeIn = config.getLatencyTargets().at("bargeIn");
    EXPECT_EQ(bargeIn.size(), 2u);
    EXPECT_DOUBLE_EQ(bargeIn.at("p50"), 120.0);
    EXPECT_DOUBLE_EQ(bargeIn.at("max"), 400.0);
    // Metrics not mentioned keep their defaults
    EXPECT_EQ(config.getLatencyTargets().count("responseLatency"), 1u);

    const auto& bounds = config.getQualityThresholds().bounds();
    ASSERT_EQ(bounds.size(), 2u);
    EXPECT_EQ(bounds.at("errors").kind, metrics::BoundKind::MAX);
    EXPECT_DOUBLE_EQ(bounds.at("errors").value, 0.0);
    EXPECT_EQ(bounds.at("totalTurns").kind, metrics::BoundKind::MIN);
    EXPECT_DOUBLE_EQ(bounds.at("totalTurns").value, 2.0);
}

TEST_F(ConfigTest, InvalidJsonThrows) {
    EXPECT_THROW(EngineConfig::fromJson("{ not json"), ConfigurationException);
    EXPECT_THROW(EngineConfig::fromJson("[1, 2]"), ConfigurationException);
}

TEST_F(ConfigTest, InvalidFileFallsBackWithLoad) {
    writeFile("{ \"logLevel\": ");
    EngineConfig config = EngineConfig::load(path_);
    EXPECT_EQ(config.getLogLevel(), utils::LogLevel::INFO);
}

TEST_F(ConfigTest, NegativeTargetRejected) {
    try {
        EngineConfig::fromJson(R"({"latencyTargets": {"bargeIn": {"p50": -5}}})");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("bargeIn.p50"), std::string::npos);
    }
}

TEST_F(ConfigTest, UnknownTargetKeyRejected) {
    EXPECT_THROW(EngineConfig::fromJson(R"({"latencyTargets": {"bargeIn": {"p75": 100}}})"),
                 ConfigurationException);
}

TEST_F(ConfigTest, UnknownBoundKindRejected) {
    EXPECT_THROW(EngineConfig::fromJson(R"({"qualityThresholds": {"errors": {"atMost": 1}}})"),
                 ConfigurationException);
    EXPECT_THROW(EngineConfig::fromJson(R"({"qualityThresholds": {"errors": {"max": 1, "min": 0}}})"),
                 ConfigurationException);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    EXPECT_THROW(EngineConfig::fromJson(R"({"logLevel": "chatty"})"), ConfigurationException);
    EXPECT_EQ(EngineConfig::fromJson(R"({"logLevel": "off"})").getLogLevel(), utils::LogLevel::OFF);
}

TEST_F(ConfigTest, ValidateReportsEveryProblem) {
    EngineConfig config;
    config.setLatencyTargets("bargeIn", {{"p50", -1.0}, {"p42", 10.0}});

    auto errors = config.validate();
    EXPECT_EQ(errors.size(), 2u);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    EngineConfig config;
    config.setLogLevel(utils::LogLevel::WARN);
    metrics::QualityThresholds thresholds;
    thresholds.setMax("errors", 0).setMin("totalTurns", 1);
    config.setQualityThresholds(thresholds);

    EngineConfig reloaded = EngineConfig::fromJson(config.toJson());

    EXPECT_EQ(reloaded.getLogLevel(), utils::LogLevel::WARN);
    EXPECT_EQ(reloaded.getLatencyTargets(), config.getLatencyTargets());
    EXPECT_EQ(reloaded.getQualityThresholds().bounds().at("totalTurns").kind, metrics::BoundKind::MIN);
    EXPECT_DOUBLE_EQ(reloaded.getQualityThresholds().bounds().at("errors").value, 0.0);
}
