#pragma once

#include "telemetry/domain_event.hpp"
#include "telemetry/raw_record.hpp"
#include <functional>
#include <string>
#include <vector>

namespace voicegate {
namespace telemetry {

/**
 * Rule categories, in the order their events are emitted for one record.
 * Within a category only the first matching rule fires.
 */
enum class RuleCategory {
    SPEECH,
    TRANSCRIPT,
    RESPONSE,
    TRANSITION,
    BARGE_IN,
    PLAYBACK,
    FAULT,
    AUDIO_QUEUE
};

/**
 * Text of one log line, with a lower-cased copy for case-insensitive checks
 */
struct LineView {
    const std::string& text;
    std::string lower;

    explicit LineView(const std::string& line);

    bool has(const char* needle) const;       // case-sensitive
    bool hasAny(std::initializer_list<const char*> needles) const;
    bool hasLower(const char* needle) const;  // needle must be lower case
};

struct ClassificationRule {
    RuleCategory category;
    std::string name;
    std::function<bool(const LineView&)> matches;
    std::function<DomainEvent(const LineView&, int64_t)> extract;
};

struct ClassificationResult {
    std::vector<DomainEvent> events;
    bool malformed = false;
    std::string malformedReason;
    std::vector<std::string> matchedRules;
    std::vector<std::string> ruleFailures;  // extractors that threw, as "name: what"
};

/**
 * Maps raw records to domain events.
 *
 * Free-text records go through an ordered rule table; structured
 * messages bypass it and map through their type field. Classification
 * has no side effects and never throws.
 */
class EventClassifier {
public:
    EventClassifier();
    explicit EventClassifier(std::vector<ClassificationRule> rules);

    std::vector<DomainEvent> classify(const RawRecord& record) const;
    ClassificationResult classifyDetailed(const RawRecord& record) const;

    const std::vector<ClassificationRule>& getRules() const { return rules_; }

    static std::vector<ClassificationRule> defaultRules();
    static std::string categoryToString(RuleCategory category);

private:
    ClassificationResult classifyText(const RawRecord& record) const;
    ClassificationResult classifyMessage(const RawRecord& record) const;

    std::vector<ClassificationRule> rules_;
};

} // namespace telemetry
} // namespace voicegate
