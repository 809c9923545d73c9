#include "telemetry/event_classifier.hpp"
#include "telemetry/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace voicegate {
namespace telemetry {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string captureOrEmpty(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(text, match, pattern) && match.size() > 1) {
        return match[1].str();
    }
    return "";
}

bool captureBool(const std::string& text, const std::regex& pattern) {
    std::string value = captureOrEmpty(text, pattern);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true";
}

const std::regex& transcriptPattern() {
    static const std::regex pattern(R"(transcript\.complete[:\s]*["']?([^"'\n]+))");
    return pattern;
}

const std::regex& transitionPattern() {
    static const std::regex pattern(R"((\w+)\s*(?:->|→)\s*(\w+))");
    return pattern;
}

const std::regex& reasonPattern() {
    static const std::regex pattern(R"(reason\s*[=:]\s*(\w+))", std::regex::icase);
    return pattern;
}

// A fault needs a level marker, not just the word: "[ERROR]", "ERROR:" at the
// start or right after a component tag, "level=error", or an unhandled exception.
const std::regex& faultPattern() {
    static const std::regex pattern(
        R"((\[(error|fatal)\])|((^|\]\s*)(error|fatal)\s*:)|)"
        R"((\b(level|severity|type|event)\s*[=:]\s*["']?(error|fatal)\b)|)"
        R"((\b(unhandled|uncaught)\s+(exception|error)\b))",
        std::regex::icase);
    return pattern;
}

// Quoted user speech is never scanned for fault markers
std::string faultScanText(const LineView& line) {
    size_t transcript = line.text.find("transcript.complete");
    if (transcript == std::string::npos) {
        return line.text;
    }
    return line.text.substr(0, transcript);
}

bool isPlaybackLine(const LineView& line) {
    return line.has("[TTAudioPlayback]") || line.hasLower("playback");
}

} // namespace

LineView::LineView(const std::string& line) : text(line), lower(line) {
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

bool LineView::has(const char* needle) const {
    return text.find(needle) != std::string::npos;
}

bool LineView::hasAny(std::initializer_list<const char*> needles) const {
    for (const char* needle : needles) {
        if (has(needle)) {
            return true;
        }
    }
    return false;
}

bool LineView::hasLower(const char* needle) const {
    return lower.find(needle) != std::string::npos;
}

EventClassifier::EventClassifier() : rules_(defaultRules()) {
}

EventClassifier::EventClassifier(std::vector<ClassificationRule> rules) : rules_(std::move(rules)) {
}

std::vector<ClassificationRule> EventClassifier::defaultRules() {
    std::vector<ClassificationRule> rules;

    // Speech detection
    rules.push_back({RuleCategory::SPEECH, "speech_started",
        [](const LineView& line) {
            return line.hasAny({"input_audio_buffer.speech_started", "speech_started", "Speech started"});
        },
        [](const LineView&, int64_t ts) { return DomainEvent::speechStarted(ts); }});

    // Final user transcript
    rules.push_back({RuleCategory::TRANSCRIPT, "transcript.complete",
        [](const LineView& line) { return line.has("transcript.complete"); },
        [](const LineView& line, int64_t ts) {
            return DomainEvent::transcriptComplete(ts, trim(captureOrEmpty(line.text, transcriptPattern())));
        }});

    // AI response lifecycle. Completion is checked first so that
    // "speaking -> listening" can never be read as a response start.
    rules.push_back({RuleCategory::RESPONSE, "response_complete",
        [](const LineView& line) {
            return line.hasAny({"speaking -> listening", "speaking->listening", "Natural completion mode"}) ||
                   (line.has("Pipeline state") && line.has("speaking") && line.has("-> listening"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::responseComplete(ts); }});

    rules.push_back({RuleCategory::RESPONSE, "response_started",
        [](const LineView& line) {
            return line.hasAny({"processing -> speaking", "processing->speaking",
                                "Playback started", "Audio playback started"}) ||
                   (line.has("Pipeline state") && line.has("-> speaking"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::responseStarted(ts); }});

    // Pipeline state transitions need an arrow plus a state marker
    rules.push_back({RuleCategory::TRANSITION, "state_transition",
        [](const LineView& line) {
            if (!(line.hasLower("state") || line.hasLower("transition") || line.has("[ThinkerTalker]"))) {
                return false;
            }
            return std::regex_search(line.text, transitionPattern());
        },
        [](const LineView& line, int64_t ts) {
            std::smatch match;
            std::regex_search(line.text, match, transitionPattern());
            std::string reason = captureOrEmpty(line.text, reasonPattern());
            return DomainEvent::stateTransition(ts, match[1].str(), match[2].str(), reason);
        }});

    // Barge-in signals
    rules.push_back({RuleCategory::BARGE_IN, "barge_in_cancelled",
        [](const LineView& line) {
            return line.hasLower("barge") &&
                   (line.hasLower("cancel") || line.hasLower("rollback") || line.hasLower("misfire"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::bargeInCancelled(ts); }});

    rules.push_back({RuleCategory::BARGE_IN, "barge_in_check",
        [](const LineView& line) { return line.has("BARGE_IN_CHECK:"); },
        [](const LineView& line, int64_t ts) {
            static const std::regex activeRef(R"(isPlayingRef=(\w+))", std::regex::icase);
            static const std::regex sources(R"(activeSourcesCount=(\d+))", std::regex::icase);
            static const std::regex willTrigger(R"(willTrigger=(\w+))", std::regex::icase);

            std::string count = captureOrEmpty(line.text, sources);
            return DomainEvent::bargeInProbe(ts,
                                             captureBool(line.text, activeRef),
                                             count.empty() ? 0 : std::stoi(count),
                                             captureBool(line.text, willTrigger));
        }});

    rules.push_back({RuleCategory::BARGE_IN, "barge_in_initiated",
        [](const LineView& line) {
            return line.hasAny({"BARGE_IN_TRIGGERED:", "barge_in.initiated", "Sending barge-in signal"});
        },
        [](const LineView&, int64_t ts) { return DomainEvent::bargeInProbe(ts, true, 0, true); }});

    // Audio output reacting to an interruption. Playback lines only.
    rules.push_back({RuleCategory::PLAYBACK, "fade_complete",
        [](const LineView& line) {
            return isPlaybackLine(line) && line.hasLower("fade") &&
                   (line.hasLower("complete") || line.hasLower("finished") || line.hasLower("silent"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::fadeCompleted(ts); }});

    rules.push_back({RuleCategory::PLAYBACK, "fade_started",
        [](const LineView& line) { return isPlaybackLine(line) && line.hasLower("fade"); },
        [](const LineView&, int64_t ts) { return DomainEvent::fadeStarted(ts); }});

    rules.push_back({RuleCategory::PLAYBACK, "playback_interrupted",
        [](const LineView& line) {
            return isPlaybackLine(line) && line.hasLower("stop") &&
                   (line.hasLower("barge") || line.hasLower("interrupt"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::playbackInterrupted(ts); }});

    // Errors reported by the observed system
    rules.push_back({RuleCategory::FAULT, "error",
        [](const LineView& line) { return std::regex_search(faultScanText(line), faultPattern()); },
        [](const LineView& line, int64_t ts) { return DomainEvent::error(ts, trim(line.text)); }});

    // Audio scheduling problems
    rules.push_back({RuleCategory::AUDIO_QUEUE, "queue_overflow",
        [](const LineView& line) {
            return (line.hasLower("overflow") || line.hasLower("trimming")) &&
                   (line.hasLower("queue") || line.has("[TTAudioPlayback]"));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::queueOverflow(ts); }});

    rules.push_back({RuleCategory::AUDIO_QUEUE, "schedule_reset",
        [](const LineView& line) {
            return (line.hasLower("schedule") && line.hasLower("reset")) ||
                   (line.hasLower("watchdog") && (line.hasLower("stuck") || line.hasLower("reset")));
        },
        [](const LineView&, int64_t ts) { return DomainEvent::scheduleReset(ts); }});

    return rules;
}

std::vector<DomainEvent> EventClassifier::classify(const RawRecord& record) const {
    return classifyDetailed(record).events;
}

ClassificationResult EventClassifier::classifyDetailed(const RawRecord& record) const {
    if (record.source == RecordSource::MESSAGE) {
        return classifyMessage(record);
    }
    return classifyText(record);
}

ClassificationResult EventClassifier::classifyText(const RawRecord& record) const {
    ClassificationResult result;
    if (record.text.empty()) {
        return result;
    }

    LineView line(record.text);
    std::set<RuleCategory> fired;

    // Evaluate in category order so emitted events have a stable order
    // regardless of how a custom table is arranged.
    static const RuleCategory order[] = {
        RuleCategory::SPEECH, RuleCategory::TRANSCRIPT, RuleCategory::RESPONSE,
        RuleCategory::TRANSITION, RuleCategory::BARGE_IN, RuleCategory::PLAYBACK,
        RuleCategory::FAULT, RuleCategory::AUDIO_QUEUE
    };

    for (RuleCategory category : order) {
        for (const auto& rule : rules_) {
            if (rule.category != category || fired.count(category) > 0) {
                continue;
            }
            try {
                if (!rule.matches(line)) {
                    continue;
                }
                DomainEvent event = rule.extract(line, record.receivedAtMs);
                event.from(RecordSource::LOG);
                result.events.push_back(event);
                result.matchedRules.push_back(rule.name);
                fired.insert(category);
            } catch (const std::exception& e) {
                // A failing extractor drops this rule only; lower priority rules may still match
                utils::Logger::warn("Rule " + rule.name + " failed on record: " + std::string(e.what()));
                result.ruleFailures.push_back(rule.name + ": " + e.what());
            }
        }
    }

    return result;
}

ClassificationResult EventClassifier::classifyMessage(const RawRecord& record) const {
    ClassificationResult result;
    try {
        StructuredMessage message = MessageProtocol::parse(record.text, record.receivedAtMs);
        result.events = MessageProtocol::toEvents(message);
        if (!result.events.empty()) {
            result.matchedRules.push_back("message:" + message.typeName);
        }
    } catch (const utils::MessageFormatException& e) {
        result.events.clear();
        result.malformed = true;
        result.malformedReason = e.what();
    } catch (const std::exception& e) {
        result.events.clear();
        result.malformed = true;
        result.malformedReason = std::string("Invalid message: ") + e.what();
    }
    return result;
}

std::string EventClassifier::categoryToString(RuleCategory category) {
    switch (category) {
        case RuleCategory::SPEECH: return "speech";
        case RuleCategory::TRANSCRIPT: return "transcript";
        case RuleCategory::RESPONSE: return "response";
        case RuleCategory::TRANSITION: return "transition";
        case RuleCategory::BARGE_IN: return "barge_in";
        case RuleCategory::PLAYBACK: return "playback";
        case RuleCategory::FAULT: return "fault";
        case RuleCategory::AUDIO_QUEUE: return "audio_queue";
    }
    return "unknown";
}

} // namespace telemetry
} // namespace voicegate
