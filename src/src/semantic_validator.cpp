#include <sg/semantic.h>
#include <sg/json.h>
#include <sg/log.h>
#include <sg/text_utils.h>
#include <algorithm>
#include <future>
#include <thread>

namespace sg {

namespace {

// Errors that leave nothing meaningful to assess.
bool is_fatal(const FieldError& e) {
    return e.kind == ErrorKind::SchemaError || (e.kind == ErrorKind::TypeMismatch && e.path.empty());
}

std::vector<std::string> read_string_list(const Dictionary& obj, const std::string& key) {
    std::vector<std::string> out;
    if (!obj.has(key)) return out;
    const Dictionary& v = obj.at(key);
    if (v.isString()) {
        if (!v.asString().empty()) out.push_back(v.asString());
        return out;
    }
    if (!v.isArrayObject()) return out;
    for (auto const& e : v.elements()) {
        if (e.isNull()) continue;
        out.push_back(e.isString() ? e.asString() : e.dump());
    }
    return out;
}

bool has_score(const Dictionary& d) { return d.isMappedObject() && d.has("semantic_score"); }

std::optional<Dictionary> parse_object(const std::string& text) {
    try {
        Dictionary d = parse_json(extract_json_object(text));
        if (d.isMappedObject()) return d;
    } catch (const JsonParseError& e) {
        log::debug(std::string("assessment body is not JSON: ") + e.what());
    }
    return std::nullopt;
}

// The assessment may arrive directly, or as a JSON string inside a chat or
// completion envelope.
std::optional<Dictionary> unwrap_assessment(const Dictionary& body) {
    if (has_score(body)) return body;
    for (auto const& key : {"response", "content", "output"}) {
        if (body.has(key) && body.at(key).isString()) {
            auto inner = parse_object(body.at(key).asString());
            if (inner && has_score(*inner)) return inner;
        }
    }
    if (body.has("message") && body.at("message").isMappedObject()) return unwrap_assessment(body.at("message"));
    if (body.has("choices") && body.at("choices").isArrayObject() && !body.at("choices").empty()) {
        return unwrap_assessment(body.at("choices").at(0));
    }
    return std::nullopt;
}

std::string level_instructions(ValidationLevel level) {
    switch (level) {
        case ValidationLevel::Basic:
            return "Perform a quick sanity check. Only flag content that is clearly wrong or meaningless.";
        case ValidationLevel::Standard:
            return "Check that the content is coherent, relevant and appropriate for its purpose.";
        case ValidationLevel::Strict:
            return "Review the content thoroughly. Check coherence, relevance, internal consistency and "
                   "factual plausibility, and flag anything vague or unsupported.";
    }
    return "";
}

std::string type_instructions(const std::string& validation_type) {
    if (validation_type == "recommendation")
        return "Check if the recommendations are relevant, specific, and actionable.";
    if (validation_type == "summary")
        return "Check if the summary accurately captures the key points of the original text.";
    if (validation_type == "classification")
        return "Check if the classification is accurate, well-justified, and appropriate.";
    return "Check if the response is coherent, well-structured, and appropriate.";
}

}  // namespace

std::string to_string(ValidationLevel level) {
    switch (level) {
        case ValidationLevel::Basic:
            return "basic";
        case ValidationLevel::Standard:
            return "standard";
        case ValidationLevel::Strict:
            return "strict";
    }
    return "standard";
}

std::optional<ValidationLevel> parse_validation_level(const std::string& s) {
    const std::string v = text_utils::to_lower_ascii(s);
    if (v == "basic") return ValidationLevel::Basic;
    if (v == "standard") return ValidationLevel::Standard;
    if (v == "strict") return ValidationLevel::Strict;
    return std::nullopt;
}

const std::vector<std::string>& validation_types() {
    static const std::vector<std::string> types = {"generic", "recommendation", "summary", "classification"};
    return types;
}

bool is_known_validation_type(const std::string& s) {
    auto const& types = validation_types();
    return std::find(types.begin(), types.end(), s) != types.end();
}

Dictionary SemanticResult::to_dictionary() const {
    Dictionary d;
    d["is_semantically_valid"] = is_semantically_valid;
    d["semantic_score"] = semantic_score;
    d["issues"] = Dictionary(issues);
    d["suggestions"] = Dictionary(suggestions);
    d["degraded"] = degraded;
    if (degraded) d["degraded_reason"] = degraded_reason;
    return d;
}

std::unique_ptr<ContentQualityClient> NullClientFactory::acquire() {
    throw ServiceError("no semantic service configured");
}

double SemanticOptions::threshold(ValidationLevel level) const {
    switch (level) {
        case ValidationLevel::Basic:
            return basic_threshold;
        case ValidationLevel::Standard:
            return standard_threshold;
        case ValidationLevel::Strict:
            return strict_threshold;
    }
    return standard_threshold;
}

SemanticValidator::SemanticValidator(std::shared_ptr<ContentQualityClientFactory> factory, SemanticOptions options)
    : factory_(std::move(factory)), options_(options), abandoned_(std::make_shared<std::atomic<int>>(0)) {
    if (!factory_) factory_ = std::make_shared<NullClientFactory>();
}

bool SemanticValidator::should_assess(const StructuralResult& structural, ValidationLevel level) {
    if (structural.is_valid()) return true;
    if (level != ValidationLevel::Strict) return false;
    return std::none_of(structural.errors.begin(), structural.errors.end(), is_fatal);
}

AssessmentRequest SemanticValidator::build_request(const Dictionary& payload,
                                                   const Dictionary& schema,
                                                   const StructuralResult& structural,
                                                   ValidationLevel level,
                                                   const std::string& validation_type) {
    AssessmentRequest request;
    request.level = level;
    request.validation_type = validation_type;

    Dictionary errors = Dictionary::array();
    for (auto const& e : structural.errors) errors.push_back(e.to_dictionary());

    Dictionary context;
    context["validation_type"] = validation_type;
    context["validation_level"] = to_string(level);
    context["structural_errors"] = errors;
    context["data"] = payload;
    context["schema"] = schema;
    request.context = context;

    std::string prompt = "Validate this " + validation_type + " AI output with " + to_string(level) +
                         " strictness.\n" + level_instructions(level) + "\n" + type_instructions(validation_type) +
                         "\n\nSchema:\n" + schema.dump(2) + "\n\nData:\n" + payload.dump(2) + "\n";
    if (!structural.errors.empty()) {
        prompt += "\nStructural validation found these errors:\n" + errors.dump(2) +
                  "\nConsider these when providing semantic validation.\n";
    }
    prompt +=
        "\nRespond with a single JSON object with the keys:\n"
        "  is_semantically_valid (boolean)\n"
        "  semantic_score (number from 0.0 to 1.0)\n"
        "  issues (list of strings)\n"
        "  suggestions (list of strings)\n";
    request.prompt = prompt;
    return request;
}

std::optional<SemanticResult> SemanticValidator::parse_assessment(const std::string& body, ValidationLevel level) const {
    auto outer = parse_object(body);
    if (!outer) return std::nullopt;
    auto assessment = unwrap_assessment(*outer);
    if (!assessment) return std::nullopt;

    const Dictionary& score = assessment->at("semantic_score");
    if (!score.isNumber()) return std::nullopt;

    SemanticResult result;
    result.semantic_score = std::min(1.0, std::max(0.0, score.asDouble()));
    result.issues = read_string_list(*assessment, "issues");
    result.suggestions = read_string_list(*assessment, "suggestions");

    bool service_verdict = true;
    if (assessment->has("is_semantically_valid") && assessment->at("is_semantically_valid").isBool()) {
        service_verdict = assessment->at("is_semantically_valid").asBool();
    }
    result.is_semantically_valid = service_verdict && result.semantic_score >= options_.threshold(level);
    return result;
}

SemanticResult SemanticValidator::fallback(const Dictionary& payload,
                                           const StructuralResult& structural,
                                           const std::string& validation_type,
                                           const std::string& reason) {
    SemanticResult result;
    result.degraded = true;
    result.degraded_reason = reason;
    result.semantic_score = 0.5;
    result.issues.push_back("Semantic validation was unavailable (" + reason +
                            "); this result is based on local checks only");
    result.suggestions.push_back("Retry later for a full content-quality assessment");

    bool local_ok = true;
    if (!structural.is_valid()) {
        local_ok = false;
        result.issues.push_back("Structural validation reported " + std::to_string(structural.error_count()) +
                                " error(s)");
        result.suggestions.push_back("Fix structural errors before relying on semantic validation");
    }

    if (payload.isMappedObject()) {
        for (auto const& p : payload.items()) {
            if (p.second.isString() && text_utils::trim(p.second.asString()).empty()) {
                local_ok = false;
                result.issues.push_back("Field '" + p.first + "' is empty");
                result.suggestions.push_back("Provide meaningful content for '" + p.first + "'");
            }
        }

        auto too_short = [&](const std::string& field, size_t minimum) {
            if (!payload.has(field) || !payload.at(field).isString()) return false;
            return text_utils::utf8_length(payload.at(field).asString()) < minimum;
        };
        if (validation_type == "recommendation" && too_short("recommendation_text", 20)) {
            local_ok = false;
            result.issues.push_back("Recommendation text is too short");
            result.suggestions.push_back("Provide more detailed recommendations (at least 20 characters)");
        } else if (validation_type == "summary" && too_short("summary", 30)) {
            local_ok = false;
            result.issues.push_back("Summary is too short");
            result.suggestions.push_back("Provide a more comprehensive summary (at least 30 characters)");
        }
    }

    result.is_semantically_valid = local_ok;
    return result;
}

std::string SemanticValidator::call_with_deadline(const AssessmentRequest& request,
                                                  const CancellationTokenPtr& cancel) const {
    if (abandoned_->load() >= options_.max_abandoned_workers) {
        throw ServiceError("too many abandoned assessments still running (" + std::to_string(abandoned_->load()) + ")");
    }
    std::shared_ptr<ContentQualityClient> client = factory_->acquire();
    if (!client) throw ServiceError("no content-quality client available");

    // The worker owns everything it touches so an abandoned call can finish
    // on its own without the caller waiting for it.
    auto stop = std::make_shared<CancellationToken>();
    auto outcome = std::make_shared<std::promise<std::string>>();
    std::future<std::string> reply = outcome->get_future();
    // 0 running, 1 abandoned, 2 finished; whoever moves it off 0 first wins.
    auto state = std::make_shared<std::atomic<int>>(0);
    auto abandoned = abandoned_;

    std::thread worker([client, request, stop, outcome, state, abandoned]() {
        try {
            outcome->set_value(client->assess(request, *stop));
        } catch (...) {
            outcome->set_exception(std::current_exception());
        }
        int expected = 0;
        if (!state->compare_exchange_strong(expected, 2)) abandoned->fetch_sub(1);
    });

    auto abandon = [&]() {
        stop->cancel();
        abandoned->fetch_add(1);
        int expected = 0;
        if (!state->compare_exchange_strong(expected, 1)) abandoned->fetch_sub(1);
        worker.detach();
    };

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    const auto poll = std::chrono::milliseconds(5);
    while (reply.wait_for(poll) != std::future_status::ready) {
        if (cancel && cancel->is_cancelled()) {
            abandon();
            throw ServiceError("assessment cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            abandon();
            log::warn("abandoned a content-quality call; " + std::to_string(abandoned->load()) + " still running");
            throw ServiceError("content-quality service timed out after " + std::to_string(options_.timeout.count()) +
                               " ms");
        }
    }
    worker.join();
    return reply.get();
}

SemanticResult SemanticValidator::assess(const Dictionary& payload,
                                         const Dictionary& schema,
                                         const StructuralResult& structural,
                                         ValidationLevel level,
                                         const std::string& validation_type,
                                         const CancellationTokenPtr& cancel) const {
    if (cancel && cancel->is_cancelled()) return fallback(payload, structural, validation_type, "assessment cancelled");

    try {
        AssessmentRequest request = build_request(payload, schema, structural, level, validation_type);
        std::string body = call_with_deadline(request, cancel);
        auto parsed = parse_assessment(body, level);
        if (!parsed) {
            log::warn("content-quality service returned a malformed assessment");
            return fallback(payload, structural, validation_type, "malformed response from content-quality service");
        }
        log::debug("semantic score " + std::to_string(parsed->semantic_score));
        return *parsed;
    } catch (const ServiceError& e) {
        log::warn(std::string("semantic validation degraded: ") + e.what());
        return fallback(payload, structural, validation_type, e.what());
    } catch (const std::exception& e) {
        log::error(std::string("semantic validation failed internally: ") + e.what());
        return fallback(payload, structural, validation_type, std::string("internal error: ") + e.what());
    }
}

}  // namespace sg
