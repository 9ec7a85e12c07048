#include <catch2/catch_all.hpp>
#include <sg/json.h>
#include <sg/semantic.h>
#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

using namespace sg;
using namespace sg::json_literals;

namespace {

using Script = std::function<std::string(const AssessmentRequest&, const CancellationToken&)>;

class ScriptedClient : public ContentQualityClient {
  public:
    explicit ScriptedClient(Script script) : script_(std::move(script)) {}
    std::string assess(const AssessmentRequest& request, const CancellationToken& cancel) override {
        return script_(request, cancel);
    }

  private:
    Script script_;
};

class ScriptedFactory : public ContentQualityClientFactory {
  public:
    explicit ScriptedFactory(Script script) : script_(std::move(script)) {}
    std::unique_ptr<ContentQualityClient> acquire() override {
        ++acquired;
        return std::make_unique<ScriptedClient>(script_);
    }
    std::atomic<int> acquired{0};

  private:
    Script script_;
};

std::shared_ptr<ScriptedFactory> replying(const std::string& body) {
    return std::make_shared<ScriptedFactory>([body](const AssessmentRequest&, const CancellationToken&) { return body; });
}

// Blocks until told to stop, like a service that never answers.
std::shared_ptr<ScriptedFactory> hanging() {
    return std::make_shared<ScriptedFactory>([](const AssessmentRequest&, const CancellationToken& cancel) -> std::string {
        auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!cancel.is_cancelled() && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw ServiceError("stopped");
    });
}

SemanticOptions short_timeout() {
    SemanticOptions options;
    options.timeout = std::chrono::milliseconds(50);
    return options;
}

StructuralResult valid_structural(const Dictionary& data) {
    StructuralResult r;
    r.validated_data = data;
    return r;
}

StructuralResult failed_structural(std::vector<FieldError> errors) {
    StructuralResult r;
    r.is_structurally_valid = false;
    r.errors = std::move(errors);
    return r;
}

const Dictionary payload = R"({"recommendation_text": "Use a password manager and enable two-factor login."})"_json;
const Dictionary schema = R"({"recommendation_text": {"type": "string", "required": true}})"_json;

bool contains(const std::vector<std::string>& v, const std::string& needle) {
    return std::any_of(v.begin(), v.end(), [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

}  // namespace

TEST_CASE("A well-formed assessment is returned as is", "[semantic]") {
    SemanticValidator validator(replying(R"({
        "is_semantically_valid": true,
        "semantic_score": 0.9,
        "issues": [],
        "suggestions": ["Mention backups"]
    })"));
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
    REQUIRE(r.is_semantically_valid);
    REQUIRE(r.semantic_score == Catch::Approx(0.9));
    REQUIRE(r.issues.empty());
    REQUIRE(r.suggestions == std::vector<std::string>{"Mention backups"});
    REQUIRE_FALSE(r.degraded);
}

TEST_CASE("The acceptance threshold depends on the level", "[semantic]") {
    SemanticValidator validator(replying(R"({"is_semantically_valid": true, "semantic_score": 0.75})"));
    auto structural = valid_structural(payload);
    REQUIRE(validator.assess(payload, schema, structural, ValidationLevel::Basic).is_semantically_valid);
    REQUIRE(validator.assess(payload, schema, structural, ValidationLevel::Standard).is_semantically_valid);
    REQUIRE_FALSE(validator.assess(payload, schema, structural, ValidationLevel::Strict).is_semantically_valid);
}

TEST_CASE("A negative service verdict wins over a high score", "[semantic]") {
    SemanticValidator validator(replying(R"({"is_semantically_valid": false, "semantic_score": 0.95})"));
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Basic);
    REQUIRE_FALSE(r.is_semantically_valid);
    REQUIRE_FALSE(r.degraded);
}

TEST_CASE("Parsing assessment bodies", "[semantic]") {
    SemanticValidator validator(std::make_shared<NullClientFactory>());

    SECTION("scores are clamped into [0, 1]") {
        auto high = validator.parse_assessment(R"({"semantic_score": 1.7})", ValidationLevel::Standard);
        REQUIRE(high);
        REQUIRE(high->semantic_score == 1.0);
        REQUIRE(high->is_semantically_valid);
        auto low = validator.parse_assessment(R"({"semantic_score": -2})", ValidationLevel::Standard);
        REQUIRE(low);
        REQUIRE(low->semantic_score == 0.0);
        REQUIRE_FALSE(low->is_semantically_valid);
    }
    SECTION("an assessment wrapped in a response string is unwrapped") {
        auto r = validator.parse_assessment(
            R"({"model": "m", "response": "{\"semantic_score\": 0.8, \"issues\": [\"vague\"]}", "done": true})",
            ValidationLevel::Standard);
        REQUIRE(r);
        REQUIRE(r->semantic_score == Catch::Approx(0.8));
        REQUIRE(r->issues == std::vector<std::string>{"vague"});
    }
    SECTION("chat completion envelopes are unwrapped") {
        auto r = validator.parse_assessment(
            R"({"choices": [{"message": {"role": "assistant", "content": "Sure: {\"semantic_score\": 0.6}"}}]})",
            ValidationLevel::Basic);
        REQUIRE(r);
        REQUIRE(r->semantic_score == Catch::Approx(0.6));
    }
    SECTION("missing lists become empty") {
        auto r = validator.parse_assessment(R"({"semantic_score": 0.8})", ValidationLevel::Standard);
        REQUIRE(r);
        REQUIRE(r->issues.empty());
        REQUIRE(r->suggestions.empty());
    }
    SECTION("unusable bodies are rejected") {
        REQUIRE_FALSE(validator.parse_assessment("I cannot help with that.", ValidationLevel::Standard));
        REQUIRE_FALSE(validator.parse_assessment(R"({"issues": []})", ValidationLevel::Standard));
        REQUIRE_FALSE(validator.parse_assessment(R"({"semantic_score": "high"})", ValidationLevel::Standard));
        REQUIRE_FALSE(validator.parse_assessment("[0.9]", ValidationLevel::Standard));
    }
}

TEST_CASE("A malformed response degrades to the fallback", "[semantic][fallback]") {
    SemanticValidator validator(replying("<html>502 Bad Gateway</html>"));
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
    REQUIRE(r.degraded);
    REQUIRE(r.degraded_reason == "malformed response from content-quality service");
    REQUIRE(r.semantic_score == 0.5);
    REQUIRE_FALSE(r.issues.empty());
}

TEST_CASE("A service that does not answer in time degrades to the fallback", "[semantic][fallback]") {
    auto factory = hanging();
    SemanticValidator validator(factory, short_timeout());
    auto started = std::chrono::steady_clock::now();
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(r.degraded);
    REQUIRE(r.degraded_reason.find("timed out after 50 ms") != std::string::npos);
    REQUIRE(r.semantic_score == 0.5);
    REQUIRE_FALSE(r.issues.empty());
    REQUIRE(elapsed < std::chrono::seconds(2));
    REQUIRE(factory->acquired.load() == 1);
}

TEST_CASE("The caller can cancel an assessment in flight", "[semantic][fallback]") {
    SemanticOptions options;
    options.timeout = std::chrono::seconds(5);
    SemanticValidator validator(hanging(), options);

    auto cancel = std::make_shared<CancellationToken>();
    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancel->cancel();
    });
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard, "generic", cancel);
    canceller.join();

    REQUIRE(r.degraded);
    REQUIRE(r.degraded_reason == "assessment cancelled");
}

TEST_CASE("An already cancelled assessment never reaches the service", "[semantic][fallback]") {
    auto factory = replying(R"({"semantic_score": 1.0})");
    SemanticValidator validator(factory);
    auto cancel = std::make_shared<CancellationToken>();
    cancel->cancel();
    auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard, "generic", cancel);
    REQUIRE(r.degraded);
    REQUIRE(factory->acquired.load() == 0);
}

TEST_CASE("Service and internal failures degrade to the fallback", "[semantic][fallback]") {
    SECTION("no service configured") {
        SemanticValidator validator(nullptr);
        auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
        REQUIRE(r.degraded);
        REQUIRE(r.degraded_reason == "no semantic service configured");
    }
    SECTION("transport error") {
        SemanticValidator validator(std::make_shared<ScriptedFactory>(
            [](const AssessmentRequest&, const CancellationToken&) -> std::string {
                throw ServiceError("content-quality service returned HTTP 503");
            }));
        auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
        REQUIRE(r.degraded);
        REQUIRE(r.degraded_reason == "content-quality service returned HTTP 503");
    }
    SECTION("unexpected exception") {
        SemanticValidator validator(std::make_shared<ScriptedFactory>(
            [](const AssessmentRequest&, const CancellationToken&) -> std::string {
                throw std::logic_error("boom");
            }));
        auto r = validator.assess(payload, schema, valid_structural(payload), ValidationLevel::Standard);
        REQUIRE(r.degraded);
        REQUIRE(r.degraded_reason == "internal error: boom");
    }
}

TEST_CASE("The fallback uses local signal only", "[semantic][fallback]") {
    SECTION("clean content passes") {
        auto r = SemanticValidator::fallback(payload, valid_structural(payload), "recommendation", "offline");
        REQUIRE(r.degraded);
        REQUIRE(r.degraded_reason == "offline");
        REQUIRE(r.semantic_score == 0.5);
        REQUIRE(r.is_semantically_valid);
        REQUIRE(contains(r.issues, "Semantic validation was unavailable (offline)"));
    }
    SECTION("short recommendations are flagged") {
        auto data = R"({"recommendation_text": "Buy it"})"_json;
        auto r = SemanticValidator::fallback(data, valid_structural(data), "recommendation", "offline");
        REQUIRE_FALSE(r.is_semantically_valid);
        REQUIRE(contains(r.issues, "Recommendation text is too short"));
    }
    SECTION("short summaries are flagged") {
        auto data = R"({"summary": "Too brief."})"_json;
        auto r = SemanticValidator::fallback(data, valid_structural(data), "summary", "offline");
        REQUIRE_FALSE(r.is_semantically_valid);
        REQUIRE(contains(r.issues, "Summary is too short"));
    }
    SECTION("empty strings are flagged") {
        auto data = R"({"title": "   ", "body": "fine"})"_json;
        auto r = SemanticValidator::fallback(data, valid_structural(data), "generic", "offline");
        REQUIRE_FALSE(r.is_semantically_valid);
        REQUIRE(contains(r.issues, "Field 'title' is empty"));
    }
    SECTION("structural errors are reflected") {
        auto structural = failed_structural({FieldError{FieldPath().child("a"), ErrorKind::OutOfRange, "m", "s"}});
        auto r = SemanticValidator::fallback(payload, structural, "generic", "offline");
        REQUIRE_FALSE(r.is_semantically_valid);
        REQUIRE(contains(r.issues, "Structural validation reported 1 error(s)"));
    }
}

TEST_CASE("When the semantic pass is worth running", "[semantic]") {
    auto valid = valid_structural(payload);
    auto minor = failed_structural({FieldError{FieldPath().child("a"), ErrorKind::OutOfRange, "m", "s"}});
    auto root = failed_structural({FieldError{FieldPath(), ErrorKind::TypeMismatch, "m", "s"}});
    auto broken = failed_structural({FieldError{FieldPath(), ErrorKind::SchemaError, "m", "s"}});

    for (auto level : {ValidationLevel::Basic, ValidationLevel::Standard, ValidationLevel::Strict}) {
        REQUIRE(SemanticValidator::should_assess(valid, level));
        REQUIRE_FALSE(SemanticValidator::should_assess(root, level));
        REQUIRE_FALSE(SemanticValidator::should_assess(broken, level));
    }
    REQUIRE_FALSE(SemanticValidator::should_assess(minor, ValidationLevel::Basic));
    REQUIRE_FALSE(SemanticValidator::should_assess(minor, ValidationLevel::Standard));
    REQUIRE(SemanticValidator::should_assess(minor, ValidationLevel::Strict));
}

TEST_CASE("Assessment requests describe the task", "[semantic]") {
    auto structural = failed_structural({FieldError{FieldPath().child("a"), ErrorKind::OutOfRange, "too big", "s"}});
    auto request = SemanticValidator::build_request(payload, schema, structural, ValidationLevel::Strict, "summary");
    REQUIRE(request.level == ValidationLevel::Strict);
    REQUIRE(request.validation_type == "summary");
    REQUIRE(request.prompt.find("Validate this summary AI output with strict strictness.") != std::string::npos);
    REQUIRE(request.prompt.find("too big") != std::string::npos);
    REQUIRE(request.prompt.find("semantic_score") != std::string::npos);
    REQUIRE(request.context.at("validation_level").asString() == "strict");
    REQUIRE(request.context.at("structural_errors").size() == 1);
    REQUIRE(request.context.at("data") == payload);
}

TEST_CASE("Levels and validation types parse from text", "[semantic]") {
    REQUIRE(parse_validation_level("STRICT") == ValidationLevel::Strict);
    REQUIRE(parse_validation_level("basic") == ValidationLevel::Basic);
    REQUIRE_FALSE(parse_validation_level("paranoid"));
    REQUIRE(to_string(ValidationLevel::Standard) == "standard");
    REQUIRE(is_known_validation_type("classification"));
    REQUIRE_FALSE(is_known_validation_type("poem"));
}

TEST_CASE("Semantic results serialize with stable keys", "[semantic]") {
    SemanticResult ok;
    ok.is_semantically_valid = true;
    ok.semantic_score = 0.8;
    REQUIRE(ok.to_dictionary().keys() ==
            std::vector<std::string>{"is_semantically_valid", "semantic_score", "issues", "suggestions", "degraded"});

    auto degraded = SemanticValidator::fallback(payload, valid_structural(payload), "generic", "offline");
    auto d = degraded.to_dictionary();
    REQUIRE(d.at("degraded").asBool());
    REQUIRE(d.at("degraded_reason").asString() == "offline");
}

TEST_CASE("Clients that ignore cancellation cannot pile up threads", "[semantic][fallback]") {
    auto released = std::make_shared<std::atomic<bool>>(false);
    auto factory = std::make_shared<ScriptedFactory>(
        [released](const AssessmentRequest&, const CancellationToken&) -> std::string {
            auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!released->load() && std::chrono::steady_clock::now() < give_up) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return R"({"semantic_score": 0.9})";
        });
    SemanticOptions options;
    options.timeout = std::chrono::milliseconds(20);
    options.max_abandoned_workers = 2;
    SemanticValidator validator(factory, options);

    auto structural = valid_structural(payload);
    REQUIRE(validator.assess(payload, schema, structural, ValidationLevel::Standard).degraded);
    REQUIRE(validator.assess(payload, schema, structural, ValidationLevel::Standard).degraded);
    REQUIRE(validator.abandoned_workers() == 2);

    auto refused = validator.assess(payload, schema, structural, ValidationLevel::Standard);
    REQUIRE(refused.degraded);
    REQUIRE(refused.degraded_reason.find("too many abandoned assessments") != std::string::npos);
    REQUIRE(factory->acquired.load() == 2);

    released->store(true);
    auto wait_until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (validator.abandoned_workers() > 0 && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(validator.abandoned_workers() == 0);

    auto r = validator.assess(payload, schema, structural, ValidationLevel::Standard);
    REQUIRE_FALSE(r.degraded);
    REQUIRE(r.semantic_score == Catch::Approx(0.9));
}
