#pragma once

#include <sg/dictionary.h>
#include <sg/structural_validator.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sg {

enum class ValidationLevel { Basic, Standard, Strict };

std::string to_string(ValidationLevel level);
std::optional<ValidationLevel> parse_validation_level(const std::string& s);

// generic, recommendation, summary, classification
const std::vector<std::string>& validation_types();
bool is_known_validation_type(const std::string& s);

struct SemanticResult {
    bool is_semantically_valid = false;
    double semantic_score = 0.0;  // always within [0, 1]
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
    bool degraded = false;
    std::string degraded_reason;

    Dictionary to_dictionary() const;
};

// Shared flag a caller sets to abandon an in-flight assessment.
class CancellationToken {
  public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

  private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

// Transport failure, timeout, non-2xx status or cancellation while talking to
// the content-quality service.
struct ServiceError : public std::runtime_error {
    explicit ServiceError(const std::string& msg) : std::runtime_error(msg) {}
};

struct AssessmentRequest {
    std::string prompt;
    Dictionary context;
    ValidationLevel level = ValidationLevel::Standard;
    std::string validation_type = "generic";
};

// External content-quality assessor. Returns the raw response body;
// interpreting it is the validator's job.
class ContentQualityClient {
  public:
    virtual ~ContentQualityClient() = default;

    // Throws ServiceError. Implementations must poll cancel and return or
    // throw soon after it is set: a call still running at the deadline is
    // abandoned on its own thread, which keeps this client alive until the
    // call returns.
    virtual std::string assess(const AssessmentRequest& request, const CancellationToken& cancel) = 0;
};

class ContentQualityClientFactory {
  public:
    virtual ~ContentQualityClientFactory() = default;

    // One client per assessment; released when the assessment ends. Throws
    // ServiceError when no client can be provided.
    virtual std::unique_ptr<ContentQualityClient> acquire() = 0;
};

// Used when no semantic service is configured; acquisition always fails.
class NullClientFactory : public ContentQualityClientFactory {
  public:
    std::unique_ptr<ContentQualityClient> acquire() override;
};

struct SemanticOptions {
    std::chrono::milliseconds timeout{10000};
    double basic_threshold = 0.5;
    double standard_threshold = 0.7;
    double strict_threshold = 0.85;
    // Abandoned calls still running beyond this count make new assessments
    // degrade without starting another thread.
    int max_abandoned_workers = 16;

    double threshold(ValidationLevel level) const;
};

class SemanticValidator {
  public:
    explicit SemanticValidator(std::shared_ptr<ContentQualityClientFactory> factory,
                               SemanticOptions options = SemanticOptions());

    // Valid structural results always qualify. At strict level, results whose
    // errors are all non-fatal qualify too.
    static bool should_assess(const StructuralResult& structural, ValidationLevel level);

    // Never throws; any failure yields the degraded fallback.
    SemanticResult assess(const Dictionary& payload,
                          const Dictionary& schema,
                          const StructuralResult& structural,
                          ValidationLevel level,
                          const std::string& validation_type = "generic",
                          const CancellationTokenPtr& cancel = nullptr) const;

    // Conservative result computed from local signal only.
    static SemanticResult fallback(const Dictionary& payload,
                                   const StructuralResult& structural,
                                   const std::string& validation_type,
                                   const std::string& reason);

    static AssessmentRequest build_request(const Dictionary& payload,
                                           const Dictionary& schema,
                                           const StructuralResult& structural,
                                           ValidationLevel level,
                                           const std::string& validation_type);

    // Interprets a response body. Returns nullopt when it is unusable.
    std::optional<SemanticResult> parse_assessment(const std::string& body, ValidationLevel level) const;

    const SemanticOptions& options() const { return options_; }

    // Calls given up on by timeout or cancellation that have not returned yet.
    int abandoned_workers() const { return abandoned_->load(); }

  private:
    std::string call_with_deadline(const AssessmentRequest& request, const CancellationTokenPtr& cancel) const;

    std::shared_ptr<ContentQualityClientFactory> factory_;
    SemanticOptions options_;
    std::shared_ptr<std::atomic<int>> abandoned_;
};

}  // namespace sg
