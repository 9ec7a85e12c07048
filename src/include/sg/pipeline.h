#pragma once

#include <sg/config.h>
#include <sg/report.h>
#include <sg/schema.h>
#include <sg/schema_source.h>
#include <sg/semantic.h>
#include <sg/structural_validator.h>
#include <memory>
#include <optional>
#include <string>

namespace sg {

struct PipelineOptions {
    // Whether validate() runs the semantic pass at all.
    bool semantic_enabled = true;
    ValidationLevel default_level = ValidationLevel::Standard;
};

// Compiles the schema, runs the structural pass, then the semantic pass when
// allowed, and merges both into one report. Stateless between calls and safe
// to use from several threads at once.
class ValidationPipeline {
  public:
    ValidationPipeline(SchemaCompiler compiler,
                       StructuralValidator structural,
                       std::shared_ptr<const SemanticValidator> semantic,
                       std::shared_ptr<const SchemaSource> source = nullptr,
                       PipelineOptions options = PipelineOptions());

    // Wires everything from a config. The factory defaults to an HTTP client
    // when an endpoint is configured and to a null factory otherwise.
    static ValidationPipeline from_config(const EngineConfig& config,
                                          std::shared_ptr<ContentQualityClientFactory> factory = nullptr);

    ValidationReport run(const Dictionary& payload,
                         const Dictionary& schema_description,
                         ValidationLevel level,
                         bool semantic_enabled,
                         const std::string& validation_type = "generic",
                         const CancellationTokenPtr& cancel = nullptr) const;

    // Resolves the schema reference first. Without an explicit level the
    // schema's stored level, then the default level, applies.
    ValidationReport validate(const Dictionary& content,
                              const SchemaRef& schema,
                              const std::string& validation_type = "generic",
                              std::optional<ValidationLevel> level = std::nullopt,
                              const CancellationTokenPtr& cancel = nullptr) const;

    const PipelineOptions& options() const { return options_; }

  private:
    ValidationReport schema_failure(const FieldPath& path,
                                    const std::string& message,
                                    ValidationLevel level,
                                    const std::string& validation_type) const;

    SchemaCompiler compiler_;
    StructuralValidator structural_;
    std::shared_ptr<const SemanticValidator> semantic_;
    std::shared_ptr<const SchemaSource> source_;
    PipelineOptions options_;
};

}  // namespace sg
