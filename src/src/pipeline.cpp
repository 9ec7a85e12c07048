#include <sg/pipeline.h>
#include <sg/http_client.h>
#include <sg/log.h>
#include <chrono>

namespace sg {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto d = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

ValidationPipeline::ValidationPipeline(SchemaCompiler compiler,
                                       StructuralValidator structural,
                                       std::shared_ptr<const SemanticValidator> semantic,
                                       std::shared_ptr<const SchemaSource> source,
                                       PipelineOptions options)
    : compiler_(std::move(compiler)),
      structural_(structural),
      semantic_(std::move(semantic)),
      source_(std::move(source)),
      options_(options) {
    if (!semantic_) semantic_ = std::make_shared<const SemanticValidator>(std::make_shared<NullClientFactory>());
}

ValidationPipeline ValidationPipeline::from_config(const EngineConfig& config,
                                                   std::shared_ptr<ContentQualityClientFactory> factory) {
    if (!factory) {
        if (config.semantic_endpoint.empty()) {
            factory = std::make_shared<NullClientFactory>();
        } else {
            HttpClientOptions http;
            http.endpoint = config.semantic_endpoint;
            http.api_key = config.semantic_api_key;
            http.model = config.semantic_model;
            http.timeout = std::chrono::milliseconds(config.semantic_timeout_ms);
            factory = std::make_shared<HttpClientFactory>(http);
        }
    }

    CompilerOptions compiler_options;
    compiler_options.name_aliases = config.name_aliases;
    compiler_options.name_config = config.name_heuristic;

    StructuralOptions structural_options;
    structural_options.strict_unknown_fields = config.strict_unknown_fields;

    SemanticOptions semantic_options = config.semantic;
    semantic_options.timeout = std::chrono::milliseconds(config.semantic_timeout_ms);

    std::shared_ptr<const SchemaSource> source;
    if (!config.schema_dir.empty()) source = std::make_shared<const DirectorySchemaSource>(config.schema_dir);

    PipelineOptions options;
    options.semantic_enabled = config.semantic_enabled;
    options.default_level = config.default_level;

    return ValidationPipeline(SchemaCompiler(compiler_options),
                              StructuralValidator(structural_options),
                              std::make_shared<const SemanticValidator>(factory, semantic_options),
                              source,
                              options);
}

ValidationReport ValidationPipeline::schema_failure(const FieldPath& path,
                                                    const std::string& message,
                                                    ValidationLevel level,
                                                    const std::string& validation_type) const {
    ValidationReport report;
    report.validation_type = validation_type;
    report.validation_level = level;
    report.structural.is_structurally_valid = false;
    report.structural.errors.push_back(FieldError{
        path, ErrorKind::SchemaError, message, "Fix the schema definition before validating data against it"});
    report.is_valid = false;
    return report;
}

ValidationReport ValidationPipeline::run(const Dictionary& payload,
                                         const Dictionary& schema_description,
                                         ValidationLevel level,
                                         bool semantic_enabled,
                                         const std::string& validation_type,
                                         const CancellationTokenPtr& cancel) const {
    const auto start = std::chrono::steady_clock::now();

    CompiledSchemaPtr schema;
    try {
        schema = compiler_.compile(schema_description);
    } catch (const CompilationError& e) {
        log::warn(e.what());
        ValidationReport report = schema_failure(e.path, e.what(), level, validation_type);
        report.processing_time_ms = elapsed_ms(start);
        return report;
    }

    ValidationReport report;
    report.validation_type = validation_type;
    report.validation_level = level;
    report.structural = structural_.validate(*schema, payload);

    if (semantic_enabled && SemanticValidator::should_assess(report.structural, level)) {
        report.semantic = semantic_->assess(payload, schema_description, report.structural, level, validation_type, cancel);
    }

    report.is_valid = report.structural.is_valid() && (!report.semantic || report.semantic->is_semantically_valid);
    report.processing_time_ms = elapsed_ms(start);
    log::info("validation finished: " + std::string(report.is_valid ? "valid" : "invalid") + " in " +
              std::to_string(report.processing_time_ms) + " ms");
    return report;
}

ValidationReport ValidationPipeline::validate(const Dictionary& content,
                                              const SchemaRef& schema,
                                              const std::string& validation_type,
                                              std::optional<ValidationLevel> level,
                                              const CancellationTokenPtr& cancel) const {
    ResolvedSchema resolved;
    try {
        resolved = resolve_schema(schema, source_.get());
    } catch (const SchemaSourceError& e) {
        log::warn(e.what());
        return schema_failure(FieldPath{}, e.what(), level.value_or(options_.default_level), validation_type);
    }

    ValidationLevel effective = level.value_or(resolved.validation_level.value_or(options_.default_level));
    bool semantic = options_.semantic_enabled && !resolved.structure_only;

    ValidationReport report = run(content, resolved.description, effective, semantic, validation_type, cancel);
    report.schema_name = resolved.name;
    report.schema_version = resolved.version;
    return report;
}

}  // namespace sg
