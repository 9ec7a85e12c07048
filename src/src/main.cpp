#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <sg/schemagate.h>
#include <sg/text_utils.h>

namespace {

const char* usage_text =
    "usage:\n"
    "  schemagate --validate <schema.json> <content.json> [options]\n"
    "  schemagate --schema <name>[@version] <content.json> [--schema-dir <dir>] [options]\n"
    "  schemagate --capabilities\n"
    "options:\n"
    "  --type <generic|recommendation|summary|classification>\n"
    "  --level <basic|standard|strict>\n"
    "  --semantic | --no-semantic\n"
    "  --strict          report fields the schema does not declare\n"
    "  --config <file>   engine configuration (JSON)\n"
    "  --compact         print the report on one line\n";

const std::vector<std::string> known_options = {"--validate", "--schema",  "--schema-dir", "--capabilities",
                                                "--type",     "--level",   "--semantic",   "--no-semantic",
                                                "--strict",   "--config",  "--compact",    "--help"};

struct CliArgs {
    std::string mode;
    std::string schema_path;
    std::string schema_name;
    std::string content_path;
    std::string schema_dir;
    std::string config_path;
    std::string validation_type = "generic";
    std::optional<sg::ValidationLevel> level;
    std::optional<bool> semantic;
    bool strict = false;
    bool compact = false;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Returns an error message, or empty when the arguments are usable.
std::string parse_args(int argc, char** argv, CliArgs& args) {
    std::vector<std::string> positional;
    auto next = [&](int& i, const std::string& opt) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + opt);
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--validate" || a == "--capabilities" || a == "--help" || a == "-h") {
            if (!args.mode.empty()) return "only one of --validate, --schema and --capabilities may be given";
            args.mode = a == "-h" ? "--help" : a;
        } else if (a == "--schema") {
            if (!args.mode.empty()) return "only one of --validate, --schema and --capabilities may be given";
            args.mode = a;
            args.schema_name = next(i, a);
        } else if (a == "--schema-dir") {
            args.schema_dir = next(i, a);
        } else if (a == "--config") {
            args.config_path = next(i, a);
        } else if (a == "--type") {
            args.validation_type = next(i, a);
            if (!sg::is_known_validation_type(args.validation_type)) {
                return "unknown validation type '" + args.validation_type + "'";
            }
        } else if (a == "--level") {
            std::string l = next(i, a);
            args.level = sg::parse_validation_level(l);
            if (!args.level) return "unknown validation level '" + l + "' (expected basic, standard or strict)";
        } else if (a == "--semantic") {
            args.semantic = true;
        } else if (a == "--no-semantic") {
            args.semantic = false;
        } else if (a == "--strict") {
            args.strict = true;
        } else if (a == "--compact") {
            args.compact = true;
        } else if (a.size() > 1 && a[0] == '-') {
            return sg::text_utils::create_unknown_arg_error(a, known_options);
        } else {
            positional.push_back(a);
        }
    }

    if (args.mode.empty()) return "no mode given";
    if (args.mode == "--validate") {
        if (positional.size() != 2) return "--validate needs <schema.json> <content.json>";
        args.schema_path = positional[0];
        args.content_path = positional[1];
    } else if (args.mode == "--schema") {
        if (positional.size() != 1) return "--schema needs <content.json>";
        args.content_path = positional[0];
    } else if (!positional.empty()) {
        return "unexpected argument '" + positional[0] + "'";
    }
    return "";
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs args;
    try {
        std::string err = parse_args(argc, argv, args);
        if (!err.empty()) {
            std::cerr << "error: " << err << "\n" << usage_text;
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n" << usage_text;
        return 2;
    }

    if (args.mode == "--help") {
        std::cout << usage_text;
        return 0;
    }

    try {
        sg::EngineConfig config = args.config_path.empty() ? sg::EngineConfig() : sg::EngineConfig::load(args.config_path);
        sg::apply_environment(config);
        if (args.strict) config.strict_unknown_fields = true;
        if (!args.schema_dir.empty()) config.schema_dir = args.schema_dir;
        // Without an endpoint the semantic pass only runs when asked for.
        config.semantic_enabled = args.semantic.value_or(!config.semantic_endpoint.empty() && config.semantic_enabled);

        if (args.mode == "--capabilities") {
            std::cout << sg::capabilities(config.name_aliases).dump(args.compact ? 0 : 2) << "\n";
            return 0;
        }

        sg::Dictionary content = sg::parse_json(read_file(args.content_path));

        sg::SchemaRef ref = sg::SchemaRef::named("");
        if (args.mode == "--validate") {
            ref = sg::SchemaRef::inline_schema(sg::parse_json(read_file(args.schema_path)));
        } else {
            if (config.schema_dir.empty()) {
                std::cerr << "error: --schema needs --schema-dir or SG_SCHEMA_DIR\n";
                return 2;
            }
            ref = sg::SchemaRef::parse(args.schema_name);
        }

        auto pipeline = sg::ValidationPipeline::from_config(config);
        sg::ValidationReport report = pipeline.validate(content, ref, args.validation_type, args.level);
        std::cout << report.to_json(args.compact ? 0 : 2) << "\n";
        return report.is_valid ? 0 : 1;
    } catch (const sg::JsonParseError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
