#include "cli_parser.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cmdtrust::app::cli {

    using namespace cmdtrust::core::errors;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> intent;
        std::optional<std::string> command;
        std::optional<std::string> source;
        std::optional<std::string> question;
        std::optional<std::string> project_root;
        std::vector<std::string> tried;
        std::vector<std::string> context;
        bool no_save = false;
        bool verbose = false;
    };

    namespace {

    // Subcommand -> protocol op.
    const std::map<std::string, std::string>& subcommand_ops() {
        static const std::map<std::string, std::string> ops = {
            {"ask", "ask_command"},
            {"teach", "teach_command"},
            {"run", "run_command"},
            {"clear", "clear_command"},
            {"bootstrap", "bootstrap_command"},
            {"learn-project", "learn_project"},
            {"status", "get_memory_status"},
            {"serve", ""},
        };
        return ops;
    }

    // Flags each subcommand accepts besides --project-root and --verbose.
    const std::set<std::string>& allowed_flags(const std::string& subcommand) {
        static const std::map<std::string, std::set<std::string>> allowed = {
            {"ask", {"--intent", "--question", "--tried", "--context"}},
            {"teach", {"--intent", "--command", "--source", "--no-save"}},
            {"run", {"--intent"}},
            {"clear", {"--intent"}},
            {"bootstrap", {"--intent"}},
            {"learn-project", {}},
            {"status", {}},
            {"serve", {}},
        };
        return allowed.at(subcommand);
    }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        const std::string usage =
            "Usage: cmdtrust <ask|teach|run|clear|bootstrap|learn-project|status|serve> "
            "[--intent I] [--command C] [--project-root DIR] [--verbose]";
        if (argc < 2) {
            return TrustError{ErrorCategory::Input, "No command provided.", "missing_command", usage};
        }

        std::string subcommand = argv[1];
        const auto op = subcommand_ops().find(subcommand);
        if (op == subcommand_ops().end()) {
            return TrustError{ErrorCategory::Input, "Unknown command: " + subcommand, "unknown_command", usage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and subcommand
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const auto& allowed = allowed_flags(subcommand);
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool common = flag == "--project-root" || flag == "--verbose";
            const bool known = common || flag == "--intent" || flag == "--command" ||
                               flag == "--source" || flag == "--question" || flag == "--tried" ||
                               flag == "--context" || flag == "--no-save";
            if (!known) {
                return TrustError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (!common && allowed.count(flag) == 0) {
                return TrustError{ErrorCategory::Input, "Argument " + flag + " is not valid for '" + subcommand + "'",
                                  "unsupported_argument"};
            }

            if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            }
            if (flag == "--no-save") {
                raw.no_save = true;
                continue;
            }

            if (i + 1 >= args.size()) {
                return TrustError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            const std::string& value = args[++i];
            if (flag == "--intent") raw.intent = value;
            else if (flag == "--command") raw.command = value;
            else if (flag == "--source") raw.source = value;
            else if (flag == "--question") raw.question = value;
            else if (flag == "--project-root") raw.project_root = value;
            else if (flag == "--tried") raw.tried.push_back(value);
            else if (flag == "--context") raw.context.push_back(value);
        }

        // 3. Validator Phase: Enforce required flags and build the request
        CliOptions options;
        options.verbose = raw.verbose;

        const bool needs_intent = allowed.count("--intent") > 0;
        if (needs_intent && (!raw.intent.has_value() || raw.intent->empty())) {
            return TrustError{ErrorCategory::Input, "Missing required flag --intent for '" + subcommand + "'",
                              "missing_required_flag", "For example: --intent test"};
        }
        if (subcommand == "teach" && (!raw.command.has_value() || raw.command->empty())) {
            return TrustError{ErrorCategory::Input, "Missing required flag --command for 'teach'",
                              "missing_required_flag"};
        }

        if (subcommand == "serve") {
            options.mode = CliMode::Serve;
        } else {
            options.request["op"] = op->second;
            if (raw.intent) options.request["intent"] = raw.intent.value();
            if (raw.command) options.request["command"] = raw.command.value();
            if (raw.source) options.request["source"] = raw.source.value();
            if (raw.question) options.request["question"] = raw.question.value();
            if (subcommand == "teach") options.request["save"] = !raw.no_save;
            if (!raw.tried.empty()) options.request["tried"] = raw.tried;

            if (!raw.context.empty()) {
                json context = json::object();
                for (const auto& pair : raw.context) {
                    const auto eq = pair.find('=');
                    if (eq == std::string::npos || eq == 0) {
                        return TrustError{ErrorCategory::Input, "Invalid --context value: " + pair,
                                          "invalid_context", "Use key=value."};
                    }
                    context[pair.substr(0, eq)] = pair.substr(eq + 1);
                }
                options.request["context"] = context;
            }
        }

        // Path validation
        std::error_code path_ec;
        std::filesystem::path p;
        if (raw.project_root) {
            p = raw.project_root.value();
        } else {
            p = std::filesystem::current_path(path_ec);
            if (path_ec) {
                return TrustError{ErrorCategory::Input, "Unable to determine the working directory",
                                  "invalid_path", "Pass --project-root explicitly."};
            }
        }
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return TrustError{ErrorCategory::Input, "Project root does not exist or is not a directory", "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return TrustError{ErrorCategory::Input, "Failed to canonicalize project root", "invalid_path"};
        }
        options.project_root = std::move(canonical_path);

        return options;
    }

} // namespace cmdtrust::app::cli
