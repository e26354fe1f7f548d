#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/errors/trust_errors.hpp"

namespace cmdtrust::app::cli {

    enum class CliMode {
        Request,  // one JSON request built from flags
        Serve     // JSON-lines requests on stdin
    };

    struct CliOptions {
        CliMode mode = CliMode::Request;
        nlohmann::json request = nlohmann::json::object();
        std::filesystem::path project_root;  // canonical; the working directory by default
        bool verbose = false;
    };

    cmdtrust::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
