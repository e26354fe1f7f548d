#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cmdtrust::core::config {

    struct TrustConfig {
        // Ledger location, relative to the project root. Dot-prefixed so the
        // side-effect snapshot never sees ledger writes.
        std::string data_dir = ".cmdtrust";
        std::string ledger_file = "learned-commands.json";
        std::string audit_file = "audit-log.jsonl";
        std::string ledger_version = "1.0";

        std::uint32_t verification_timeout_ms = 10000;
        std::uint32_t trusted_run_timeout_ms = 300000;

        double trust_threshold = 0.7;
        double introspection_threshold = 0.5;
        double confidence_cap = 0.98;
        int min_successes_for_full_weight = 3;

        std::size_t max_command_chars = 8192;
        std::size_t max_rejections = 50;
        std::size_t output_sample_chars = 500;
        std::size_t run_output_tail_chars = 1000;
    };

} // namespace cmdtrust::core::config
