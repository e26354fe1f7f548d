#pragma once
#include <string>
#include <random>
#include <sstream>

namespace cmdtrust::core::config {

    // Generates a random UUID-v4-shaped token (8-4-4-4-12 hex digits).
    inline std::string generate_project_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);
        std::uniform_int_distribution<> variant_dis(8, 11);

        std::stringstream ss;
        ss << std::hex;
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                ss << '-';
            }
            if (i == 12) {
                ss << 4;
            } else if (i == 16) {
                ss << variant_dis(gen);
            } else {
                ss << dis(gen);
            }
        }
        return ss.str();
    }

    // Short random suffix for scratch paths (temp files, test workspaces).
    inline std::string generate_scratch_suffix() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace cmdtrust::core::config
