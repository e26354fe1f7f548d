#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include "core/config/project_id.hpp"
#include "core/errors/trust_errors.hpp"
#include "exec/process_runner.hpp"

namespace cmdtrust::test_support {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag) {
        root_ = std::filesystem::current_path() /
                (".tmp_" + tag + "_" + cmdtrust::core::config::generate_scratch_suffix());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Replays one canned outcome for every call and records what it was asked
// to run. Files listed in `creates` are written under the working directory
// to simulate side effects.
class FakeProcessRunner : public cmdtrust::exec::ProcessRunner {
public:
    cmdtrust::exec::ProcessCapture capture;
    std::optional<cmdtrust::core::errors::TrustError> error;
    std::vector<std::string> creates;

    static FakeProcessRunner succeeding(const std::string& output, double duration_ms) {
        FakeProcessRunner runner;
        runner.capture.exit_code = 0;
        runner.capture.stdout_text = output;
        runner.capture.duration_ms = duration_ms;
        return runner;
    }

    cmdtrust::core::errors::Result<cmdtrust::exec::ProcessCapture> run(
        const cmdtrust::exec::ProcessRequest& request) const override {
        requests_.push_back(request);
        if (error.has_value()) {
            return error.value();
        }
        for (const auto& name : creates) {
            write_file(request.working_directory / name, "side effect\n");
        }
        return capture;
    }

    std::size_t calls() const { return requests_.size(); }
    const cmdtrust::exec::ProcessRequest& last_request() const { return requests_.back(); }

private:
    mutable std::vector<cmdtrust::exec::ProcessRequest> requests_;
};

}  // namespace cmdtrust::test_support
