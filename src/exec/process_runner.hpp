#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/trust_errors.hpp"

namespace cmdtrust::exec {

struct ProcessRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 10000;
    // Per stream. Past the limit only the head and tail are kept; 0 keeps
    // everything.
    std::size_t max_output_bytes = 1024 * 1024;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;
    double duration_ms = 0.0;
};

// Runs one shell command to completion or until its deadline. An error
// result means the process could not be started at all; a command that ran
// and failed is a capture with a non-zero exit code.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const = 0;
};

// `/bin/sh -c` in a fresh process group. Timeouts and cancellation kill the
// whole group.
class ShellProcessRunner : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const override;
};

}  // namespace cmdtrust::exec
