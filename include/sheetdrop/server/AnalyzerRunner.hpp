#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace sheetdrop {

enum class AnalyzerOutcome {
    Completed,    // exited with status 0
    NonZeroExit,
    TimedOut,     // killed after the configured timeout
    SpawnFailed,  // program missing or not executable
};

const char* to_string(AnalyzerOutcome outcome);

struct AnalyzerResult {
    AnalyzerOutcome outcome = AnalyzerOutcome::SpawnFailed;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    std::string message;

    bool ok() const { return outcome == AnalyzerOutcome::Completed; }
};

/**
 * Runs the external analyzer as `<command...> <input path>` inside a working
 * directory, capturing stdout and stderr separately. Blocks until the child
 * exits or the timeout expires.
 */
class AnalyzerRunner {
public:
    AnalyzerRunner(std::vector<std::string> command, std::chrono::seconds timeout);

    AnalyzerResult run(const std::filesystem::path& input, const std::filesystem::path& workingDir) const;

    const std::vector<std::string>& command() const { return command_; }

    // True when some command argument names `file` once resolved against workingDir
    bool refersTo(const std::filesystem::path& file, const std::filesystem::path& workingDir) const;

private:
    std::vector<std::string> command_;
    std::chrono::seconds timeout_;

    // Absolute program path; bare names are looked up in PATH
    std::string resolveProgram() const;
};

} // namespace sheetdrop
