#include "sheetdrop/server/AnalyzerRunner.hpp"
#include <boost/process.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <iostream>
#include <system_error>

namespace bp = boost::process;

namespace sheetdrop {

namespace {
    // How long to keep collecting output after a kill
    constexpr std::chrono::seconds kDrainGrace{2};

    constexpr std::chrono::milliseconds kPollInterval{100};

    std::string collect(std::future<std::string>& stream, const char* name) {
        if (stream.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return {};
        }
        try {
            return stream.get();
        } catch (const std::exception& e) {
            std::cerr << "[analyzer] Lost " << name << ": " << e.what() << std::endl;
            return {};
        }
    }
}

const char* to_string(AnalyzerOutcome outcome) {
    switch (outcome) {
        case AnalyzerOutcome::Completed: return "completed";
        case AnalyzerOutcome::NonZeroExit: return "non_zero_exit";
        case AnalyzerOutcome::TimedOut: return "timed_out";
        case AnalyzerOutcome::SpawnFailed: return "spawn_failed";
        default: return "unknown";
    }
}

AnalyzerRunner::AnalyzerRunner(std::vector<std::string> command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {
    if (command_.empty() || command_.front().empty()) {
        throw std::invalid_argument("Analyzer command must name a program");
    }
}

std::string AnalyzerRunner::resolveProgram() const {
    const std::string& program = command_.front();
    if (program.find('/') != std::string::npos) {
        return program;
    }
    return bp::search_path(program).string();
}

bool AnalyzerRunner::refersTo(const std::filesystem::path& file,
                              const std::filesystem::path& workingDir) const {
    const std::filesystem::path wanted = (workingDir / file).lexically_normal();
    for (const auto& arg : command_) {
        if (arg.empty()) continue;
        std::filesystem::path candidate(arg);
        if (!candidate.is_absolute()) candidate = workingDir / candidate;
        if (candidate.lexically_normal() == wanted) return true;
    }
    return false;
}

AnalyzerResult AnalyzerRunner::run(const std::filesystem::path& input,
                                   const std::filesystem::path& workingDir) const {
    AnalyzerResult result;

    std::string program = resolveProgram();
    if (program.empty()) {
        result.outcome = AnalyzerOutcome::SpawnFailed;
        result.message = "Analyzer program not found in PATH: " + command_.front();
        std::cerr << "[analyzer] " << result.message << std::endl;
        return result;
    }

    std::vector<std::string> args(command_.begin() + 1, command_.end());
    args.push_back(input.string());

    std::cout << "[analyzer] Running " << program << " on " << input.string() << std::endl;

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    std::unique_ptr<bp::child> child;

    try {
        child = std::make_unique<bp::child>(
            bp::exe = program,
            bp::args = args,
            bp::start_dir = workingDir.string(),
            bp::std_in.close(),
            bp::std_out > out,
            bp::std_err > err,
            ios);
    } catch (const bp::process_error& e) {
        result.outcome = AnalyzerOutcome::SpawnFailed;
        result.message = std::string("Failed to start analyzer: ") + e.what();
        std::cerr << "[analyzer] " << result.message << std::endl;
        return result;
    }

    const bool bounded = timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool timedOut = false;

    auto kill = [&child]() {
        std::error_code ec;
        child->terminate(ec);
        if (ec) {
            std::cerr << "[analyzer] Failed to kill pid " << child->id() << ": " << ec.message() << std::endl;
        }
    };

    // Pump output while the child lives. Pipes a grandchild inherited only
    // get the drain grace once the child itself is gone.
    while (!ios.stopped()) {
        ios.run_for(kPollInterval);
        if (ios.stopped()) break;

        if (!child->running()) {
            ios.run_for(kDrainGrace);
            if (!ios.stopped()) {
                std::cerr << "[analyzer] Output pipes still held open after exit, output dropped" << std::endl;
            }
            break;
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            kill();
            ios.run_for(kDrainGrace);
            break;
        }
    }

    if (!timedOut && bounded && child->running()) {
        // Streams closed but the process lingers
        std::error_code ec;
        if (!child->wait_until(deadline, ec) && !ec) {
            timedOut = true;
            kill();
        }
    }

    std::error_code waitError;
    child->wait(waitError);

    result.stdoutText = collect(out, "stdout");
    result.stderrText = collect(err, "stderr");

    if (timedOut) {
        result.outcome = AnalyzerOutcome::TimedOut;
        result.message = "Analyzer timed out after " + std::to_string(timeout_.count()) + "s";
    } else if (waitError) {
        result.outcome = AnalyzerOutcome::NonZeroExit;
        result.message = "Failed to wait for analyzer: " + waitError.message();
    } else {
        result.exitCode = child->exit_code();
        result.outcome = result.exitCode == 0 ? AnalyzerOutcome::Completed : AnalyzerOutcome::NonZeroExit;
        result.message = "Analyzer exited with status " + std::to_string(result.exitCode);
    }

    std::cout << "[analyzer] " << result.message << std::endl;
    return result;
}

} // namespace sheetdrop
