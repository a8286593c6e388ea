#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <sluice/cli/command.h>
#include <sluice/config/sluice_config.h>
#include <sluice/transfer/transfer.hpp>

namespace sluice::cli {

/**
 * Main CLI application class
 */
class SluiceCLI {
public:
    SluiceCLI();
    ~SluiceCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Effective configuration, loaded on first use and cached for the run.
     * Also applies the log level (SLUICE_LOG_LEVEL > --verbose > [log] level > warn).
     */
    Result<config::SluiceConfig> loadConfig();

    /**
     * State store for this run: in-memory for dry runs, otherwise files under stateDir.
     */
    Result<std::shared_ptr<transfer::IStateStore>>
    openStateStore(const std::filesystem::path& stateDir, bool dryRun);

    std::shared_ptr<transfer::ISourceReader> getSourceReader();
    void setSourceReader(std::shared_ptr<transfer::ISourceReader> reader) {
        sourceReader_ = std::move(reader);
    }

    std::shared_ptr<storage::MemoryObjectStore> getMemoryStore() const { return memoryStore_; }

    /**
     * True once SIGINT/SIGTERM was received (or requestCancel() called)
     */
    transfer::ShouldCancel shouldCancel() const;
    static void requestCancel();
    static void resetCancel();

    std::ostream& out() { return *out_; }
    std::ostream& err() { return *err_; }
    void setOutputStreams(std::ostream& out, std::ostream& err) {
        out_ = &out;
        err_ = &err;
    }

    void setExitCode(int code) { exitCode_ = code; }
    bool isVerbose() const { return verbose_; }

private:
    void registerBuiltinCommands();
    void applyLogLevel(const config::SluiceConfig& cfg);
    static void installSignalHandlers();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    bool verbose_{false};
    int exitCode_{0};

    std::optional<config::SluiceConfig> config_;
    std::shared_ptr<transfer::ISourceReader> sourceReader_;
    std::shared_ptr<storage::MemoryObjectStore> memoryStore_;

    std::ostream* out_;
    std::ostream* err_;
};

std::unique_ptr<ICommand> createDownloadCommand();
std::unique_ptr<ICommand> createStatusCommand();

} // namespace sluice::cli
