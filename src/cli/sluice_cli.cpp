#include <sluice/cli/download_runner.h>
#include <sluice/cli/sluice_cli.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace sluice::cli {

namespace {

std::atomic<bool> g_cancelRequested{false};

void handleTerminationSignal(int) {
    g_cancelRequested.store(true);
}

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

SluiceCLI::SluiceCLI()
    : app_(std::make_unique<CLI::App>("sluice - durable downloads into object storage", "sluice")),
      memoryStore_(std::make_shared<storage::MemoryObjectStore>()), out_(&std::cout),
      err_(&std::cerr) {
    app_->require_subcommand(1);
    app_->set_version_flag("--version", std::string("sluice 1.0.0"));
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_option("--config", configPath_, "Configuration file (TOML subset)");
    registerBuiltinCommands();
}

SluiceCLI::~SluiceCLI() = default;

void SluiceCLI::registerBuiltinCommands() {
    commands_.push_back(createDownloadCommand());
    commands_.push_back(createStatusCommand());
    for (auto& command : commands_) {
        command->registerCommand(*app_, this);
    }
}

int SluiceCLI::run(int argc, char* argv[]) {
    exitCode_ = kExitSuccess;
    config_.reset();
    installSignalHandlers();

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app_->exit(e, *out_, *err_);
        // --help and --version exit with success; anything else is a usage error
        return code == 0 ? kExitSuccess : kExitInvalid;
    }
    return exitCode_;
}

Result<config::SluiceConfig> SluiceCLI::loadConfig() {
    if (config_) {
        return *config_;
    }
    auto loaded = config::loadConfig(configPath_);
    if (!loaded) {
        return loaded.error();
    }
    config_ = std::move(loaded).value();
    applyLogLevel(*config_);
    return *config_;
}

void SluiceCLI::applyLogLevel(const config::SluiceConfig& cfg) {
    // Precedence: env SLUICE_LOG_LEVEL > --verbose > [log] level > warn
    if (const char* envLvl = std::getenv("SLUICE_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown SLUICE_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (cfg.logLevel) {
        if (auto lvl = parseLevel(*cfg.logLevel)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown log level '{}' in {}", *cfg.logLevel,
                     cfg.sourcePath.string());
    }
    spdlog::set_level(spdlog::level::warn);
}

Result<std::shared_ptr<transfer::IStateStore>>
SluiceCLI::openStateStore(const std::filesystem::path& stateDir, bool dryRun) {
    if (dryRun) {
        return transfer::makeInMemoryStateStore();
    }
    return transfer::makeFileStateStore(stateDir);
}

std::shared_ptr<transfer::ISourceReader> SluiceCLI::getSourceReader() {
    if (!sourceReader_) {
        sourceReader_ = transfer::makeHttpSourceReader();
    }
    return sourceReader_;
}

transfer::ShouldCancel SluiceCLI::shouldCancel() const {
    return [] { return g_cancelRequested.load(); };
}

void SluiceCLI::requestCancel() {
    g_cancelRequested.store(true);
}

void SluiceCLI::resetCancel() {
    g_cancelRequested.store(false);
}

void SluiceCLI::installSignalHandlers() {
    std::signal(SIGINT, handleTerminationSignal);
    std::signal(SIGTERM, handleTerminationSignal);
}

} // namespace sluice::cli
