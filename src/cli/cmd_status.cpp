#include <sluice/cli/download_runner.h>
#include <sluice/cli/sluice_cli.h>
#include <sluice/config/config_helpers.h>
#include <sluice/transfer/json_codec.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

namespace sluice::cli {

using namespace sluice::transfer;

// sluice status: print the recorded TransferState of a request without running it
class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show the recorded state of a transfer";
    }

    void registerCommand(CLI::App& app, SluiceCLI* cli) override {
        cli_ = cli;
        auto* sub = app.add_subcommand(getName(), getDescription());
        sub->add_option("url", url_, "Source URL")->required();
        sub->add_option("-o,--output", output_, "Destination of the transfer")->required();
        sub->add_option("--idempotency-key", idempotencyKey_, "Explicit transfer key");
        sub->add_option("--invocation-id", invocationId_, "Caller identity");
        sub->add_option("--state-dir", stateDir_, "Directory holding transfer state");

        sub->callback([this]() {
            auto result = execute();
            if (!result) {
                cli_->err() << "error: " << errorCodeName(result.error().code) << ": "
                            << result.error().message << "\n";
                cli_->setExitCode(
                    exitCodeFor(RunOutcome{std::nullopt, result.error(), 0, false}));
            }
        });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto stateDir = stateDir_ ? config::expand_tilde(*stateDir_) : cfg.value().stateDir;
        auto store = cli_->openStateStore(stateDir, false);
        if (!store) {
            return store.error();
        }
        auto orchestrator = makeTransferOrchestrator(config::toTransferConfig(cfg.value()),
                                                     store.value(), cli_->getSourceReader());

        TransferRequest request;
        request.url = url_;
        request.output.url = output_;
        request.idempotencyKey = idempotencyKey_;
        request.invocationId = invocationId_;

        auto state = orchestrator->inspect(request);
        if (!state) {
            return state.error();
        }
        if (!state.value()) {
            cli_->err() << "No transfer recorded for " << url_ << " -> " << output_ << "\n";
            cli_->setExitCode(kExitFatal);
            return Result<void>();
        }
        cli_->out() << stateToJson(*state.value()).dump(2) << "\n";
        cli_->setExitCode(kExitSuccess);
        return Result<void>();
    }

private:
    SluiceCLI* cli_{nullptr};
    std::string url_;
    std::string output_;
    std::optional<std::string> idempotencyKey_;
    std::optional<std::string> invocationId_;
    std::optional<std::string> stateDir_;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace sluice::cli
