/*
 * sluice download
 *
 * Streams one source URL (or every request of a --list / --request document) into its
 * destination through the transfer orchestrator, retrying retryable failures with
 * backoff. Progress persists under the state directory, so re-running the same command
 * resumes an interrupted transfer.
 *
 * Exit codes: 0 success, 1 fatal, 2 invalid request/config, 3 retries exhausted or
 * cancelled (state is resumable).
 */

#include <sluice/cli/download_runner.h>
#include <sluice/cli/sluice_cli.h>
#include <sluice/config/config_helpers.h>
#include <sluice/transfer/json_codec.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace sluice::cli {

using namespace sluice::transfer;

namespace {

struct DownloadOpts {
    // Inputs
    std::string url;
    std::string output;
    std::optional<std::string> requestPath; // JSON request document, "-" = stdin
    std::optional<std::string> listPath;    // JSON lines, "-" = stdin

    std::vector<std::string> headers;
    std::optional<std::string> timeout;
    bool setContentType{false};
    std::optional<std::string> contentType;

    std::optional<std::string> idempotencyKey;
    std::optional<std::string> invocationId;
    bool restart{false};

    // Overrides of [transfer] / [state]
    std::optional<std::string> chunkSize;
    std::optional<std::string> stateDir;

    int jobs{1};
    bool dryRun{false};
    bool emitJson{false};
};

Result<std::string> readDocument(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream in(config::expand_tilde(path), std::ios::binary);
    if (!in) {
        return Error{ErrorCode::InvalidRequest, "Cannot read " + path};
    }
    buffer << in.rdbuf();
    return buffer.str();
}

// mem://dry-run/<key> keeps validation, chunking and state but writes nowhere durable
Result<void> redirectToDryRun(TransferRequest& request) {
    auto location = storage::DestinationWriterFactory::parseLocation(request.output.url);
    if (!location) {
        return location.error();
    }
    auto key = location.value().key;
    if (location.value().scheme == storage::DestinationScheme::Filesystem) {
        key = location.value().isPrefix() ? std::string{} : fs::path(key).filename().string();
    }
    request.output.url = "mem://dry-run/" + key;
    return {};
}

} // namespace

class DownloadCommand : public ICommand {
public:
    std::string getName() const override { return "download"; }

    std::string getDescription() const override {
        return "Download a URL into s3://, file:// or a local path, resuming interrupted "
               "transfers";
    }

    void registerCommand(CLI::App& app, SluiceCLI* cli) override {
        cli_ = cli;
        auto* sub = app.add_subcommand(getName(), getDescription());

        sub->add_option("url", opts_.url, "Source URL (http or https)");
        sub->add_option("-o,--output", opts_.output,
                        "Destination: s3://bucket/key, s3://bucket/prefix/, file:///path or a "
                        "local path");
        auto* requestOpt = sub->add_option(
            "--request", opts_.requestPath,
            "Read one JSON request ({url, request, output, idempotencyKey}) from file or '-'");
        auto* listOpt = sub->add_option("--list", opts_.listPath,
                                        "Read JSON requests, one per line, from file or '-'");
        requestOpt->excludes(listOpt);

        sub->add_option("-H,--header", opts_.headers,
                        "Request header (repeatable), e.g. 'Authorization: Bearer <token>'");
        sub->add_option("--timeout", opts_.timeout,
                        "Whole-transfer timeout per attempt, e.g. 45s, 10m, '1h 30m'")
            ->check(CLI::Validator(
                [](std::string& s) {
                    auto d = parseHumanDuration(s);
                    return d ? std::string{} : d.error().message;
                },
                "DURATION"));
        sub->add_flag("--set-content-type", opts_.setContentType,
                      "Store the source Content-Type on the destination object");
        sub->add_option("--content-type", opts_.contentType,
                        "Content-Type to store instead of the source's (with --set-content-type)");

        sub->add_option("--idempotency-key", opts_.idempotencyKey,
                        "Name of the durable transfer slot ([A-Za-z0-9._-], max 128)");
        sub->add_option("--invocation-id", opts_.invocationId,
                        "Caller identity used by the 'invocation' idempotency policy");
        sub->add_flag("--restart", opts_.restart, "Restart a transfer recorded as failed");

        sub->add_option("--chunk-size", opts_.chunkSize, "Part size, e.g. 8MiB (min 5MiB for s3)")
            ->check(CLI::Validator(
                [](std::string& s) {
                    return config::parse_size(s) ? std::string{}
                                                 : std::string{"invalid size '" + s + "'"};
                },
                "SIZE"));
        sub->add_option("--state-dir", opts_.stateDir, "Directory holding transfer state");
        sub->add_option("-j,--jobs", opts_.jobs, "Concurrent transfers for --list")
            ->check(CLI::Range(1, 64));
        sub->add_flag("--dry-run", opts_.dryRun,
                      "Transfer into an in-memory destination with in-memory state");
        sub->add_flag("--json", opts_.emitJson, "Print results as JSON");

        sub->callback([this]() {
            if (!opts_.listPath && !opts_.requestPath && (opts_.url.empty() || opts_.output.empty())) {
                throw CLI::ValidationError("download",
                                           "a URL and -o/--output are required "
                                           "(or use --request / --list)");
            }
            auto result = execute();
            if (!result) {
                report(result.error());
                cli_->setExitCode(exitCodeFor(RunOutcome{std::nullopt, result.error(), 0, false}));
            }
        });
    }

    Result<void> execute() override {
        auto cfgResult = cli_->loadConfig();
        if (!cfgResult) {
            return cfgResult.error();
        }
        auto cfg = std::move(cfgResult).value();
        if (opts_.chunkSize) {
            cfg.chunkSize = static_cast<std::size_t>(config::parse_size(*opts_.chunkSize).value_or(0));
        }
        if (opts_.stateDir) {
            cfg.stateDir = config::expand_tilde(*opts_.stateDir);
        }

        auto requests = buildRequests();
        if (!requests) {
            return requests.error();
        }
        if (opts_.dryRun) {
            for (auto& r : requests.value()) {
                if (auto redirected = redirectToDryRun(r); !redirected) {
                    return redirected.error();
                }
            }
        }

        auto store = cli_->openStateStore(cfg.stateDir, opts_.dryRun);
        if (!store) {
            return store.error();
        }

        auto tcfg = config::toTransferConfig(cfg);
        tcfg.destination.memoryStore = cli_->getMemoryStore();
        auto orchestrator =
            makeTransferOrchestrator(std::move(tcfg), store.value(), cli_->getSourceReader());

        spdlog::debug("download: {} request(s), state in {}", requests.value().size(),
                      opts_.dryRun ? std::string("memory") : cfg.stateDir.string());

        std::vector<RunOutcome> outcomes;
        if (requests.value().size() == 1) {
            ProgressCallback progress;
            if (!opts_.emitJson) {
                progress = [](const ProgressEvent& ev) {
                    if (ev.totalBytes) {
                        spdlog::info("{}: {} / {} bytes", ev.url, ev.bytesTransferred,
                                     *ev.totalBytes);
                    } else {
                        spdlog::info("{}: {} bytes", ev.url, ev.bytesTransferred);
                    }
                };
            }
            outcomes.push_back(runWithRetry(*orchestrator, requests.value().front(), cfg.retry,
                                            cli_->shouldCancel(), progress));
        } else {
            outcomes = runMany(*orchestrator, requests.value(), cfg.retry, opts_.jobs,
                               cli_->shouldCancel());
        }

        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            print(requests.value()[i], outcomes[i], outcomes.size() > 1);
        }
        cli_->setExitCode(exitCodeFor(outcomes));
        return Result<void>();
    }

private:
    Result<std::vector<TransferRequest>> buildRequests() const {
        if (opts_.listPath) {
            auto text = readDocument(*opts_.listPath);
            if (!text) {
                return text.error();
            }
            std::istringstream in(text.value());
            auto parsed = parseRequestList(in);
            if (!parsed) {
                return parsed.error();
            }
            if (parsed.value().empty()) {
                return Error{ErrorCode::InvalidRequest, "No requests in " + *opts_.listPath};
            }
            for (auto& r : parsed.value()) {
                r.restart = r.restart || opts_.restart;
            }
            return parsed;
        }

        if (opts_.requestPath) {
            auto text = readDocument(*opts_.requestPath);
            if (!text) {
                return text.error();
            }
            auto parsed = requestFromJsonText(text.value());
            if (!parsed) {
                return parsed.error();
            }
            auto request = std::move(parsed).value();
            request.restart = request.restart || opts_.restart;
            if (opts_.idempotencyKey) {
                request.idempotencyKey = opts_.idempotencyKey;
            }
            if (opts_.invocationId) {
                request.invocationId = opts_.invocationId;
            }
            return std::vector<TransferRequest>{std::move(request)};
        }

        TransferRequest request;
        request.url = opts_.url;
        request.output.url = opts_.output;
        request.output.setContentType = opts_.setContentType;
        request.output.contentType = opts_.contentType;
        request.idempotencyKey = opts_.idempotencyKey;
        request.invocationId = opts_.invocationId;
        request.restart = opts_.restart;
        for (const auto& raw : opts_.headers) {
            auto header = parseHeaderArg(raw);
            if (!header) {
                return header.error();
            }
            request.headers.push_back(std::move(header).value());
        }
        if (opts_.timeout) {
            auto d = parseHumanDuration(*opts_.timeout);
            if (!d) {
                return d.error();
            }
            request.timeout = d.value();
        }
        return std::vector<TransferRequest>{std::move(request)};
    }

    void print(const TransferRequest& request, const RunOutcome& outcome, bool many) {
        if (opts_.emitJson) {
            nlohmann::json j = outcome.ok() ? resultToJson(*outcome.result)
                                            : errorToJson(outcome.error.value_or(
                                                  Error{ErrorCode::InternalError, "no result"}));
            if (many) {
                j["url"] = request.url;
            }
            cli_->out() << j.dump() << "\n";
            return;
        }
        const std::string prefix = many ? request.url + ": " : std::string{};
        if (outcome.ok()) {
            const auto& r = *outcome.result;
            cli_->out() << prefix << "Transferred " << r.bytesTransferred << " bytes to "
                        << r.location << (r.resumed ? " (resumed)" : "") << "\n";
        } else if (outcome.error) {
            cli_->err() << prefix << "error: " << errorCodeName(outcome.error->code) << ": "
                        << outcome.error->message << "\n";
        }
    }

    void report(const Error& error) {
        if (opts_.emitJson) {
            cli_->out() << errorToJson(error).dump() << "\n";
        } else {
            cli_->err() << "error: " << errorCodeName(error.code) << ": " << error.message << "\n";
        }
    }

    SluiceCLI* cli_{nullptr};
    DownloadOpts opts_;
};

std::unique_ptr<ICommand> createDownloadCommand() {
    return std::make_unique<DownloadCommand>();
}

} // namespace sluice::cli
