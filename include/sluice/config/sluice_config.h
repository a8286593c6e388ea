#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <sluice/config/config_helpers.h>
#include <sluice/transfer/transfer.hpp>

namespace sluice::config {

/**
 * Effective configuration: defaults < config file < SLUICE_<SECTION>__<KEY> env < CLI flags.
 */
struct SluiceConfig {
    std::filesystem::path sourcePath; // config file actually read (empty if none)

    // [transfer]
    std::size_t chunkSize{DEFAULT_CHUNK_SIZE};
    transfer::IdempotencyPolicy idempotency{transfer::IdempotencyPolicy::Content};
    transfer::RangeFallback rangeFallback{transfer::RangeFallback::KeepParts};

    // [state]
    std::filesystem::path stateDir;

    // [source]
    transfer::SourceOptions source{};

    // [s3]
    storage::S3Config s3{};

    // [retry]
    transfer::RetryPolicy retry{};

    // [log]
    std::optional<std::string> logLevel;
};

/**
 * Load configuration. explicitPath (or $SLUICE_CONFIG) must exist when given; the default
 * path is optional. Invalid values yield InvalidConfig.
 */
Result<SluiceConfig> loadConfig(const std::filesystem::path& explicitPath = {});

/**
 * Build from an already parsed table (env overrides are applied by loadConfig).
 */
Result<SluiceConfig> configFromTable(const ConfigTable& table);

// Orchestrator settings derived from the effective configuration
transfer::TransferConfig toTransferConfig(const SluiceConfig& cfg);

} // namespace sluice::config
