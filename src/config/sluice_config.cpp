#include <sluice/config/sluice_config.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>

namespace sluice::config {

namespace {

struct KnownKey {
    const char* section;
    const char* key;
};

constexpr std::array<KnownKey, 20> kKnownKeys{{
    {"transfer", "chunk_size"},
    {"transfer", "idempotency"},
    {"transfer", "restart_on_unsupported_range"},
    {"state", "dir"},
    {"source", "timeout_ms"},
    {"source", "connect_timeout_ms"},
    {"source", "low_speed_limit_bps"},
    {"source", "low_speed_time_s"},
    {"source", "user_agent"},
    {"source", "max_redirects"},
    {"source", "insecure"},
    {"source", "ca_path"},
    {"s3", "endpoint"},
    {"s3", "region"},
    {"s3", "path_style"},
    {"s3", "request_timeout_ms"},
    {"retry", "max_attempts"},
    {"retry", "initial_backoff_ms"},
    {"retry", "multiplier"},
    {"retry", "max_backoff_ms"},
}};

std::string envName(std::string_view section, std::string_view key) {
    std::string name = "SLUICE_";
    for (char c : section)
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    name += "__";
    for (char c : key)
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return name;
}

const std::string* lookup(const ConfigTable& table, const std::string& section,
                          const std::string& key) {
    auto s = table.find(section);
    if (s == table.end()) {
        return nullptr;
    }
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
}

Error invalid(const std::string& section, const std::string& key, const std::string& value,
              std::string_view expected) {
    return Error{ErrorCode::InvalidConfig, "[" + section + "] " + key + " = '" + value +
                                               "': expected " + std::string(expected)};
}

Result<std::int64_t> getInt(const ConfigTable& table, const std::string& section,
                            const std::string& key, std::int64_t fallback, std::int64_t min) {
    const auto* raw = lookup(table, section, key);
    if (!raw) {
        return fallback;
    }
    std::int64_t v = 0;
    auto res = std::from_chars(raw->data(), raw->data() + raw->size(), v);
    if (res.ec != std::errc() || res.ptr != raw->data() + raw->size() || v < min) {
        return invalid(section, key, *raw, "an integer >= " + std::to_string(min));
    }
    return v;
}

Result<bool> getBool(const ConfigTable& table, const std::string& section, const std::string& key,
                     bool fallback) {
    const auto* raw = lookup(table, section, key);
    if (!raw) {
        return fallback;
    }
    auto v = parse_bool(*raw);
    if (!v) {
        return invalid(section, key, *raw, "a boolean");
    }
    return *v;
}

} // namespace

Result<SluiceConfig> configFromTable(const ConfigTable& table) {
    for (const auto& [section, entries] : table) {
        for (const auto& [key, value] : entries) {
            bool known = (section == "log" && key == "level");
            for (const auto& k : kKnownKeys) {
                known = known || (section == k.section && key == k.key);
            }
            if (!known) {
                spdlog::warn("Ignoring unknown config key [{}] {}", section, key);
            }
        }
    }

    SluiceConfig cfg;

    // [transfer]
    if (const auto* raw = lookup(table, "transfer", "chunk_size")) {
        auto size = parse_size(*raw);
        if (!size || *size == 0 || *size > MAX_CHUNK_SIZE) {
            return invalid("transfer", "chunk_size", *raw, "a size between 1 byte and 5GiB");
        }
        cfg.chunkSize = static_cast<std::size_t>(*size);
    }
    if (const auto* raw = lookup(table, "transfer", "idempotency")) {
        if (*raw == "content") {
            cfg.idempotency = transfer::IdempotencyPolicy::Content;
        } else if (*raw == "invocation") {
            cfg.idempotency = transfer::IdempotencyPolicy::Invocation;
        } else {
            return invalid("transfer", "idempotency", *raw, "content or invocation");
        }
    }
    if (const auto* raw = lookup(table, "transfer", "restart_on_unsupported_range")) {
        if (*raw == "keep_parts") {
            cfg.rangeFallback = transfer::RangeFallback::KeepParts;
        } else if (*raw == "restart_all") {
            cfg.rangeFallback = transfer::RangeFallback::RestartAll;
        } else {
            return invalid("transfer", "restart_on_unsupported_range", *raw,
                           "keep_parts or restart_all");
        }
    }

    // [state]
    if (const auto* raw = lookup(table, "state", "dir"); raw && !raw->empty()) {
        cfg.stateDir = expand_tilde(*raw);
    } else {
        cfg.stateDir = get_data_dir() / "state";
    }

    // [source]
    {
        auto timeout = getInt(table, "source", "timeout_ms", 0, 0);
        auto connect = getInt(table, "source", "connect_timeout_ms", 30000, 1);
        auto lowSpeed = getInt(table, "source", "low_speed_limit_bps", 1, 0);
        auto lowTime = getInt(table, "source", "low_speed_time_s", 60, 0);
        auto redirects = getInt(table, "source", "max_redirects", 10, 0);
        auto insecure = getBool(table, "source", "insecure", false);
        for (const Result<std::int64_t>* r : {&timeout, &connect, &lowSpeed, &lowTime, &redirects}) {
            if (!*r) {
                return r->error();
            }
        }
        if (!insecure) {
            return insecure.error();
        }
        cfg.source.timeout = std::chrono::milliseconds(timeout.value());
        cfg.source.connectTimeout = std::chrono::milliseconds(connect.value());
        cfg.source.lowSpeedLimitBps = static_cast<long>(lowSpeed.value());
        cfg.source.lowSpeedTime = std::chrono::seconds(lowTime.value());
        cfg.source.maxRedirects = static_cast<long>(redirects.value());
        cfg.source.tls.insecure = insecure.value();
        if (const auto* raw = lookup(table, "source", "user_agent")) {
            cfg.source.userAgent = *raw;
        }
        if (const auto* raw = lookup(table, "source", "ca_path")) {
            cfg.source.tls.caPath = expand_tilde(*raw).string();
        }
    }

    // [s3]
    {
        if (const auto* raw = lookup(table, "s3", "endpoint")) {
            cfg.s3.endpoint = *raw;
        } else if (const char* env = std::getenv("AWS_ENDPOINT_URL"); env && *env) {
            cfg.s3.endpoint = env;
        }
        if (const auto* raw = lookup(table, "s3", "region")) {
            cfg.s3.region = *raw;
        } else if (const char* env = std::getenv("AWS_REGION"); env && *env) {
            cfg.s3.region = env;
        }
        if (!cfg.s3.endpoint.empty() && cfg.s3.endpoint.find("://") == std::string::npos) {
            return invalid("s3", "endpoint", cfg.s3.endpoint, "a URL with scheme");
        }
        auto pathStyle = getBool(table, "s3", "path_style", false);
        if (!pathStyle) {
            return pathStyle.error();
        }
        cfg.s3.usePathStyle = pathStyle.value();
        auto requestTimeout = getInt(table, "s3", "request_timeout_ms", 300000, 1);
        if (!requestTimeout) {
            return requestTimeout.error();
        }
        cfg.s3.requestTimeoutMs = static_cast<long>(requestTimeout.value());
    }

    // [retry]
    {
        auto attempts = getInt(table, "retry", "max_attempts", 5, 1);
        auto initial = getInt(table, "retry", "initial_backoff_ms", 500, 0);
        auto maxBackoff = getInt(table, "retry", "max_backoff_ms", 15000, 0);
        for (const Result<std::int64_t>* r : {&attempts, &initial, &maxBackoff}) {
            if (!*r) {
                return r->error();
            }
        }
        cfg.retry.maxAttempts = static_cast<int>(attempts.value());
        cfg.retry.initialBackoff = std::chrono::milliseconds(initial.value());
        cfg.retry.maxBackoff = std::chrono::milliseconds(maxBackoff.value());
        if (const auto* raw = lookup(table, "retry", "multiplier")) {
            try {
                std::size_t used = 0;
                cfg.retry.multiplier = std::stod(*raw, &used);
                if (used != raw->size() || cfg.retry.multiplier < 1.0) {
                    return invalid("retry", "multiplier", *raw, "a number >= 1.0");
                }
            } catch (const std::exception&) {
                return invalid("retry", "multiplier", *raw, "a number >= 1.0");
            }
        }
    }

    // [log]
    if (const auto* raw = lookup(table, "log", "level"); raw && !raw->empty()) {
        cfg.logLevel = *raw;
    }

    return cfg;
}

Result<SluiceConfig> loadConfig(const std::filesystem::path& explicitPath) {
    std::filesystem::path path = explicitPath;
    bool required = !path.empty();
    if (path.empty()) {
        if (const char* env = std::getenv("SLUICE_CONFIG"); env && *env) {
            path = env;
            required = true;
        } else {
            path = get_config_path();
        }
    }

    ConfigTable table;
    std::error_code ec;
    bool haveFile = std::filesystem::exists(path, ec);
    if (haveFile) {
        auto parsed = parse_config_file(path);
        if (!parsed) {
            return parsed.error();
        }
        table = std::move(parsed).value();
        spdlog::debug("Loaded config from {}", path.string());
    } else if (required) {
        return Error{ErrorCode::InvalidConfig, "Config file not found: " + path.string()};
    }

    // Environment overrides: SLUICE_<SECTION>__<KEY>
    for (const auto& k : kKnownKeys) {
        if (const char* env = std::getenv(envName(k.section, k.key).c_str()); env) {
            table[k.section][k.key] = env;
        }
    }
    if (const char* env = std::getenv("SLUICE_LOG__LEVEL"); env) {
        table["log"]["level"] = env;
    }

    auto cfg = configFromTable(table);
    if (!cfg) {
        return cfg.error();
    }
    if (haveFile) {
        cfg.value().sourcePath = path;
    }
    return cfg;
}

transfer::TransferConfig toTransferConfig(const SluiceConfig& cfg) {
    transfer::TransferConfig out;
    out.chunkSize = cfg.chunkSize;
    out.idempotency = cfg.idempotency;
    out.rangeFallback = cfg.rangeFallback;
    out.source = cfg.source;
    out.destination.s3 = cfg.s3;
    return out;
}

} // namespace sluice::config
