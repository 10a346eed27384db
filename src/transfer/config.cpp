#include "relay/transfer/config.hpp"

#include <fstream>

namespace relay::transfer {
namespace {

using json = nlohmann::json;

relay::Result<EngineConfig, TransferError> invalid(const std::string& message) {
    return relay::Err<EngineConfig>(TransferError(ErrorKind::InvalidConfig, message));
}

} // namespace

relay::Result<EngineConfig, TransferError> config_from_json(const json& document) {
    if (!document.is_object()) {
        return invalid("configuration must be a JSON object");
    }

    EngineConfig config;
    try {
        if (document.contains("staging_root")) {
            config.staging_root = document.at("staging_root").get<std::string>();
        }
        config.max_object_bytes = document.value("max_object_bytes", config.max_object_bytes);
        config.max_attempts = document.value("max_attempts", config.max_attempts);
        config.base_delay = std::chrono::milliseconds(
            document.value("base_delay_ms", static_cast<std::int64_t>(config.base_delay.count())));
        config.shrink_factor = document.value("shrink_factor", config.shrink_factor);
        config.min_chunk_bytes = document.value("min_chunk_bytes", config.min_chunk_bytes);
        config.progress_interval = std::chrono::milliseconds(
            document.value("progress_interval_ms", static_cast<std::int64_t>(config.progress_interval.count())));
        config.log_level = document.value("log_level", config.log_level);
        if (document.contains("quota_markers")) {
            config.quota_markers = document.at("quota_markers").get<std::vector<std::string>>();
        }

        if (document.contains("strategies")) {
            std::vector<ChunkStrategy> strategies;
            for (const auto& entry : document.at("strategies")) {
                ChunkStrategy strategy;
                strategy.name = entry.at("name").get<std::string>();
                strategy.threshold_bytes = entry.at("threshold").get<std::uint64_t>();
                strategy.chunk_size_bytes = entry.at("chunk_size").get<std::uint64_t>();
                strategies.push_back(std::move(strategy));
            }
            auto table = StrategyTable::create(std::move(strategies));
            if (table.is_error()) {
                return relay::Err<EngineConfig>(table.error());
            }
            config.strategies = table.value();
        }
    } catch (const json::exception& e) {
        return invalid(std::string("malformed configuration: ") + e.what());
    }

    if (config.max_attempts == 0) {
        return invalid("max_attempts must be >= 1");
    }
    if (config.base_delay.count() < 0 || config.progress_interval.count() < 0) {
        return invalid("delays must not be negative");
    }
    if (!(config.shrink_factor > 0.0 && config.shrink_factor < 1.0)) {
        return invalid("shrink_factor must be in (0, 1)");
    }
    if (config.min_chunk_bytes == 0) {
        return invalid("min_chunk_bytes must be > 0");
    }
    if (config.max_object_bytes == 0) {
        return invalid("max_object_bytes must be > 0");
    }
    return relay::Ok(std::move(config));
}

relay::Result<EngineConfig, TransferError> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return invalid("cannot open configuration file: " + path.string());
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return invalid("configuration is not valid JSON: " + path.string());
    }
    return config_from_json(document);
}

json config_to_json(const EngineConfig& config) {
    json j;
    j["staging_root"] = config.staging_root.string();
    j["max_object_bytes"] = config.max_object_bytes;
    j["max_attempts"] = config.max_attempts;
    j["base_delay_ms"] = config.base_delay.count();
    j["shrink_factor"] = config.shrink_factor;
    j["min_chunk_bytes"] = config.min_chunk_bytes;
    j["progress_interval_ms"] = config.progress_interval.count();
    j["quota_markers"] = config.quota_markers;
    j["log_level"] = config.log_level;
    j["strategies"] = json::array();
    for (const auto& strategy : config.strategies.entries()) {
        j["strategies"].push_back({{"name", strategy.name},
                                   {"threshold", strategy.threshold_bytes},
                                   {"chunk_size", strategy.chunk_size_bytes}});
    }
    return j;
}

} // namespace relay::transfer
