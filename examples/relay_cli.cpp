#include "relay/core/size_format.hpp"
#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/transfer/config.hpp"
#include "relay/transfer/coordinator.hpp"
#include "relay/transfer/manifest.hpp"
#include "relay/transfer/object_store.hpp"
#include "relay/transfer/source.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using relay::transfer::EngineConfig;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " [options] <file>...\n"
              << "  " << program << " --reassemble <manifest.json> <output>\n\n"
              << "Options:\n"
              << "  -c, --config <path>      engine configuration (JSON)\n"
              << "  -s, --store <dir>        local object store root (default ./relay_store)\n"
              << "  -n, --namespace <name>   target namespace (default 'default')\n"
              << "  -o, --owner <id>         owner id (default 'cli')\n"
              << "      --store-limit <n>    reject objects larger than n bytes, like an LFS-less backend\n"
              << "      --print-config       dump the effective configuration and exit\n";
}

int reassemble_command(const fs::path& manifest_path, const fs::path& output) {
    auto manifest = relay::transfer::read_manifest(manifest_path);
    if (manifest.is_error()) {
        spdlog::error("{}", manifest.error().message);
        return 1;
    }
    auto rebuilt = relay::transfer::reassemble(manifest.value(), manifest_path.parent_path(), output);
    if (rebuilt.is_error()) {
        spdlog::error("{}", rebuilt.error().message);
        return 1;
    }
    std::cout << "Rebuilt " << manifest.value().original_name << " ("
              << relay::format_bytes(manifest.value().total_size) << ") into " << output.string() << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    fs::path store_root = fs::current_path() / "relay_store";
    std::string target_namespace = "default";
    std::string owner = "cli";
    std::optional<std::uint64_t> store_limit;
    bool print_config = false;
    std::vector<fs::path> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-h" || arg == "--help")) {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--reassemble" && i + 2 < argc) {
            return reassemble_command(argv[i + 1], argv[i + 2]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            store_root = fs::path(argv[++i]);
        } else if ((arg == "-n" || arg == "--namespace") && i + 1 < argc) {
            target_namespace = argv[++i];
        } else if ((arg == "-o" || arg == "--owner") && i + 1 < argc) {
            owner = argv[++i];
        } else if (arg == "--store-limit" && i + 1 < argc) {
            const std::string value = argv[++i];
            store_limit = relay::parse_byte_count(value);
            if (!store_limit) {
                spdlog::error("--store-limit expects a byte count, got '{}'", value);
                return 2;
            }
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("unknown option {}", arg);
            print_usage(argv[0]);
            return 2;
        } else {
            files.emplace_back(arg);
        }
    }

    EngineConfig config;
    if (config_path) {
        auto loaded = relay::transfer::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().message);
            return 2;
        }
        config = std::move(loaded.value());
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (print_config) {
        std::cout << relay::transfer::config_to_json(config).dump(2) << "\n";
        return 0;
    }
    if (files.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    relay::events::EventBus event_bus;
    relay::events::TransferLoggerComponent logger(event_bus);
    relay::events::TransferStatsComponent stats(event_bus);

    relay::transfer::LocalDirectoryStore store(store_root, store_limit);
    relay::transfer::TransferCoordinator coordinator(config, store, event_bus);

    int failures = 0;
    for (const auto& file : files) {
        relay::transfer::TransferRequest request;
        request.owner_id = owner;
        request.object_name = file.filename().string();
        request.target_namespace = target_namespace;
        request.source = std::make_shared<relay::transfer::FileSource>(file);
        request.notify = [](const std::string& text) { std::cout << text << std::endl; };

        auto result = coordinator.run(std::move(request));
        if (result.is_error()) {
            ++failures;
            continue;
        }
        const auto& report = result.value();
        if (report.manifest_name) {
            std::cout << relay::transfer::reassembly_instructions(report.object_name, report.parts) << "\n";
        }
    }

    const auto uploaded = coordinator.uploaded_objects(owner);
    if (!uploaded.empty()) {
        std::cout << "Objects relayed for " << owner << ":\n";
        for (std::size_t i = 0; i < uploaded.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << uploaded[i] << "\n";
        }
    }

    stats.print_stats();
    return failures == 0 ? 0 : 1;
}
