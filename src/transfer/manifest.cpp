#include "relay/transfer/manifest.hpp"

#include "relay/transfer/checksum.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace relay::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// True when name is a single path component, so it cannot leave the parts directory
bool is_plain_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return fs::path(name).filename().string() == name && name.find('\\') == std::string::npos;
}

relay::Result<void, TransferError> check_parts(const std::vector<PartDescriptor>& parts,
                                               std::uint32_t total_parts,
                                               std::uint64_t total_size) {
    if (parts.size() != total_parts) {
        return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
            "manifest lists " + std::to_string(parts.size()) + " parts, expected " + std::to_string(total_parts)));
    }
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].ordinal != i + 1) {
            return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
                "part ordinals are not contiguous at position " + std::to_string(i + 1)));
        }
        if (!is_plain_name(parts[i].name)) {
            return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
                "part name '" + parts[i].name + "' is not a plain file name"));
        }
        sum += parts[i].size;
    }
    if (sum != total_size) {
        return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
            "part sizes sum to " + std::to_string(sum) + ", expected " + std::to_string(total_size)));
    }
    return relay::Ok();
}

} // namespace

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string part_name(const std::string& base_name, std::uint32_t ordinal) {
    std::ostringstream oss;
    oss << base_name << ".part" << std::setw(3) << std::setfill('0') << ordinal;
    return oss.str();
}

std::string manifest_name(const std::string& base_name) {
    return base_name + ".manifest.json";
}

std::string reassembly_instructions(const std::string& original_name, const std::vector<PartDescriptor>& parts) {
    std::ostringstream oss;
    oss << "Concatenate the " << parts.size() << " parts in ascending ordinal order to rebuild '"
        << original_name << "' byte-for-byte: cat";
    for (const auto& part : parts) {
        oss << ' ' << part.name;
    }
    oss << " > " << original_name;
    return oss.str();
}

// ════════════════════════════════════════════════════════
// ManifestBuilder
// ════════════════════════════════════════════════════════

ManifestBuilder::ManifestBuilder(std::string original_name, std::string owner)
    : original_name_(std::move(original_name)), owner_(std::move(owner)) {}

relay::Result<void, TransferError> ManifestBuilder::add_part(PartDescriptor descriptor) {
    std::lock_guard lock(mutex_);
    const auto expected = static_cast<std::uint32_t>(parts_.size() + 1);
    if (descriptor.ordinal != expected) {
        return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
            "part ordinal " + std::to_string(descriptor.ordinal) + " recorded out of order, expected " +
            std::to_string(expected)));
    }
    recorded_bytes_ += descriptor.size;
    parts_.push_back(std::move(descriptor));
    return relay::Ok();
}

std::vector<PartDescriptor> ManifestBuilder::parts() const {
    std::lock_guard lock(mutex_);
    return parts_;
}

std::uint64_t ManifestBuilder::recorded_bytes() const {
    std::lock_guard lock(mutex_);
    return recorded_bytes_;
}

std::uint32_t ManifestBuilder::part_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::uint32_t>(parts_.size());
}

relay::Result<Manifest, TransferError> ManifestBuilder::build(std::uint64_t total_size,
                                                              std::uint64_t chunk_size,
                                                              const std::string& strategy,
                                                              const std::string& digest,
                                                              std::chrono::system_clock::time_point created) const {
    Manifest manifest;
    manifest.original_name = original_name_;
    manifest.owner = owner_;
    manifest.parts = parts();
    manifest.total_parts = static_cast<std::uint32_t>(manifest.parts.size());
    manifest.total_size = total_size;
    manifest.chunk_size = chunk_size;
    manifest.strategy = strategy;
    manifest.digest = digest;
    manifest.created_at = iso8601_utc(created);
    manifest.reassembly = reassembly_instructions(original_name_, manifest.parts);

    if (auto check = check_parts(manifest.parts, manifest.total_parts, total_size); check.is_error()) {
        return relay::Err<Manifest>(check.error());
    }
    return relay::Ok(std::move(manifest));
}

// ════════════════════════════════════════════════════════
// Serialization
// ════════════════════════════════════════════════════════

json manifest_to_json(const Manifest& manifest) {
    json j;
    j["original_name"] = manifest.original_name;
    j["total_parts"] = manifest.total_parts;
    j["total_size"] = manifest.total_size;
    j["chunk_size"] = manifest.chunk_size;
    j["strategy"] = manifest.strategy;
    j["parts"] = json::array();
    for (const auto& part : manifest.parts) {
        j["parts"].push_back({{"name", part.name},
                              {"size", part.size},
                              {"ordinal", part.ordinal},
                              {"checksum", part.checksum}});
    }
    j["created_at"] = manifest.created_at;
    j["owner"] = manifest.owner;
    j["digest"] = manifest.digest;
    j["reassembly"] = manifest.reassembly;
    return j;
}

relay::Result<Manifest, TransferError> manifest_from_json(const json& document) {
    Manifest manifest;
    try {
        manifest.original_name = document.at("original_name").get<std::string>();
        manifest.total_parts = document.at("total_parts").get<std::uint32_t>();
        manifest.total_size = document.at("total_size").get<std::uint64_t>();
        manifest.chunk_size = document.at("chunk_size").get<std::uint64_t>();
        manifest.strategy = document.value("strategy", std::string());
        manifest.created_at = document.at("created_at").get<std::string>();
        manifest.owner = document.at("owner").get<std::string>();
        manifest.digest = document.at("digest").get<std::string>();
        manifest.reassembly = document.value("reassembly", std::string());

        std::uint64_t offset = 0;
        for (const auto& entry : document.at("parts")) {
            PartDescriptor part;
            part.name = entry.at("name").get<std::string>();
            part.size = entry.at("size").get<std::uint64_t>();
            part.ordinal = entry.at("ordinal").get<std::uint32_t>();
            part.checksum = entry.value("checksum", std::string());
            part.offset = offset;
            offset += part.size;
            manifest.parts.push_back(std::move(part));
        }
    } catch (const json::exception& e) {
        return relay::Err<Manifest>(TransferError(ErrorKind::InvalidRequest, std::string("malformed manifest: ") + e.what()));
    }

    if (auto check = check_parts(manifest.parts, manifest.total_parts, manifest.total_size); check.is_error()) {
        return relay::Err<Manifest>(check.error());
    }
    return relay::Ok(std::move(manifest));
}

relay::Result<void, TransferError> write_manifest(const Manifest& manifest, const fs::path& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return relay::Err<void>(TransferError(ErrorKind::LocalIo, "cannot write manifest: " + path.string()));
    }
    output << manifest_to_json(manifest).dump(2);
    if (!output) {
        return relay::Err<void>(TransferError(ErrorKind::LocalIo, "manifest write failed: " + path.string()));
    }
    return relay::Ok();
}

relay::Result<Manifest, TransferError> read_manifest(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return relay::Err<Manifest>(TransferError(ErrorKind::LocalIo, "cannot open manifest: " + path.string()));
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return relay::Err<Manifest>(TransferError(ErrorKind::InvalidRequest, "manifest is not valid JSON: " + path.string()));
    }
    return manifest_from_json(document);
}

// ════════════════════════════════════════════════════════
// Reassembly
// ════════════════════════════════════════════════════════

relay::Result<void, TransferError> reassemble(const Manifest& manifest,
                                              const fs::path& parts_dir,
                                              const fs::path& output) {
    auto fail = [&output](TransferError error) {
        std::error_code ec;
        fs::remove(output, ec);
        return relay::Err<void>(std::move(error));
    };

    for (const auto& part : manifest.parts) {
        if (!is_plain_name(part.name)) {
            return relay::Err<void>(TransferError(ErrorKind::InvalidRequest,
                "part name '" + part.name + "' is not a plain file name"));
        }
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return relay::Err<void>(TransferError(ErrorKind::LocalIo, "cannot create output: " + output.string()));
    }

    ChecksumAccumulator whole;
    std::vector<char> buffer(64 * 1024);
    std::uint64_t total = 0;

    for (const auto& part : manifest.parts) {
        std::ifstream input(parts_dir / part.name, std::ios::binary);
        if (!input) {
            out.close();
            return fail(TransferError(ErrorKind::LocalIo, "missing part: " + part.name));
        }
        ChecksumAccumulator part_sum;
        std::uint64_t part_bytes = 0;
        while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
            const auto count = static_cast<std::size_t>(input.gcount());
            out.write(buffer.data(), static_cast<std::streamsize>(count));
            part_sum.update(buffer.data(), count);
            whole.update(buffer.data(), count);
            part_bytes += count;
        }
        if (part_bytes != part.size) {
            out.close();
            return fail(TransferError(ErrorKind::InvalidRequest,
                "part " + part.name + " has " + std::to_string(part_bytes) + " bytes, manifest says " +
                std::to_string(part.size)));
        }
        if (!part.checksum.empty() && part.checksum != part_sum.hex()) {
            out.close();
            return fail(TransferError(ErrorKind::InvalidRequest, "checksum mismatch for part " + part.name));
        }
        total += part_bytes;
    }

    out.close();
    if (!out) {
        return fail(TransferError(ErrorKind::LocalIo, "write failed: " + output.string()));
    }
    if (total != manifest.total_size) {
        return fail(TransferError(ErrorKind::InvalidRequest, "reassembled size does not match manifest"));
    }
    if (!manifest.digest.empty() && whole.hex() != manifest.digest) {
        return fail(TransferError(ErrorKind::InvalidRequest, "digest mismatch for " + manifest.original_name));
    }
    return relay::Ok();
}

} // namespace relay::transfer
