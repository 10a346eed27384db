#include "relay/transfer/object_store.hpp"

#include <fstream>

namespace relay::transfer {
namespace fs = std::filesystem;

LocalDirectoryStore::LocalDirectoryStore(fs::path root, std::optional<std::uint64_t> max_object_bytes)
    : root_(std::move(root)), max_object_bytes_(max_object_bytes) {}

relay::Result<void, BackendError> LocalDirectoryStore::put(const std::string& name,
                                                           const std::vector<char>& bytes,
                                                           const std::string& target_namespace) {
    if (max_object_bytes_ && bytes.size() > *max_object_bytes_) {
        return relay::Err<void>(BackendError("413 Payload Too Large: object of " + std::to_string(bytes.size()) +
                                             " bytes exceeds the per-file limit, use LFS"));
    }

    const auto destination = object_path(name, target_namespace);
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        return relay::Err<void>(BackendError("cannot create namespace directory: " + ec.message()));
    }

    // Write beside the target and rename so a failed put never leaves a truncated object.
    auto partial = destination;
    partial += ".partial";
    {
        std::ofstream output(partial, std::ios::binary | std::ios::trunc);
        if (!output) {
            return relay::Err<void>(BackendError("cannot open object for writing: " + destination.string()));
        }
        output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!output) {
            return relay::Err<void>(BackendError("write failed: " + destination.string()));
        }
    }
    fs::rename(partial, destination, ec);
    if (ec) {
        return relay::Err<void>(BackendError("cannot publish object: " + ec.message()));
    }

    std::lock_guard lock(mutex_);
    ++objects_written_;
    return relay::Ok();
}

std::string LocalDirectoryStore::locate(const std::string& name, const std::string& target_namespace) const {
    return "file://" + object_path(name, target_namespace).string();
}

fs::path LocalDirectoryStore::object_path(const std::string& name, const std::string& target_namespace) const {
    return root_ / fs::path(target_namespace).relative_path() / fs::path(name).filename();
}

std::size_t LocalDirectoryStore::objects_written() const {
    std::lock_guard lock(mutex_);
    return objects_written_;
}

} // namespace relay::transfer
