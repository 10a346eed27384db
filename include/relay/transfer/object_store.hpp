#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief Remote object store the engine uploads into
 *
 * put() must either store the whole object or fail; the engine never sends a
 * partial object under a name. Errors are reported as free text, the engine
 * classifies them through an ErrorClassifier.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual relay::Result<void, BackendError> put(const std::string& name,
                                                  const std::vector<char>& bytes,
                                                  const std::string& target_namespace) = 0;

    /// Where a stored object can be fetched from (URL, path, ...)
    virtual std::string locate(const std::string& name, const std::string& target_namespace) const = 0;
};

/**
 * @brief Stores objects as files below <root>/<namespace>/
 *
 * Optionally enforces a per-object size limit, answering oversize puts the
 * way a git-LFS backed store does ("413 ... LFS"), which the default
 * classifier treats as a quota rejection.
 */
class LocalDirectoryStore : public ObjectStore {
public:
    explicit LocalDirectoryStore(std::filesystem::path root,
                                 std::optional<std::uint64_t> max_object_bytes = std::nullopt);

    relay::Result<void, BackendError> put(const std::string& name,
                                          const std::vector<char>& bytes,
                                          const std::string& target_namespace) override;

    std::string locate(const std::string& name, const std::string& target_namespace) const override;

    [[nodiscard]] std::filesystem::path object_path(const std::string& name,
                                                    const std::string& target_namespace) const;

    [[nodiscard]] std::size_t objects_written() const;

private:
    std::filesystem::path root_;
    std::optional<std::uint64_t> max_object_bytes_;

    mutable std::mutex mutex_;
    std::size_t objects_written_ = 0;
};

} // namespace relay::transfer
