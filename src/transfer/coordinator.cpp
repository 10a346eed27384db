#include "relay/transfer/coordinator.hpp"

#include "relay/core/size_format.hpp"
#include "relay/events/events.hpp"
#include "relay/transfer/checksum.hpp"
#include "relay/transfer/chunk_writer.hpp"

#include <boost/asio/post.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>

namespace relay::transfer {
namespace fs = std::filesystem;
namespace {

constexpr std::size_t kDownloadBlock = 1024 * 1024;

/**
 * @brief Per-transfer scratch directory, removed with everything in it on
 *        destruction
 */
class StagingArea {
public:
    explicit StagingArea(fs::path path) : path_(std::move(path)) {}

    ~StagingArea() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::error("[Staging] failed to clean {}: {}", path_.string(), ec.message());
        }
    }

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

std::string sanitize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out.push_back(std::isalnum(c) || c == '-' || c == '_' || c == '.' ? static_cast<char>(c) : '_');
    }
    return out;
}

/// `<owner>-<uuid>`; distinct across coordinators sharing a store or staging root
std::string make_transfer_id(const std::string& owner_id) {
    boost::uuids::random_generator generate;
    return sanitize(owner_id) + "-" + boost::uuids::to_string(generate());
}

std::string download_line(const std::string& object_name, std::uint64_t received,
                          std::optional<std::uint64_t> expected, std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << "Downloading " << object_name << ": " << format_bytes(received);
    if (expected) {
        oss << " / " << format_bytes(*expected) << " (" << percent_of(received, *expected) << "%)";
    }
    oss << " at " << format_rate(received, elapsed);
    return oss.str();
}

std::string upload_line(const std::string& object_name, std::uint32_t ordinal, std::uint64_t sent,
                        std::uint64_t total, const std::string& strategy, std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << "Uploading " << object_name << ": part " << ordinal << ", " << format_bytes(sent) << " / "
        << format_bytes(total) << " (" << percent_of(sent, total) << "%) at " << format_rate(sent, elapsed)
        << " [" << strategy << "]";
    return oss.str();
}

TransferError from_upload_failure(const UploadFailure& failure, const std::string& name) {
    const auto detail = name + " after " + std::to_string(failure.attempts) + " attempt(s): " + failure.last_error;
    switch (failure.kind) {
        case UploadFailureKind::QuotaRejected:
            return TransferError(ErrorKind::BackendQuota, "backend rejected " + detail);
        case UploadFailureKind::Exhausted:
            return TransferError(ErrorKind::BackendTransient, "gave up uploading " + detail);
        case UploadFailureKind::LocalIo:
            return TransferError(ErrorKind::LocalIo, failure.last_error);
    }
    return TransferError(ErrorKind::BackendTransient, detail);
}

template<typename Clock>
std::chrono::milliseconds since(typename Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

TransferCoordinator::TransferCoordinator(EngineConfig config,
                                         ObjectStore& store,
                                         events::EventBus& bus,
                                         Sleeper sleeper,
                                         ErrorClassifier classifier,
                                         std::size_t worker_threads)
    : config_(std::move(config)),
      store_(store),
      bus_(bus),
      sleeper_(std::move(sleeper)),
      classifier_(std::move(classifier)),
      pool_(worker_threads == 0 ? 1 : worker_threads) {
    if (!classifier_) {
        classifier_ = make_marker_classifier(config_.quota_markers);
    }
}

TransferCoordinator::~TransferCoordinator() {
    pool_.join();
}

TransferResult TransferCoordinator::run(TransferRequest request) {
    auto admission = admit(request);
    if (admission.is_error()) {
        return relay::Err<TransferReport>(admission.error());
    }
    return execute(request, std::move(admission.value()));
}

relay::Result<std::future<TransferResult>, TransferError> TransferCoordinator::submit(TransferRequest request) {
    auto admission = admit(request);
    if (admission.is_error()) {
        return relay::Err<std::future<TransferResult>>(admission.error());
    }

    auto promise = std::make_shared<std::promise<TransferResult>>();
    auto future = promise->get_future();
    boost::asio::post(pool_, [this, promise, request = std::move(request),
                              admitted = std::move(admission.value())]() mutable {
        promise->set_value(execute(request, std::move(admitted)));
    });
    return relay::Ok(std::move(future));
}

bool TransferCoordinator::is_busy(const std::string& owner_id) const {
    return registry_.is_active(owner_id);
}

std::vector<std::string> TransferCoordinator::uploaded_objects(const std::string& owner_id) const {
    std::lock_guard lock(history_mutex_);
    auto it = uploaded_.find(owner_id);
    if (it == uploaded_.end()) {
        return {};
    }
    return it->second;
}

relay::Result<TransferCoordinator::Admission, TransferError>
TransferCoordinator::admit(const TransferRequest& request) {
    using Admitted = relay::Result<Admission, TransferError>;
    auto reject = [](ErrorKind kind, std::string message) -> Admitted {
        return relay::Err<Admission>(TransferError(kind, std::move(message)));
    };

    if (request.owner_id.empty()) {
        return reject(ErrorKind::InvalidRequest, "owner id is required");
    }
    if (!request.source) {
        return reject(ErrorKind::InvalidRequest, "no source stream");
    }
    if (request.target_namespace.empty()) {
        return reject(ErrorKind::InvalidRequest, "target namespace is required");
    }
    const auto object_name = fs::path(request.object_name).filename().string();
    if (object_name.empty() || object_name == "." || object_name == "..") {
        return reject(ErrorKind::InvalidRequest, "invalid object name '" + request.object_name + "'");
    }

    if (const auto expected = request.source->expected_size(); expected && *expected > config_.max_object_bytes) {
        return reject(ErrorKind::SizeLimitExceeded,
                      object_name + " is " + format_bytes(*expected) + ", the limit is " +
                      format_bytes(config_.max_object_bytes));
    }

    std::string transfer_id;
    try {
        transfer_id = make_transfer_id(request.owner_id);
    } catch (const std::exception& e) {
        return reject(ErrorKind::LocalIo, std::string("cannot generate transfer id: ") + e.what());
    }
    auto lease = registry_.try_acquire(request.owner_id, transfer_id);
    if (!lease) {
        const auto active = registry_.active_transfer(request.owner_id).value_or("?");
        return reject(ErrorKind::Busy, "owner " + request.owner_id + " already has transfer " + active + " in flight");
    }

    return relay::Ok(Admission{std::move(*lease), transfer_id, object_name});
}

TransferResult TransferCoordinator::execute(const TransferRequest& request, Admission admission) {
    const auto started = std::chrono::steady_clock::now();
    TransferSession session(admission.transfer_id, request.owner_id, admission.object_name, request.target_namespace);
    ProgressReporter progress(request.notify, config_.progress_interval);
    std::string size_bucket = events::kUnsizedBucket;

    bus_.emit(events::TransferStartedEvent{admission.transfer_id, request.owner_id, admission.object_name,
                                           request.target_namespace,
                                           request.source->expected_size().value_or(0)});

    auto outcome = [&]() -> TransferResult {
        StagingArea staging(config_.staging_root / admission.transfer_id);
        try {
            return drive(request, admission, session, staging.path(), progress, size_bucket);
        } catch (const std::exception& e) {
            const auto kind = session.state() == TransferState::Downloading ? ErrorKind::SourceRead : ErrorKind::LocalIo;
            return relay::Err<TransferReport>(TransferError(kind, std::string("unexpected error: ") + e.what()));
        }
    }();

    // Staging is gone at this point; free the owner before anyone hears the outcome.
    admission.lease.release();

    if (outcome.is_error()) {
        const auto& error = outcome.error();
        if (auto failed = session.mark_failed(error.message); failed.is_error()) {
            spdlog::warn("[TransferFailed] transfer={} {}", admission.transfer_id, failed.error());
        }
        bus_.emit(events::TransferFailedEvent{admission.transfer_id, request.owner_id, admission.object_name,
                                              size_bucket, to_string(error.kind), error.message});
        progress.finish("Transfer of " + admission.object_name + " failed. " + error.user_message());
        return outcome;
    }

    auto& report = outcome.value();
    report.duration = since<std::chrono::steady_clock>(started);
    if (auto done = session.transition_to(TransferState::Done); done.is_error()) {
        spdlog::warn("[TransferCompleted] transfer={} {}", admission.transfer_id, done.error());
    }

    {
        std::lock_guard lock(history_mutex_);
        uploaded_[request.owner_id].push_back(report.object_name);
    }

    bus_.emit(events::TransferCompletedEvent{report.transfer_id, report.owner_id, report.object_name, size_bucket,
                                             report.final_strategy, report.total_bytes,
                                             static_cast<std::uint32_t>(report.parts.size()), report.fallbacks,
                                             report.duration});

    std::ostringstream done_line;
    done_line << "Uploaded " << report.object_name << " (" << format_bytes(report.total_bytes) << ") in "
              << report.parts.size() << (report.parts.size() == 1 ? " part" : " parts") << " using '"
              << report.final_strategy << "'";
    if (report.fallbacks > 0) {
        done_line << " after " << report.fallbacks << " fallback(s)";
    }
    done_line << ". Location: " << report.location;
    progress.finish(done_line.str());
    return outcome;
}

TransferResult TransferCoordinator::drive(const TransferRequest& request,
                                          const Admission& admission,
                                          TransferSession& session,
                                          const fs::path& staging_dir,
                                          ProgressReporter& progress,
                                          std::string& size_bucket) {
    auto fail = [](TransferError error) { return relay::Err<TransferReport>(std::move(error)); };
    auto step = [&](TransferState next) -> relay::Result<void, TransferError> {
        auto moved = session.transition_to(next);
        if (moved.is_error()) {
            return relay::Err<void>(TransferError(ErrorKind::LocalIo, moved.error()));
        }
        return relay::Ok();
    };

    // ── Downloading ────────────────────────────────────────
    if (auto moved = step(TransferState::Downloading); moved.is_error()) {
        return fail(moved.error());
    }
    {
        std::error_code ec;
        fs::create_directories(staging_dir, ec);
        if (ec) {
            return fail(TransferError(ErrorKind::LocalIo,
                "cannot create staging directory " + staging_dir.string() + ": " + ec.message()));
        }
    }
    const auto object_path = staging_dir / "object.bin";
    auto downloaded = download(*request.source, admission.object_name, object_path, progress);
    if (downloaded.is_error()) {
        return fail(downloaded.error());
    }
    const auto total_bytes = downloaded.value();
    session.set_total_bytes(total_bytes);

    // ── Strategizing ───────────────────────────────────────
    if (auto moved = step(TransferState::Strategizing); moved.is_error()) {
        return fail(moved.error());
    }
    const ChunkStrategy initial = config_.strategies.select(total_bytes);
    size_bucket = initial.name;
    session.set_strategy(initial.name);
    bus_.emit(events::TransferStrategizedEvent{admission.transfer_id, total_bytes, initial.name,
                                               initial.chunk_size_bytes});

    // ── Uploading ──────────────────────────────────────────
    if (auto moved = step(TransferState::Uploading); moved.is_error()) {
        return fail(moved.error());
    }
    UploadAttempter attempter(store_, request.target_namespace, retry_policy(), classifier_, sleeper_);
    FallbackOrchestrator fallback(config_.strategies, initial);
    ManifestBuilder manifest(admission.object_name, request.owner_id);

    auto uploaded = upload_parts(admission, object_path, total_bytes, staging_dir, attempter, fallback, manifest,
                                 progress, size_bucket);
    if (uploaded.is_error()) {
        return fail(uploaded.error());
    }
    const bool single_part = uploaded.value();

    // ── Finalizing ─────────────────────────────────────────
    if (auto moved = step(TransferState::Finalizing); moved.is_error()) {
        return fail(moved.error());
    }
    auto digest = checksum_file(object_path);
    if (digest.is_error()) {
        return fail(digest.error());
    }

    TransferReport report;
    report.transfer_id = admission.transfer_id;
    report.owner_id = request.owner_id;
    report.object_name = admission.object_name;
    report.target_namespace = request.target_namespace;
    report.total_bytes = total_bytes;
    report.initial_strategy = initial.name;
    report.final_strategy = fallback.current().name;
    report.parts = manifest.parts();
    report.digest = digest.value();
    report.fallbacks = fallback.fallback_count();

    if (single_part) {
        report.location = store_.locate(admission.object_name, request.target_namespace);
        return relay::Ok(std::move(report));
    }

    const auto base_name = admission.object_name + "." + admission.transfer_id;
    auto built = manifest.build(total_bytes, fallback.effective_chunk_size(attempter.ceiling()),
                                fallback.current().name, report.digest, std::chrono::system_clock::now());
    if (built.is_error()) {
        return fail(built.error());
    }
    const auto manifest_path = staging_dir / "manifest.json";
    if (auto written = write_manifest(built.value(), manifest_path); written.is_error()) {
        return fail(written.error());
    }

    const auto remote_manifest = manifest_name(base_name);
    progress.publish("Finalizing " + admission.object_name + ": uploading manifest for " +
                     std::to_string(report.parts.size()) + " parts");
    auto manifest_upload = attempter.attempt_manifest(manifest_path, remote_manifest);
    if (manifest_upload.is_error()) {
        return fail(from_upload_failure(manifest_upload.error(), remote_manifest));
    }

    report.manifest_name = remote_manifest;
    report.location = store_.locate(remote_manifest, request.target_namespace);
    return relay::Ok(std::move(report));
}

relay::Result<std::uint64_t, TransferError> TransferCoordinator::download(ByteSource& source,
                                                                          const std::string& object_name,
                                                                          const fs::path& object_path,
                                                                          ProgressReporter& progress) const {
    const auto started = std::chrono::steady_clock::now();
    const auto expected = source.expected_size();

    std::ofstream output(object_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return relay::Err<std::uint64_t>(TransferError(ErrorKind::LocalIo, "cannot stage object at " + object_path.string()));
    }

    std::vector<char> buffer(kDownloadBlock);
    std::uint64_t received = 0;
    while (true) {
        auto chunk = source.read(buffer.data(), buffer.size());
        if (chunk.is_error()) {
            return relay::Err<std::uint64_t>(TransferError(ErrorKind::SourceRead, chunk.error()));
        }
        const auto count = chunk.value();
        if (count == 0) {
            break;
        }
        received += count;
        if (received > config_.max_object_bytes) {
            return relay::Err<std::uint64_t>(TransferError(ErrorKind::SizeLimitExceeded,
                object_name + " grew past the limit of " + format_bytes(config_.max_object_bytes)));
        }
        output.write(buffer.data(), static_cast<std::streamsize>(count));
        if (!output) {
            return relay::Err<std::uint64_t>(TransferError(ErrorKind::LocalIo, "write failed while staging " + object_name));
        }
        progress.publish(download_line(object_name, received, expected, since<std::chrono::steady_clock>(started)));
    }

    output.close();
    if (!output) {
        return relay::Err<std::uint64_t>(TransferError(ErrorKind::LocalIo, "cannot flush staged object " + object_name));
    }
    if (expected && received < *expected) {
        return relay::Err<std::uint64_t>(TransferError(ErrorKind::SourceRead,
            object_name + " ended early: announced " + std::to_string(*expected) + " bytes, received " +
            std::to_string(received)));
    }
    if (expected && received > *expected) {
        spdlog::warn("[Download] object={} announced {} bytes, received {}", object_name, *expected, received);
    }
    return relay::Ok(received);
}

relay::Result<bool, TransferError> TransferCoordinator::upload_parts(const Admission& admission,
                                                                     const fs::path& object_path,
                                                                     std::uint64_t total_bytes,
                                                                     const fs::path& staging_dir,
                                                                     UploadAttempter& attempter,
                                                                     FallbackOrchestrator& fallback,
                                                                     ManifestBuilder& manifest,
                                                                     ProgressReporter& progress,
                                                                     const std::string& size_bucket) {
    const auto started = std::chrono::steady_clock::now();
    const auto base_name = admission.object_name + "." + admission.transfer_id;

    std::ifstream object(object_path, std::ios::binary);
    if (!object) {
        return relay::Err<bool>(TransferError(ErrorKind::LocalIo, "cannot reopen staged object " + object_path.string()));
    }

    std::uint64_t offset = 0;
    std::uint32_t ordinal = 1;

    while (true) {
        const auto chunk_size = fallback.effective_chunk_size(attempter.ceiling());
        const bool single_part = offset == 0 && total_bytes <= chunk_size;

        // Resume right after the last accepted part; the rejected part's bytes are cut again.
        object.clear();
        object.seekg(static_cast<std::streamoff>(offset));
        if (!object) {
            return relay::Err<bool>(TransferError(ErrorKind::LocalIo, "cannot seek staged object to " + std::to_string(offset)));
        }

        ChunkWriter writer(object, chunk_size, staging_dir, ordinal, offset);
        bool rejected = false;

        while (!rejected) {
            auto next = writer.next();
            if (next.is_error()) {
                return relay::Err<bool>(next.error());
            }
            if (!next.value()) {
                break;
            }
            StagedPart part = std::move(*next.value());
            const auto name = single_part ? admission.object_name : part_name(base_name, part.ordinal());

            auto receipt = attempter.attempt(part, name, fallback.current());
            if (receipt.is_error()) {
                const auto& failure = receipt.error();
                if (failure.kind != UploadFailureKind::QuotaRejected) {
                    return relay::Err<bool>(from_upload_failure(failure, name));
                }

                const auto previous = fallback.current().name;
                auto next_strategy = fallback.on_quota_rejection();
                if (next_strategy.is_error()) {
                    return relay::Err<bool>(TransferError(ErrorKind::LadderExhausted,
                        next_strategy.error().message + "; last backend error: " + failure.last_error));
                }
                bus_.emit(events::StrategyFallbackEvent{admission.transfer_id, size_bucket, previous,
                                                        next_strategy.value().name, offset});
                progress.publish("Backend rejected part " + std::to_string(part.ordinal()) + " of " +
                                 admission.object_name + "; continuing with '" + next_strategy.value().name +
                                 "' chunks from " + format_bytes(offset));
                rejected = true;
                continue;
            }

            PartDescriptor descriptor{name, part.length(), part.ordinal(), part.checksum(), part.offset()};
            if (auto recorded = manifest.add_part(descriptor); recorded.is_error()) {
                return relay::Err<bool>(recorded.error());
            }
            bus_.emit(events::PartUploadedEvent{admission.transfer_id, name, part.ordinal(), part.length(),
                                                receipt.value().attempts, fallback.current().name});

            offset += part.length();
            ordinal = part.ordinal() + 1;
            part.release();
            progress.publish(upload_line(admission.object_name, descriptor.ordinal, offset, total_bytes,
                                         fallback.current().name, since<std::chrono::steady_clock>(started)));
        }

        if (!rejected) {
            return relay::Ok(single_part);
        }
    }
}

RetryPolicy TransferCoordinator::retry_policy() const {
    RetryPolicy policy;
    policy.max_attempts = config_.max_attempts;
    policy.base_delay = config_.base_delay;
    policy.shrink_factor = config_.shrink_factor;
    policy.min_chunk_bytes = config_.min_chunk_bytes;
    return policy;
}

} // namespace relay::transfer
