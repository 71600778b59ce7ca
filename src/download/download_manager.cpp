#include "lsync/download/download_manager.hpp"

#include "lsync/core/hash.hpp"
#include "lsync/events/events.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>

namespace lsync::download {

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

ProgressSnapshot snapshot_of(const DownloadTask& task) {
    return ProgressSnapshot{task.id, task.resource_key, task.transferred_bytes, task.total_bytes, task.status};
}

void remove_file_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[Download] could not remove {}: {}", path, ec.message());
    }
}

std::uint64_t file_size_or_zero(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

} // namespace

DownloadManager::DownloadManager(store::LocalStore& store, events::EventBus& bus, AssetSource& source,
                                 const Clock& clock, DownloadConfig config, EntityLock entity_lock)
    : store_(store),
      bus_(bus),
      source_(source),
      clock_(clock),
      config_(config),
      entity_lock_(std::move(entity_lock)),
      pool_(std::max<std::size_t>(1, config.max_concurrent)) {
    load_registry();
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
    }
    pool_.join();

    std::vector<std::pair<ProgressSnapshot, std::vector<std::weak_ptr<ProgressQueue>>>> open;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, state] : tasks_) {
            if (!state->subscribers.empty()) {
                open.emplace_back(snapshot_of(state->task), std::move(state->subscribers));
                state->subscribers.clear();
            }
        }
    }
    for (auto& [snapshot, subscribers] : open) {
        for (auto& weak : subscribers) {
            if (auto queue = weak.lock()) {
                queue->push_and_close(snapshot);
            }
        }
    }
    spdlog::debug("[Download] shut down, closed {} progress streams", open.size());
}

std::string DownloadManager::make_task_id(const std::string& resource_key) {
    return "dl-" + fnv1a_hex(resource_key);
}

void DownloadManager::load_registry() {
    std::lock_guard lock(mutex_);
    auto cursor = store_.scan(store::kDownloadsCollection);
    std::vector<std::string> damaged;
    while (auto record = cursor.next()) {
        DownloadTask task;
        try {
            task = record->body.get<DownloadTask>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[Download] undecodable task {}: {}", record->id, e.what());
            damaged.push_back(record->id);
            continue;
        }

        auto state = std::make_shared<TaskState>();
        state->task = std::move(task);
        if (state->task.status == DownloadStatus::Queued || state->task.status == DownloadStatus::Downloading) {
            // Interrupted by a restart; the staging file holds what was written
            state->task.status = DownloadStatus::Paused;
            state->task.transferred_bytes = state->task.range_supported
                ? file_size_or_zero(state->task.staging_path())
                : 0;
            state->interrupted = true;
            persist_locked(*state);
        }
        by_resource_[state->task.resource_key] = state->task.id;
        tasks_[state->task.id] = std::move(state);
    }
    for (const auto& id : cursor.corrupt_ids()) {
        damaged.push_back(id);
    }
    for (const auto& id : damaged) {
        auto moved = store_.quarantine(store::kDownloadsCollection, id, "undecodable download task", clock_.now());
        if (moved.is_error()) {
            spdlog::error("[Download] could not quarantine task {}: {}", id, moved.error().message);
        }
    }
    spdlog::debug("[Download] registry loaded tasks={}", tasks_.size());
}

Result<std::string> DownloadManager::start(const std::string& resource_key,
                                           const std::string& source_url,
                                           const std::string& destination,
                                           const std::string& quality,
                                           const std::string& expected_checksum) {
    if (resource_key.empty() || source_url.empty() || destination.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "resource key, URL and destination are required");
    }

    const auto id = make_task_id(resource_key);
    {
        std::lock_guard lock(mutex_);
        if (auto existing = find_locked(id)) {
            const auto status = existing->task.status;
            if (status == DownloadStatus::Queued || status == DownloadStatus::Downloading ||
                status == DownloadStatus::Paused) {
                spdlog::debug("[Download] attaching to {} for {}", id, resource_key);
                return Ok(id);
            }
            if (status == DownloadStatus::Completed && fs::exists(existing->task.local_path)) {
                return Ok(id);
            }
        }
    }

    AssetProbe probe;
    auto probed = source_.probe(source_url);
    if (probed.is_ok()) {
        probe = probed.value();
    } else if (!probed.error().is_transient()) {
        return Err<std::string>(probed.error());
    } else {
        spdlog::warn("[Download] probe of {} failed, transfer will retry: {}", source_url, probed.error().message);
    }

    const auto parent = fs::path(destination).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Err<std::string>(ErrorCode::Io, "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::optional<Transition> requeued;
    {
        std::lock_guard lock(mutex_);
        auto previous = find_locked(id);
        if (previous && (previous->running || previous->task.status == DownloadStatus::Queued ||
                         previous->task.status == DownloadStatus::Downloading ||
                         previous->task.status == DownloadStatus::Paused)) {
            return Ok(id);
        }

        // Checked under the lock so two concurrent starts cannot both claim the same headroom
        if (probe.total_bytes) {
            auto quota = check_quota_locked(id, destination, *probe.total_bytes);
            if (quota.is_error()) {
                spdlog::warn("[Download] refusing {}: {}", resource_key, quota.error().message);
                return Err<std::string>(quota.error());
            }
        }

        auto state = std::make_shared<TaskState>();
        auto& task = state->task;
        task.id = id;
        task.resource_key = resource_key;
        task.source_url = source_url;
        task.local_path = destination;
        task.quality = quality;
        task.expected_checksum = expected_checksum;
        task.total_bytes = probe.total_bytes.value_or(0);
        task.range_supported = probe.supports_range;
        task.created_at = clock_.now();
        task.status = DownloadStatus::Queued;
        remove_file_quietly(task.staging_path());

        if (previous && can_transition(previous->task.status, DownloadStatus::Queued)) {
            requeued = Transition{task, previous->task.status};
        }

        tasks_[id] = state;
        by_resource_[resource_key] = id;
        persist_locked(*state);
        schedule_locked(state);
    }

    if (requeued) {
        publish_transition(*requeued);
    }
    spdlog::info("[Download] queued {} resource={} url={}", id, resource_key, source_url);
    return Ok(id);
}

Result<void> DownloadManager::pause(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    auto state = find_locked(task_id);
    if (!state) {
        return Err<void>(ErrorCode::NotFound, "Unknown download " + task_id);
    }
    switch (state->task.status) {
        case DownloadStatus::Queued:
        case DownloadStatus::Downloading:
            state->pause_requested = true;
            return Ok();
        case DownloadStatus::Paused:
            return Ok();
        default:
            return Err<void>(ErrorCode::InvalidState,
                             std::string("Cannot pause a ") + to_string(state->task.status) + " download");
    }
}

Result<void> DownloadManager::resume(const std::string& task_id) {
    std::optional<Transition> requeued;
    {
        std::lock_guard lock(mutex_);
        auto state = find_locked(task_id);
        if (!state) {
            return Err<void>(ErrorCode::NotFound, "Unknown download " + task_id);
        }

        auto& task = state->task;
        switch (task.status) {
            case DownloadStatus::Queued:
            case DownloadStatus::Downloading:
                state->pause_requested = false;
                return Ok();
            case DownloadStatus::Paused:
                state->pause_requested = false;
                state->interrupted = false;
                if (!state->running) {
                    schedule_locked(state);
                }
                return Ok();
            case DownloadStatus::Failed:
            case DownloadStatus::Cancelled: {
                const bool continue_staging = task.status == DownloadStatus::Failed && task.range_supported &&
                                              fs::exists(task.staging_path());
                if (!continue_staging) {
                    remove_file_quietly(task.staging_path());
                    task.transferred_bytes = 0;
                }
                auto moved = transition_locked(*state, DownloadStatus::Queued);
                if (moved.is_error()) {
                    return Err<void>(moved.error());
                }
                requeued = moved.value();
                state->pause_requested = false;
                state->cancel_requested = false;
                state->last_progress_percent = -1.0;
                persist_locked(*state);
                schedule_locked(state);
                break;
            }
            case DownloadStatus::Completed:
                return Err<void>(ErrorCode::InvalidState, "Download already completed: " + task_id);
        }
    }
    if (requeued) {
        publish_transition(*requeued);
    }
    return Ok();
}

Result<void> DownloadManager::cancel(const std::string& task_id) {
    Settled settled;
    {
        std::lock_guard lock(mutex_);
        auto state = find_locked(task_id);
        if (!state) {
            return Err<void>(ErrorCode::NotFound, "Unknown download " + task_id);
        }
        const auto status = state->task.status;
        if (status == DownloadStatus::Cancelled) {
            return Ok();
        }
        if (!can_transition(status, DownloadStatus::Cancelled)) {
            return Err<void>(ErrorCode::InvalidState,
                             std::string("Cannot cancel a ") + to_string(status) + " download");
        }
        if (state->running) {
            state->cancel_requested = true;
            return Ok();
        }
        // Not running: paused, so nothing else will finish it
        settled = cancel_locked(*state);
    }
    spdlog::info("[Download] cancelled {}", task_id);
    announce(settled);
    return Ok();
}

Result<void> DownloadManager::retry(const std::string& task_id) {
    std::optional<Transition> requeued;
    {
        std::lock_guard lock(mutex_);
        auto state = find_locked(task_id);
        if (!state) {
            return Err<void>(ErrorCode::NotFound, "Unknown download " + task_id);
        }
        if (state->task.status != DownloadStatus::Failed && state->task.status != DownloadStatus::Cancelled) {
            return Err<void>(ErrorCode::InvalidState,
                             std::string("Cannot retry a ") + to_string(state->task.status) + " download");
        }
        remove_file_quietly(state->task.staging_path());
        state->task.transferred_bytes = 0;
        auto moved = transition_locked(*state, DownloadStatus::Queued);
        if (moved.is_error()) {
            return Err<void>(moved.error());
        }
        requeued = moved.value();
        state->pause_requested = false;
        state->cancel_requested = false;
        state->last_progress_percent = -1.0;
        persist_locked(*state);
        schedule_locked(state);
    }
    publish_transition(*requeued);
    return Ok();
}

std::size_t DownloadManager::resume_interrupted() {
    std::vector<std::string> candidates;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, state] : tasks_) {
            const auto& task = state->task;
            const bool transient_failure = task.status == DownloadStatus::Failed &&
                                           task.last_error_code == ErrorCode::TransientNetwork;
            const bool restarted = task.status == DownloadStatus::Paused && state->interrupted;
            if (transient_failure || restarted) {
                candidates.push_back(id);
            }
        }
    }

    std::size_t resumed = 0;
    for (const auto& id : candidates) {
        auto result = resume(id);
        if (result.is_ok()) {
            ++resumed;
        } else {
            spdlog::warn("[Download] could not resume {}: {}", id, result.error().message);
        }
    }
    if (resumed > 0) {
        spdlog::info("[Download] resumed {} interrupted downloads", resumed);
    }
    return resumed;
}

Result<ProgressStream> DownloadManager::progress_of(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    auto state = find_locked(task_id);
    if (!state) {
        return Err<ProgressStream>(ErrorCode::NotFound, "Unknown download " + task_id);
    }

    auto queue = std::make_shared<ProgressQueue>();
    const auto snapshot = snapshot_of(state->task);
    if (is_terminal(state->task.status) || shutting_down_) {
        queue->push_and_close(snapshot);
    } else {
        queue->push(snapshot);
        state->subscribers.push_back(queue);
    }
    return Ok(ProgressStream(queue));
}

Result<DownloadTask> DownloadManager::task(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    auto state = find_locked(task_id);
    if (!state) {
        return Err<DownloadTask>(ErrorCode::NotFound, "Unknown download " + task_id);
    }
    return Ok(state->task);
}

std::vector<DownloadTask> DownloadManager::tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<DownloadTask> out;
    out.reserve(tasks_.size());
    for (const auto& [id, state] : tasks_) {
        out.push_back(state->task);
    }
    std::sort(out.begin(), out.end(),
              [](const DownloadTask& a, const DownloadTask& b) { return a.created_at < b.created_at; });
    return out;
}

std::size_t DownloadManager::cleanup_older_than(std::chrono::milliseconds age) {
    const Timestamp cutoff = clock_.now() - age.count();
    std::vector<DownloadTask> expired;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, state] : tasks_) {
            if (state->task.status == DownloadStatus::Completed && state->task.completed_at < cutoff) {
                expired.push_back(state->task);
            }
        }
    }

    std::size_t removed = 0;
    for (const auto& task : expired) {
        auto written = write_back_entity(task, false);
        if (written.is_error()) {
            spdlog::error("[Download] cleanup of {} failed: {}", task.id, written.error().message);
            continue;
        }
        remove_file_quietly(task.local_path);
        {
            std::lock_guard lock(mutex_);
            tasks_.erase(task.id);
            auto it = by_resource_.find(task.resource_key);
            if (it != by_resource_.end() && it->second == task.id) {
                by_resource_.erase(it);
            }
        }
        ++removed;
        spdlog::info("[Download] removed {} ({} bytes) completed at {}", task.local_path, task.total_bytes,
                     task.completed_at);
    }
    return removed;
}

DownloadStorageInfo DownloadManager::storage_info() const {
    std::lock_guard lock(mutex_);
    DownloadStorageInfo info;
    for (const auto& [id, state] : tasks_) {
        const auto& task = state->task;
        info.tasks_by_status[task.status]++;
        if (task.status == DownloadStatus::Completed) {
            info.bytes_on_disk += file_size_or_zero(task.local_path);
        } else {
            info.bytes_staged += file_size_or_zero(task.staging_path());
        }
    }
    return info;
}

void DownloadManager::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return announcing_ == 0 &&
               std::none_of(tasks_.begin(), tasks_.end(), [](const auto& entry) { return entry.second->running; });
    });
}

// ──────────────────────────────────────────────────────────
// Worker
// ──────────────────────────────────────────────────────────

void DownloadManager::run(const StatePtr& state) {
    if (shutting_down_) {
        release(state);
        return;
    }
    if (state->cancel_requested) {
        finish_cancelled(state);
        return;
    }

    std::optional<Transition> started;
    {
        std::lock_guard lock(mutex_);
        if (state->task.status != DownloadStatus::Downloading) {
            auto moved = transition_locked(*state, DownloadStatus::Downloading);
            if (moved.is_error()) {
                spdlog::error("[Download] {}: {}", state->task.id, moved.error().message);
                state->running = false;
                idle_cv_.notify_all();
                return;
            }
            started = moved.value();
            persist_locked(*state);
        }
    }
    if (started) {
        publish_transition(*started);
    }

    std::uint32_t attempt = 0;
    while (true) {
        auto result = transfer(state);
        if (result.is_ok()) {
            finish_completed(state);
            return;
        }

        const Error& error = result.error();
        if (error.code == ErrorCode::Cancelled) {
            if (shutting_down_) {
                release(state);
            } else if (state->cancel_requested) {
                finish_cancelled(state);
            } else {
                finish_paused(state);
            }
            return;
        }

        bool range_supported = false;
        {
            std::lock_guard lock(mutex_);
            range_supported = state->task.range_supported;
            if (error.is_transient() && attempt < config_.max_retries) {
                state->task.retry_count++;
                state->task.last_error = error.message;
                state->task.last_error_code = error.code;
                persist_locked(*state);
            }
        }

        if (error.is_transient() && attempt < config_.max_retries) {
            ++attempt;
            const auto delay = backoff_for(attempt);
            spdlog::warn("[Download] {} interrupted ({}); retry {}/{} in {}ms",
                         state->task.id, error.message, attempt, config_.max_retries, delay.count());
            wait_backoff(*state, delay);
            continue;
        }

        finish_failed(state, error, error.is_transient() && range_supported);
        return;
    }
}

Result<void> DownloadManager::transfer(const StatePtr& state) {
    if (interrupt_requested(*state)) {
        return Err<void>(ErrorCode::Cancelled, "interrupted");
    }

    std::string url;
    std::string staging;
    std::uint64_t offset = 0;
    {
        std::lock_guard lock(mutex_);
        url = state->task.source_url;
        staging = state->task.staging_path();
        offset = state->task.range_supported ? file_size_or_zero(staging) : 0;
        state->task.transferred_bytes = offset;
    }

    std::ofstream out(staging, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out) {
        return Err<void>(ErrorCode::Io, "Cannot open staging file " + staging);
    }
    if (offset > 0) {
        spdlog::info("[Download] {} continuing at byte {}", state->task.id, offset);
    }

    auto sink = [this, &state, &out](const char* data, std::size_t size) -> Result<void> {
        if (interrupt_requested(*state)) {
            return Err<void>(ErrorCode::Cancelled, "interrupted");
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            return Err<void>(ErrorCode::Io, "Write to staging file failed");
        }
        {
            std::lock_guard lock(mutex_);
            state->task.transferred_bytes += size;
        }
        publish_progress(state, false);
        return Ok();
    };

    auto fetched = source_.fetch(url, offset, sink);
    out.flush();
    out.close();
    if (fetched.is_ok() && !out) {
        return Err<void>(ErrorCode::Io, "Flushing staging file failed");
    }
    return fetched;
}

bool DownloadManager::interrupt_requested(const TaskState& state) const {
    return shutting_down_ || state.pause_requested || state.cancel_requested;
}

void DownloadManager::wait_backoff(const TaskState& state, std::chrono::milliseconds delay) const {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!interrupt_requested(state)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(20)));
    }
}

void DownloadManager::release(const StatePtr& state) {
    {
        std::lock_guard lock(mutex_);
        // Left as downloading on disk; the next start reloads it as paused
        persist_locked(*state);
        state->running = false;
    }
    idle_cv_.notify_all();
}

void DownloadManager::finish_completed(const StatePtr& state) {
    std::string staging;
    std::string destination;
    std::uint64_t expected_size = 0;
    std::string expected_checksum;
    {
        std::lock_guard lock(mutex_);
        staging = state->task.staging_path();
        destination = state->task.local_path;
        expected_size = state->task.total_bytes;
        expected_checksum = state->task.expected_checksum;
    }

    const auto size = file_size_or_zero(staging);
    if (expected_size != 0 && size != expected_size) {
        finish_failed(state, Error{ErrorCode::CorruptLocalState,
                                   "Size mismatch: got " + std::to_string(size) + " of " +
                                       std::to_string(expected_size) + " bytes"},
                      false);
        return;
    }
    if (!expected_checksum.empty()) {
        const auto actual = hash_file(staging);
        if (actual != expected_checksum) {
            finish_failed(state, Error{ErrorCode::CorruptLocalState,
                                       "Checksum mismatch: expected " + expected_checksum + ", got " + actual},
                          false);
            return;
        }
    }

    std::error_code ec;
    fs::rename(staging, destination, ec);
    if (ec) {
        finish_failed(state, Error{ErrorCode::Io, "Cannot move download into place: " + ec.message()}, false);
        return;
    }

    DownloadTask completed;
    {
        std::lock_guard lock(mutex_);
        completed = state->task;
    }
    completed.total_bytes = size;
    completed.transferred_bytes = size;
    completed.completed_at = clock_.now();
    completed.last_error.clear();
    completed.last_error_code.reset();
    completed.status = DownloadStatus::Completed;

    // Entity first: a task reported completed already has its local path recorded
    auto written = write_back_entity(completed, true);
    if (written.is_error()) {
        spdlog::error("[Download] {} finished but the registry update failed: {}",
                      completed.id, written.error().message);
    }

    Settled settled;
    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        task.total_bytes = completed.total_bytes;
        task.transferred_bytes = completed.transferred_bytes;
        task.completed_at = completed.completed_at;
        task.last_error.clear();
        task.last_error_code.reset();
        state->pause_requested = false;
        state->cancel_requested = false;
        settled = settle_locked(*state, DownloadStatus::Completed);
    }
    spdlog::info("[Download] completed {} -> {} ({} bytes)", completed.id, destination, size);
    announce(settled);
}

void DownloadManager::finish_paused(const StatePtr& state) {
    Settled settled;
    {
        std::lock_guard lock(mutex_);
        if (!state->pause_requested) {
            // resume() arrived before the worker stopped; keep going
            asio::post(pool_, [this, state]() { run(state); });
            return;
        }
        state->pause_requested = false;
        settled = settle_locked(*state, DownloadStatus::Paused);
    }
    announce(settled);
}

void DownloadManager::finish_cancelled(const StatePtr& state) {
    Settled settled;
    {
        std::lock_guard lock(mutex_);
        settled = cancel_locked(*state);
    }
    spdlog::info("[Download] cancelled {}", settled.snapshot.task_id);
    announce(settled);
}

void DownloadManager::finish_failed(const StatePtr& state, const Error& error, bool keep_staging) {
    Settled settled;
    {
        std::lock_guard lock(mutex_);
        if (!keep_staging) {
            remove_file_quietly(state->task.staging_path());
            state->task.transferred_bytes = 0;
        }
        state->task.last_error = error.message;
        state->task.last_error_code = error.code;
        settled = settle_locked(*state, DownloadStatus::Failed);
    }
    announce(settled, error.message);
}

void DownloadManager::announce(const Settled& settled, const std::string& error) {
    if (settled.transition) {
        publish_transition(*settled.transition, error);
    }
    for (const auto& weak : settled.subscribers) {
        if (auto queue = weak.lock()) {
            if (settled.close_streams) {
                queue->push_and_close(settled.snapshot);
            } else {
                queue->push(settled.snapshot);
            }
        }
    }
    if (!settled.close_streams) {
        const auto& snapshot = settled.snapshot;
        bus_.emit(events::DownloadProgressEvent{snapshot.task_id, snapshot.resource_key,
                                                snapshot.transferred_bytes, snapshot.total_bytes});
    }
    {
        std::lock_guard lock(mutex_);
        --announcing_;
    }
    idle_cv_.notify_all();
}

// ──────────────────────────────────────────────────────────
// Helpers
// ──────────────────────────────────────────────────────────

Result<DownloadManager::Transition> DownloadManager::transition_locked(TaskState& state, DownloadStatus to) {
    const auto from = state.task.status;
    if (!can_transition(from, to)) {
        return Err<Transition>(ErrorCode::InvalidState,
                               std::string("Illegal download transition ") + to_string(from) + " -> " + to_string(to));
    }
    state.task.status = to;
    return Ok(Transition{state.task, from});
}

DownloadManager::Settled DownloadManager::settle_locked(TaskState& state, DownloadStatus to) {
    Settled settled;
    auto moved = transition_locked(state, to);
    if (moved.is_ok()) {
        settled.transition = moved.value();
    } else {
        spdlog::error("[Download] {}: {}", state.task.id, moved.error().message);
    }
    persist_locked(state);
    state.running = false;

    settled.snapshot = snapshot_of(state.task);
    settled.close_streams = is_terminal(state.task.status);
    if (settled.close_streams) {
        settled.subscribers.swap(state.subscribers);
    } else {
        settled.subscribers = state.subscribers;
    }
    ++announcing_;
    return settled;
}

DownloadManager::Settled DownloadManager::cancel_locked(TaskState& state) {
    remove_file_quietly(state.task.staging_path());
    state.task.transferred_bytes = 0;
    state.cancel_requested = false;
    state.pause_requested = false;
    return settle_locked(state, DownloadStatus::Cancelled);
}

void DownloadManager::persist_locked(const TaskState& state) {
    auto saved = store_.put_as(store::kDownloadsCollection, state.task.id, state.task);
    if (saved.is_error()) {
        spdlog::error("[Download] could not persist {}: {}", state.task.id, saved.error().message);
    }
}

void DownloadManager::schedule_locked(const StatePtr& state) {
    if (shutting_down_) {
        // Stays queued on disk; the next process reloads it as paused
        spdlog::debug("[Download] not scheduling {} during shutdown", state->task.id);
        return;
    }
    state->running = true;
    asio::post(pool_, [this, state]() { run(state); });
}

DownloadManager::StatePtr DownloadManager::find_locked(const std::string& task_id) const {
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

void DownloadManager::publish_transition(const Transition& transition, const std::string& error) {
    events::DownloadStateChangedEvent event;
    event.task_id = transition.task.id;
    event.resource_key = transition.task.resource_key;
    event.from = transition.from;
    event.to = transition.task.status;
    event.transferred_bytes = transition.task.transferred_bytes;
    event.error = error;
    bus_.emit(event);
}

void DownloadManager::publish_progress(const StatePtr& state, bool force) {
    ProgressSnapshot snapshot;
    std::vector<std::shared_ptr<ProgressQueue>> listeners;
    {
        std::lock_guard lock(mutex_);
        const Timestamp now = clock_.now();
        snapshot = snapshot_of(state->task);
        const double percent = snapshot.percent();
        const bool due = force || state->last_progress_percent < 0 ||
                         percent - state->last_progress_percent >= config_.progress_step_percent ||
                         now - state->last_progress_at >= config_.progress_interval.count() ||
                         (snapshot.total_bytes != 0 && snapshot.transferred_bytes >= snapshot.total_bytes);
        if (!due) {
            return;
        }
        state->last_progress_percent = percent;
        state->last_progress_at = now;

        auto& subscribers = state->subscribers;
        for (auto it = subscribers.begin(); it != subscribers.end();) {
            if (auto queue = it->lock()) {
                listeners.push_back(std::move(queue));
                ++it;
            } else {
                it = subscribers.erase(it);
            }
        }
        persist_locked(*state);
    }

    for (auto& queue : listeners) {
        queue->push(snapshot);
    }
    bus_.emit(events::DownloadProgressEvent{snapshot.task_id, snapshot.resource_key,
                                            snapshot.transferred_bytes, snapshot.total_bytes});
}

Result<void> DownloadManager::check_quota_locked(const std::string& task_id, const std::string& destination,
                                                std::uint64_t incoming_bytes) const {
    if (config_.quota_bytes > 0) {
        // Unfinished tasks hold their full expected size, not just what they staged so far
        std::uint64_t used = 0;
        for (const auto& [id, state] : tasks_) {
            if (id == task_id) {
                continue;
            }
            const auto& task = state->task;
            switch (task.status) {
                case DownloadStatus::Completed:
                    used += file_size_or_zero(task.local_path);
                    break;
                case DownloadStatus::Queued:
                case DownloadStatus::Downloading:
                case DownloadStatus::Paused:
                    used += std::max(file_size_or_zero(task.staging_path()), task.total_bytes);
                    break;
                default:
                    used += file_size_or_zero(task.staging_path());
                    break;
            }
        }
        if (used + incoming_bytes > config_.quota_bytes) {
            return Err<void>(ErrorCode::QuotaExceeded,
                             "Download quota exceeded: " + std::to_string(used) + " used + " +
                                 std::to_string(incoming_bytes) + " requested > " +
                                 std::to_string(config_.quota_bytes));
        }
    }

    // fs::space needs an existing path; walk up to the nearest one
    fs::path probe_path = fs::path(destination).parent_path();
    if (probe_path.empty()) {
        probe_path = ".";
    }
    std::error_code ec;
    while (!fs::exists(probe_path, ec) && probe_path.has_parent_path() && probe_path != probe_path.parent_path()) {
        probe_path = probe_path.parent_path();
    }
    const auto space = fs::space(probe_path, ec);
    if (ec) {
        spdlog::warn("[Download] cannot query free space at {}: {}", probe_path.string(), ec.message());
        return Ok();
    }
    if (space.available < incoming_bytes + config_.reserve_free_bytes) {
        return Err<void>(ErrorCode::QuotaExceeded,
                         "Not enough free space: " + std::to_string(space.available) + " available, " +
                             std::to_string(incoming_bytes + config_.reserve_free_bytes) + " needed");
    }
    return Ok();
}

Result<void> DownloadManager::write_back_entity(const DownloadTask& task, bool available) {
    std::vector<store::StoreOp> ops;
    if (available) {
        ops.push_back(store::StoreOp::put(store::kDownloadsCollection, task.id, nlohmann::json(task)));
    } else {
        ops.push_back(store::StoreOp::remove(store::kDownloadsCollection, task.id));
    }

    std::optional<std::pair<std::string, std::string>> entity_key = store::split_entity_key(task.resource_key);
    if (entity_key && !store::is_entity_collection(entity_key->first)) {
        entity_key.reset();
    }
    std::unique_lock<std::mutex> entity_guard;
    if (entity_key && entity_lock_) {
        entity_guard = entity_lock_();
    }
    if (entity_key) {
        const auto& [collection, id] = *entity_key;
        auto existing = store_.get_as<store::EntityRecord>(collection, id);
        store::EntityRecord record;
        bool write = true;
        if (existing.is_ok()) {
            record = existing.value();
        } else if (existing.error().code == ErrorCode::NotFound && available) {
            record.collection = collection;
            record.id = id;
        } else {
            if (existing.error().code != ErrorCode::NotFound) {
                spdlog::warn("[Download] not updating {}: {}", task.resource_key, existing.error().message);
            }
            write = false;
            entity_key.reset();
        }
        if (write) {
            record.local_path = available ? task.local_path : std::string{};
            record.available_offline = available;
            ops.push_back(store::StoreOp::put(collection, id, nlohmann::json(record)));
        }
    }

    auto committed = store_.transact(ops);
    if (entity_guard.owns_lock()) {
        entity_guard.unlock();
    }
    if (committed.is_error()) {
        return committed;
    }
    if (entity_key) {
        bus_.emit(events::EntityChangedEvent{entity_key->first, entity_key->second, "download", false});
    }
    return Ok();
}

std::chrono::milliseconds DownloadManager::backoff_for(std::uint32_t attempt) const {
    auto delay = config_.retry_backoff.count();
    const auto cap = config_.retry_backoff_max.count();
    for (std::uint32_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::max<std::int64_t>(0, std::min(delay, cap))};
}

} // namespace lsync::download
