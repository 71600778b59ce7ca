/**
 * @file offline_sync_demo.cpp
 * @brief Walkthrough of an offline session followed by reconnection
 *
 * WHAT IT SHOWS:
 * - Progress edits recorded while offline (entity marked dirty)
 * - Reconnection: debounced, then the queue drains and remote changes arrive
 * - A lesson video downloaded with progress reporting
 * - Cached API responses with a bounded footprint
 *
 * USAGE:
 *   lsync_demo [config.json]
 *
 * Everything runs in-process: the remote is a MemoryRemoteStore and the
 * "video" is a temporary file served by FileAssetSource.
 */

#include "lsync/core/config.hpp"
#include "lsync/core/hash.hpp"
#include "lsync/download/asset_source.hpp"
#include "lsync/engine.hpp"
#include "lsync/sync/memory_remote_store.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace lsync;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════
// Setup
// ════════════════════════════════════════════════════════════

EngineConfig load_config(int argc, char* argv[], const fs::path& workdir) {
    EngineConfig config;
    if (argc > 1) {
        auto loaded = ConfigLoader::from_file(argv[1]);
        if (loaded.is_error()) {
            spdlog::warn("Could not load {}: {}; using defaults", argv[1], loaded.error().message);
        } else {
            config = loaded.value();
        }
    }
    if (config.store.path == StoreConfig{}.path) {
        config.store.path = (workdir / "lsync.db").string();
    }
    if (config.sync.collections.empty()) {
        config.sync.collections = {"courses", "lessons", "progress"};
    }
    config.sync.connectivity_debounce = std::chrono::milliseconds(200);
    config.cache.capacity_bytes = 4096;
    return config;
}

fs::path make_video(const fs::path& workdir) {
    const auto path = workdir / "lesson1-720p.mp4";
    std::ofstream out(path, std::ios::binary);
    for (int i = 0; i < 256 * 1024; ++i) {
        out.put(static_cast<char>(i * 31 % 251));
    }
    return path;
}

void wait_for_idle(SyncEngine& engine) {
    // The reconnect sync starts on the timer thread once the debounce settles
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    engine.request_sync().wait();
}

// ════════════════════════════════════════════════════════════
// Main
// ════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    const fs::path workdir = fs::temp_directory_path() / "lsync-demo";
    fs::remove_all(workdir);
    fs::create_directories(workdir);

    EngineConfig config = load_config(argc, argv, workdir);

    sync::MemoryRemoteStore remote(system_clock(), 50);
    download::FileAssetSource assets(16 * 1024);

    remote.upsert("courses", "cpp101", {{"title", "Modern C++"}, {"lessons", 12}});
    remote.upsert("lessons", "lesson1", {{"title", "Values and references"}, {"minutes", 18}});

    try {
        SyncEngine engine(config, remote, assets);
        engine.start();

        engine.watch_sync_status([](const events::SyncStatusChangedEvent& e) {
            spdlog::info("UI: sync status {} -> {}", sync::to_string(e.from), sync::to_string(e.to));
        });
        engine.watch("progress", "lesson1", [](const events::EntityChangedEvent& e) {
            spdlog::info("UI: progress/lesson1 changed ({})", e.source);
        });

        // ── Offline edits ──────────────────────────────────────
        spdlog::info("═══ Offline ═══");
        for (int percent : {25, 60, 100}) {
            auto queued = engine.enqueue_action("progress", "lesson1", queue::kind::kMerge,
                                                {{"percent", percent}, {"lesson", "lesson1"}});
            if (queued.is_error()) {
                spdlog::error("enqueue failed: {}", queued.error().to_string());
            }
        }
        if (auto view = engine.read("progress", "lesson1"); view.is_ok()) {
            spdlog::info("Local progress: {} dirty={} stale={}", view.value().record.data.dump(),
                         view.value().dirty, view.value().stale);
        }

        // ── Reconnect ─────────────────────────────────────────
        spdlog::info("═══ Reconnecting ═══");
        engine.set_online(true);
        wait_for_idle(engine);

        if (auto remote_copy = remote.get("progress", "lesson1")) {
            spdlog::info("Remote progress: {}", remote_copy->data.dump());
        }
        if (auto course = engine.read("courses", "cpp101"); course.is_ok()) {
            spdlog::info("Pulled course: {}", course.value().record.data.dump());
        }

        // ── Download ──────────────────────────────────────────
        spdlog::info("═══ Download ═══");
        const auto video = make_video(workdir);
        const auto checksum = hash_file(video);
        auto task = engine.start_download("lessons/lesson1", "file://" + video.string(),
                                          (workdir / "offline" / "lesson1.mp4").string(), "720p",
                                          checksum);
        if (task.is_ok()) {
            auto progress = engine.download_progress(task.value());
            if (progress.is_ok()) {
                while (auto snapshot = progress.value().next()) {
                    spdlog::info("Download {} {:.0f}%", download::to_string(snapshot->status),
                                 snapshot->percent());
                }
            }
        } else {
            spdlog::error("download failed to start: {}", task.error().to_string());
        }
        engine.downloads().wait_idle();

        if (auto lesson = engine.read("lessons", "lesson1"); lesson.is_ok()) {
            spdlog::info("Lesson available offline: {} at {}", lesson.value().record.available_offline,
                         lesson.value().record.local_path);
        }

        // ── Cache ─────────────────────────────────────────────
        spdlog::info("═══ Cache ═══");
        for (int page = 0; page < 8; ++page) {
            const auto key = "catalog/page" + std::to_string(page);
            auto body = engine.fetch_cached(key, page == 0 ? 10 : 0, [page]() -> Result<std::string> {
                return Ok(std::string(1024, static_cast<char>('a' + page)));
            });
            if (body.is_error()) {
                spdlog::error("cache fetch failed: {}", body.error().to_string());
            }
        }

        const auto info = engine.storage_info();
        spdlog::info("Storage: cache {}/{} bytes in {} entries, downloads {} bytes, pending actions {}",
                     info.cache_bytes, info.cache_capacity, info.cache_entries,
                     info.downloads.bytes_on_disk, info.pending_actions);

        engine.metrics().print_stats();
        engine.stop();
    } catch (const std::exception& e) {
        spdlog::error("Demo failed: {}", e.what());
        return 1;
    }

    fs::remove_all(workdir);
    return 0;
}
