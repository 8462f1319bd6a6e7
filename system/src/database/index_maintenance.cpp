// ============= src/database/index_maintenance.cpp =============
#include "database/index_maintenance.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace faceattend {

IndexMaintenance::IndexMaintenance(VectorIndex& index,
                                   IdentityStore& store,
                                   AuditSink& audit,
                                   const IndexConfig& config)
    : index(index), store(store), audit(audit), config(config)
{
}

IndexMaintenance::~IndexMaintenance() {
    stop();
    background.stop();
}

// ==================== REBUILD ====================

RebuildStats IndexMaintenance::rebuild(const std::string& reason) {
    auto t0 = std::chrono::steady_clock::now();

    // Se limpia antes del snapshot: un mark_dirty concurrente no se pierde
    dirty.store(false);

    RebuildStats stats;
    try {
        stats.entry_count = index.rebuild_with([this]() { return store.list_active(); });
    } catch (const std::exception& e) {
        dirty.store(true);
        spdlog::error("❌ Rebuild falló ({}): {}", reason, e.what());
        throw;
    }

    stats.identity_count = index.identity_count();
    stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    rebuilds++;
    last_rebuild.store(now_ms());

    spdlog::info("🔄 Índice reconstruido ({}): {} entradas, {} identidades en {} ms",
                 reason, stats.entry_count, stats.identity_count, stats.duration_ms);

    AuditRecord entry;
    entry.action = "index.rebuilt";
    entry.subject_kind = "index";
    entry.details = fmt::format("reason={} entries={} identities={} ms={}",
                                reason, stats.entry_count, stats.identity_count, stats.duration_ms);
    audit.record(entry);

    return stats;
}

// ==================== INCREMENTAL ====================

bool IndexMaintenance::insert_identity(const Identity& identity) {
    if (!index.is_ready()) {
        mark_dirty("insert before first build (identity " + std::to_string(identity.id) + ")");
        return false;
    }

    try {
        size_t added = index.insert_identity(identity);
        spdlog::debug("Índice: +{} entradas para identity {}", added, identity.id);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("❌ Insert de identity {} falló: {}", identity.id, e.what());
        mark_dirty("insert failed");
        return false;
    }
}

bool IndexMaintenance::remove_identity(IdentityId identity_id) {
    try {
        size_t removed = index.remove(identity_id);
        spdlog::debug("Índice: -{} entradas de identity {}", removed, identity_id);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("❌ Remove de identity {} falló: {}", identity_id, e.what());
        mark_dirty("remove failed");
        return false;
    }
}

void IndexMaintenance::mark_dirty(const std::string& reason) {
    if (!dirty.exchange(true)) {
        spdlog::warn("⚠️  Índice marcado dirty: {}", reason);
    }
    { std::lock_guard<std::mutex> lock(loop_mutex); }
    loop_cv.notify_all();
}

// ==================== FORCED REBUILD ====================

bool IndexMaintenance::request_rebuild(const std::string& reason) {
    if (rebuild_pending.exchange(true)) {
        return false;
    }

    spdlog::warn("🔄 Rebuild forzado solicitado: {}", reason);

    try {
        background.post([this, reason]() {
            rebuild_pending.store(false);
            try {
                rebuild(reason);
            } catch (const std::exception& e) {
                spdlog::error("❌ Rebuild en background falló: {}", e.what());
            }
        }, TaskPriority::Low);
    } catch (const std::exception& e) {
        rebuild_pending.store(false);
        mark_dirty(reason);
        spdlog::error("No se pudo programar rebuild: {}", e.what());
        return false;
    }

    return true;
}

void IndexMaintenance::wait_idle() {
    background.wait_all();
}

// ==================== PERSISTENCE ====================

bool IndexMaintenance::save_snapshot() {
    if (config.snapshot_path.empty()) return false;

    std::filesystem::path p(config.snapshot_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    spdlog::info("💾 Saving HNSW index...");
    return index.save(config.snapshot_path);
}

RebuildStats IndexMaintenance::warm_start() {
    if (!config.snapshot_path.empty() && std::filesystem::exists(config.snapshot_path)) {
        if (index.load(config.snapshot_path)) {
            spdlog::info("✓ Snapshot cargado, reconciliando con el store");
        } else {
            spdlog::warn("Snapshot {} inválido, rebuild completo", config.snapshot_path);
        }
    }

    return rebuild("warm start");
}

// ==================== MAINTENANCE LOOP ====================

void IndexMaintenance::start() {
    if (running.exchange(true)) return;

    maintenance_thread = std::thread(&IndexMaintenance::maintenance_loop, this);
    spdlog::info("✓ Index maintenance started (interval {} s)", config.rebuild_interval_sec);
}

void IndexMaintenance::stop() {
    if (!running.exchange(false)) return;

    { std::lock_guard<std::mutex> lock(loop_mutex); }
    loop_cv.notify_all();
    if (maintenance_thread.joinable()) maintenance_thread.join();

    background.wait_all();
    save_snapshot();

    spdlog::info("✓ Index maintenance stopped");
}

void IndexMaintenance::maintenance_loop() {
    spdlog::info("🔧 Maintenance thread started");

    auto interval = std::chrono::seconds(std::max(config.rebuild_interval_sec, 1));
    auto last_cycle = std::chrono::steady_clock::now();

    while (running.load()) {
        {
            std::unique_lock<std::mutex> lock(loop_mutex);
            loop_cv.wait_for(lock, interval, [this] {
                return !running.load() || dirty.load();
            });
        }

        if (!running.load()) break;

        auto now = std::chrono::steady_clock::now();
        bool elapsed = now - last_cycle >= interval;
        if (!dirty.load() && !elapsed) continue;

        try {
            rebuild(dirty.load() ? "dirty" : "periodic");
            save_snapshot();
        } catch (const std::exception& e) {
            spdlog::error("❌ Ciclo de mantenimiento falló: {}", e.what());
        }
        last_cycle = std::chrono::steady_clock::now();

        // Backoff tras un fallo
        if (dirty.load()) {
            std::unique_lock<std::mutex> lock(loop_mutex);
            loop_cv.wait_for(lock, std::chrono::seconds(1), [this] { return !running.load(); });
        }
    }

    spdlog::info("🔧 Maintenance thread stopped");
}

} // namespace faceattend
