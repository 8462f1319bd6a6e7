// ============= include/database/index_maintenance.hpp =============
/*
 * Index Maintenance
 *
 * - rebuild(): snapshot de list_active() + swap atómico (un solo writer)
 * - insert/remove incrementales; un fallo marca el índice como dirty
 * - request_rebuild(): rebuild forzado en background (coalescido)
 * - maintenance loop: rebuild si dirty o si venció el intervalo,
 *   snapshot opcional a disco
 * - warm_start(): carga snapshot y reconcilia con un rebuild
 */

#pragma once
#include "core/config.hpp"
#include "database/audit_log.hpp"
#include "database/identity_store.hpp"
#include "database/thread_pool.hpp"
#include "database/vector_index.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace faceattend {

struct RebuildStats {
    size_t entry_count = 0;
    size_t identity_count = 0;
    int64_t duration_ms = 0;
};

class IndexMaintenance {
public:
    IndexMaintenance(VectorIndex& index,
                     IdentityStore& store,
                     AuditSink& audit,
                     const IndexConfig& config);
    ~IndexMaintenance();

    IndexMaintenance(const IndexMaintenance&) = delete;
    IndexMaintenance& operator=(const IndexMaintenance&) = delete;

    RebuildStats rebuild(const std::string& reason = "manual");

    // true si quedó en el índice; false = dirty, lo arregla el próximo ciclo
    bool insert_identity(const Identity& identity);
    bool remove_identity(IdentityId identity_id);

    void mark_dirty(const std::string& reason);
    bool is_dirty() const { return dirty.load(); }

    // false si ya había uno pendiente
    bool request_rebuild(const std::string& reason);
    void wait_idle();

    RebuildStats warm_start();
    bool save_snapshot();

    void start();
    void stop();
    bool is_running() const { return running.load(); }

    uint64_t rebuild_count() const { return rebuilds.load(); }
    int64_t last_rebuild_ms() const { return last_rebuild.load(); }

private:
    VectorIndex& index;
    IdentityStore& store;
    AuditSink& audit;
    IndexConfig config;

    std::atomic<bool> dirty{false};
    std::atomic<bool> rebuild_pending{false};
    std::atomic<uint64_t> rebuilds{0};
    std::atomic<int64_t> last_rebuild{0};

    ThreadPool background{1};

    std::atomic<bool> running{false};
    std::thread maintenance_thread;
    std::mutex loop_mutex;
    std::condition_variable loop_cv;

    void maintenance_loop();
};

} // namespace faceattend
