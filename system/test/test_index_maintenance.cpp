/*
 * Tests de mantenimiento del índice
 *
 * - Rebuild desde el store (fuente de verdad)
 * - Inserts concurrentes con rebuild: no se pierde nada
 * - Rebuild forzado en background, loop periódico
 * - Snapshot + warm start
 */

#include <gtest/gtest.h>
#include "database/index_maintenance.hpp"
#include "database/sqlite_identity_store.hpp"
#include "test_support.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace faceattend;
using namespace faceattend::testing_support;

class IndexMaintenanceTest : public ::testing::Test {
protected:
    EngineConfig config = make_config();
    SqliteIdentityStore store{":memory:", kDim, 3};
    RecordingAuditSink audit;
    VectorIndex index{config.index};

    // Aprobada en el store, sin tocar el índice
    Identity approve_in_store(int axis, int samples = 3) {
        CandidateInfo c;
        c.name = "persona-" + std::to_string(axis);
        auto request = store.create_pending(c);
        for (int k = 0; k < samples; ++k) {
            store.attach_embedding(request.id, sample_vector(axis % kNoiseAxis, k), 0.9f);
        }
        return store.promote(request.id, "test").identity;
    }

    std::filesystem::path snapshot_path(const std::string& name) {
        auto p = std::filesystem::temp_directory_path() / "faceattend_tests" / name;
        std::filesystem::remove(p);
        return p;
    }
};

TEST_F(IndexMaintenanceTest, RebuildMirrorsActiveIdentities) {
    IndexMaintenance maintenance(index, store, audit, config.index);

    Identity a = approve_in_store(0);
    Identity b = approve_in_store(1, 4);
    Identity c = approve_in_store(2);
    store.deactivate(c.id);

    RebuildStats stats = maintenance.rebuild("test");

    EXPECT_EQ(stats.entry_count, 7u);
    EXPECT_EQ(stats.identity_count, 2u);
    EXPECT_TRUE(index.contains(a.id));
    EXPECT_TRUE(index.contains(b.id));
    EXPECT_FALSE(index.contains(c.id));
    EXPECT_EQ(maintenance.rebuild_count(), 1u);
    EXPECT_GT(maintenance.last_rebuild_ms(), 0);
    EXPECT_EQ(audit.count("index.rebuilt"), 1);
}

TEST_F(IndexMaintenanceTest, EveryIdentityMatchesItselfAfterRebuild) {
    IndexMaintenance maintenance(index, store, audit, config.index);

    std::vector<Identity> identities;
    for (int axis = 0; axis < kNoiseAxis; ++axis) {
        identities.push_back(approve_in_store(axis));
    }
    maintenance.rebuild("test");

    for (const auto& identity : identities) {
        for (const auto& e : identity.embeddings) {
            auto r = index.search(e, 1);
            ASSERT_EQ(r.size(), 1u);
            EXPECT_EQ(r[0].identity_id, identity.id);
            EXPECT_NEAR(r[0].similarity, 1.0f, 1e-5f);
        }
    }
}

TEST_F(IndexMaintenanceTest, InsertBeforeFirstBuildMarksDirty) {
    IndexMaintenance maintenance(index, store, audit, config.index);
    Identity a = approve_in_store(0);

    EXPECT_FALSE(maintenance.insert_identity(a));
    EXPECT_TRUE(maintenance.is_dirty());

    maintenance.rebuild("dirty");
    EXPECT_FALSE(maintenance.is_dirty());
    EXPECT_TRUE(index.contains(a.id));

    Identity b = approve_in_store(1);
    EXPECT_TRUE(maintenance.insert_identity(b));
    EXPECT_TRUE(maintenance.remove_identity(b.id));
    EXPECT_FALSE(index.contains(b.id));
}

TEST_F(IndexMaintenanceTest, RebuildDuringConcurrentInsertsLosesNothing) {
    IndexMaintenance maintenance(index, store, audit, config.index);
    maintenance.rebuild("initial");

    constexpr int kWriters = 2;
    constexpr int kPerWriter = 15;

    std::atomic<bool> writing{true};
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < kPerWriter; ++i) {
                Identity identity = approve_in_store(w * kPerWriter + i);
                maintenance.insert_identity(identity);
            }
        });
    }

    std::thread rebuilder([&]() {
        while (writing.load()) {
            maintenance.rebuild("concurrent");
        }
    });

    for (auto& t : writers) t.join();
    writing.store(false);
    rebuilder.join();

    auto active = store.list_active();
    ASSERT_EQ(active.size(), static_cast<size_t>(kWriters * kPerWriter));
    size_t expected_entries = 0;
    for (const auto& identity : active) {
        EXPECT_TRUE(index.contains(identity.id)) << "identity " << identity.id;
        expected_entries += identity.embeddings.size();
    }
    EXPECT_EQ(index.size(), expected_entries);
}

TEST_F(IndexMaintenanceTest, RequestedRebuildRunsInBackground) {
    IndexMaintenance maintenance(index, store, audit, config.index);
    maintenance.rebuild("initial");

    Identity a = approve_in_store(3);
    EXPECT_FALSE(index.contains(a.id));

    EXPECT_TRUE(maintenance.request_rebuild("test"));
    maintenance.wait_idle();

    EXPECT_TRUE(index.contains(a.id));
    EXPECT_EQ(maintenance.rebuild_count(), 2u);
}

TEST_F(IndexMaintenanceTest, MaintenanceLoopRepairsDirtyIndex) {
    IndexMaintenance maintenance(index, store, audit, config.index);
    maintenance.rebuild("initial");
    maintenance.start();
    EXPECT_TRUE(maintenance.is_running());

    Identity a = approve_in_store(4);
    maintenance.mark_dirty("test");

    EXPECT_TRUE(eventually([&]() { return index.contains(a.id); }));
    EXPECT_TRUE(eventually([&]() { return !maintenance.is_dirty(); }));

    maintenance.stop();
    EXPECT_FALSE(maintenance.is_running());
}

// ==================== SNAPSHOT ====================

TEST_F(IndexMaintenanceTest, SnapshotIsWrittenOnStop) {
    IndexConfig with_snapshot = config.index;
    with_snapshot.snapshot_path = snapshot_path("stop.bin").string();

    Identity a = approve_in_store(0);
    {
        IndexMaintenance maintenance(index, store, audit, with_snapshot);
        maintenance.rebuild("initial");
        maintenance.start();
        maintenance.stop();
    }
    ASSERT_TRUE(std::filesystem::exists(with_snapshot.snapshot_path));

    VectorIndex restored(with_snapshot);
    ASSERT_TRUE(restored.load(with_snapshot.snapshot_path));
    EXPECT_TRUE(restored.contains(a.id));
    EXPECT_EQ(restored.size(), 3u);
}

TEST_F(IndexMaintenanceTest, WarmStartReconcilesSnapshotWithStore) {
    IndexConfig with_snapshot = config.index;
    with_snapshot.snapshot_path = snapshot_path("warm.bin").string();

    Identity a = approve_in_store(0);
    Identity b = approve_in_store(1);
    {
        IndexMaintenance maintenance(index, store, audit, with_snapshot);
        maintenance.rebuild("initial");
        ASSERT_TRUE(maintenance.save_snapshot());
    }

    // Cambios mientras el proceso estaba abajo
    store.deactivate(b.id);
    Identity c = approve_in_store(2);

    VectorIndex fresh(with_snapshot);
    IndexMaintenance maintenance(fresh, store, audit, with_snapshot);
    RebuildStats stats = maintenance.warm_start();

    EXPECT_TRUE(fresh.contains(a.id));
    EXPECT_FALSE(fresh.contains(b.id));
    EXPECT_TRUE(fresh.contains(c.id));
    EXPECT_EQ(stats.identity_count, 2u);
}

TEST_F(IndexMaintenanceTest, WarmStartWithoutSnapshotBuildsFromStore) {
    Identity a = approve_in_store(0);

    IndexMaintenance maintenance(index, store, audit, config.index);
    EXPECT_FALSE(maintenance.save_snapshot());   // sin path configurado

    maintenance.warm_start();
    EXPECT_TRUE(index.is_ready());
    EXPECT_TRUE(index.contains(a.id));
}
