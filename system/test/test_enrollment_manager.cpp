/*
 * Tests del ciclo de enrolamiento
 *
 * - Límites de imágenes (MIN / MAX) y reportes por imagen
 * - Aprobación idempotente, rechazo, carrera approve vs reject
 * - Re-enrolamiento y desactivación (también sin provider)
 */

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "database/index_maintenance.hpp"
#include "database/sqlite_identity_store.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "enrollment/identity_lifecycle.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using namespace faceattend;
using namespace faceattend::testing_support;

class EnrollmentManagerTest : public ::testing::Test {
protected:
    EngineConfig config = make_config();
    SqliteIdentityStore store{":memory:", kDim, config.enrollment.min_images};
    RecordingAuditSink audit;
    ScriptedEmbeddingProvider provider;
    EmbeddingExecutor executor{provider, config.embedding};
    VectorIndex index{config.index};
    IndexMaintenance maintenance{index, store, audit, config.index};
    EnrollmentManager manager{store, executor, maintenance, audit, config.enrollment};

    void SetUp() override {
        maintenance.rebuild("test");
    }

    CandidateInfo candidate(const std::string& name, const std::string& external_id) {
        CandidateInfo c;
        c.name = name;
        c.external_id = external_id;
        c.email = "rrhh@example.org";
        return c;
    }

    RequestId submit(int axis, const std::string& external_id, int count = 3) {
        auto receipt = manager.submit_enrollment(candidate("persona-" + std::to_string(axis), external_id),
                                                 provider.person_images(axis, count));
        return receipt.request_id;
    }

    IdentityId approve(RequestId id) {
        auto outcome = manager.review_enrollment(id, ReviewDecision::approve("revisor"));
        return outcome.identity->id;
    }
};

// ==================== SUBMIT ====================

TEST_F(EnrollmentManagerTest, MinimumImagesCreatesSubmittedRequest) {
    auto receipt = manager.submit_enrollment(candidate("Ana", "E-1"), provider.person_images(0, 3));

    EXPECT_GT(receipt.request_id, 0);
    EXPECT_EQ(receipt.status, RequestStatus::Submitted);
    EXPECT_EQ(receipt.accepted_count, 3);
    ASSERT_EQ(receipt.reports.size(), 3u);
    EXPECT_EQ(receipt.reports[0].image_index, 1);
    EXPECT_TRUE(receipt.reports[2].accepted);

    auto request = store.get_request(receipt.request_id);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->embedding_count, 3);

    // Nada entra al índice antes de la aprobación
    EXPECT_EQ(index.size(), 0u);
    EXPECT_EQ(audit.count("enrollment.submitted"), 1);
}

TEST_F(EnrollmentManagerTest, ImageCountOutsideBoundsIsRejected) {
    EXPECT_THROW(manager.submit_enrollment(candidate("Ana", "E-1"), provider.person_images(0, 2)),
                 ValidationError);
    EXPECT_THROW(manager.submit_enrollment(candidate("Ana", "E-1"), provider.person_images(0, 11)),
                 ValidationError);

    auto receipt = manager.submit_enrollment(candidate("Ana", "E-1"), provider.person_images(0, 10));
    EXPECT_EQ(receipt.accepted_count, 10);

    EXPECT_EQ(store.list_requests(RequestStatus::Submitted).size(), 1u);
}

TEST_F(EnrollmentManagerTest, BlankNameIsRejectedWithoutEmbedding) {
    try {
        manager.submit_enrollment(candidate("   ", "E-1"), provider.person_images(0, 3));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_FALSE(e.details().empty());
        EXPECT_EQ(e.details().front(), "Name is required");
    }
    EXPECT_EQ(provider.call_count(), 0);
}

TEST_F(EnrollmentManagerTest, TooFewValidFacesCreatesNothing) {
    auto images = provider.person_images(1, 4);
    provider.set_failure(image_tag(1, 1), EmbeddingFailure::NoFaceDetected);
    provider.set_failure(image_tag(1, 3), EmbeddingFailure::MultipleFacesDetected);

    try {
        manager.submit_enrollment(candidate("Beto", "E-2"), images);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(e.details().size(), 2u);
        EXPECT_EQ(e.details()[0], "Image 2: no_face_detected");
        EXPECT_EQ(e.details()[1], "Image 4: multiple_faces_detected");
    }

    EXPECT_TRUE(store.list_requests(RequestStatus::Submitted).empty());
    EXPECT_FALSE(store.has_pending_request("E-2"));
}

TEST_F(EnrollmentManagerTest, FailedImagesAreReportedWhenEnoughRemain) {
    auto images = provider.person_images(2, 4);
    provider.set_failure(image_tag(2, 1), EmbeddingFailure::LowQuality);

    auto receipt = manager.submit_enrollment(candidate("Caro", "E-3"), images);
    EXPECT_EQ(receipt.accepted_count, 3);
    ASSERT_EQ(receipt.reports.size(), 4u);
    EXPECT_FALSE(receipt.reports[1].accepted);
    EXPECT_EQ(receipt.reports[1].reason, "low_quality");
    EXPECT_EQ(store.get_request(receipt.request_id)->embedding_count, 3);
}

TEST_F(EnrollmentManagerTest, SecondPendingRequestForSamePersonIsRejected) {
    submit(0, "E-1");
    EXPECT_THROW(submit(1, "E-1"), ValidationError);

    // Sin external_id no hay control de duplicados
    submit(2, "");
    submit(3, "");
    EXPECT_EQ(store.list_requests(RequestStatus::Submitted).size(), 3u);
}

// ==================== REVIEW ====================

TEST_F(EnrollmentManagerTest, ApprovalPromotesAndIndexes) {
    RequestId id = submit(0, "E-1");
    manager.begin_review(id);
    EXPECT_EQ(store.get_request(id)->status, RequestStatus::UnderReview);

    auto outcome = manager.review_enrollment(id, ReviewDecision::approve("revisor"));

    EXPECT_EQ(outcome.action, ReviewAction::Approve);
    ASSERT_TRUE(outcome.identity.has_value());
    EXPECT_TRUE(outcome.newly_promoted);
    EXPECT_TRUE(outcome.indexed);
    EXPECT_EQ(outcome.identity->status, IdentityStatus::Active);

    EXPECT_TRUE(index.contains(outcome.identity->id));
    EXPECT_EQ(index.size(), 3u);

    auto found = index.search(unit_vector(0), 1);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].identity_id, outcome.identity->id);

    EXPECT_EQ(audit.count("enrollment.under_review"), 1);
    EXPECT_EQ(audit.count("enrollment.approved"), 1);
}

TEST_F(EnrollmentManagerTest, ApproveTwiceReturnsSameIdentityWithoutDuplicates) {
    RequestId id = submit(0, "E-1");

    auto first = manager.review_enrollment(id, ReviewDecision::approve("a"));
    auto second = manager.review_enrollment(id, ReviewDecision::approve("b"));

    EXPECT_TRUE(first.newly_promoted);
    EXPECT_FALSE(second.newly_promoted);
    EXPECT_EQ(first.identity->id, second.identity->id);
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(store.count_identities(IdentityStatus::Active), 1u);
    EXPECT_EQ(audit.count("enrollment.approved"), 1);
}

TEST_F(EnrollmentManagerTest, RejectionIsFinal) {
    RequestId id = submit(0, "E-1");

    auto outcome = manager.review_enrollment(id, ReviewDecision::reject("foto de otra persona", "revisor"));
    EXPECT_EQ(outcome.action, ReviewAction::Reject);
    ASSERT_TRUE(outcome.rejection.has_value());
    EXPECT_EQ(outcome.rejection->reason, "foto de otra persona");
    EXPECT_FALSE(outcome.identity.has_value());

    EXPECT_THROW(manager.review_enrollment(id, ReviewDecision::approve("otro")), AlreadyFinalizedError);
    EXPECT_THROW(manager.begin_review(id), AlreadyFinalizedError);
    EXPECT_EQ(audit.count("enrollment.rejected"), 1);
    EXPECT_EQ(audit.count("enrollment.review_conflict"), 1);
    EXPECT_EQ(index.size(), 0u);

    // El candidato puede volver a enviar
    EXPECT_NO_THROW(submit(1, "E-1"));
}

TEST_F(EnrollmentManagerTest, ApprovedRequestCannotBeRejected) {
    RequestId id = submit(0, "E-1");
    approve(id);

    EXPECT_THROW(manager.review_enrollment(id, ReviewDecision::reject("tarde", "b")),
                 AlreadyFinalizedError);
    EXPECT_EQ(store.get_request(id)->status, RequestStatus::Approved);
}

TEST_F(EnrollmentManagerTest, ConcurrentApproveAndRejectHaveOneWinner) {
    constexpr int kRounds = 20;

    for (int round = 0; round < kRounds; ++round) {
        RequestId id = submit(round % 14, "R-" + std::to_string(round));

        std::atomic<int> wins{0};
        std::atomic<int> conflicts{0};

        auto attempt = [&](const ReviewDecision& decision) {
            try {
                manager.review_enrollment(id, decision);
                wins++;
            } catch (const AlreadyFinalizedError&) {
                conflicts++;
            }
        };

        std::thread approver(attempt, ReviewDecision::approve("a"));
        std::thread rejecter(attempt, ReviewDecision::reject("dup", "b"));
        approver.join();
        rejecter.join();

        EXPECT_EQ(wins.load(), 1) << "round " << round;
        EXPECT_EQ(conflicts.load(), 1) << "round " << round;

        auto request = store.get_request(id);
        ASSERT_TRUE(request.has_value());
        EXPECT_TRUE(is_terminal(request->status));
        if (request->status == RequestStatus::Rejected) {
            EXPECT_EQ(request->identity_id, -1);
        } else {
            EXPECT_TRUE(index.contains(request->identity_id));
        }
    }

    EXPECT_EQ(store.count_identities(IdentityStatus::Active),
              store.list_requests(RequestStatus::Approved).size());
}

TEST_F(EnrollmentManagerTest, ConcurrentApprovalsPromoteOnce) {
    RequestId id = submit(5, "E-5");

    IdentityId ids[2] = {-1, -1};
    bool fresh[2] = {false, false};
    std::thread t0([&]() {
        auto o = manager.review_enrollment(id, ReviewDecision::approve("a"));
        ids[0] = o.identity->id;
        fresh[0] = o.newly_promoted;
    });
    std::thread t1([&]() {
        auto o = manager.review_enrollment(id, ReviewDecision::approve("b"));
        ids[1] = o.identity->id;
        fresh[1] = o.newly_promoted;
    });
    t0.join();
    t1.join();

    EXPECT_EQ(ids[0], ids[1]);
    EXPECT_NE(fresh[0], fresh[1]);
    EXPECT_EQ(index.size(), 3u);
}

TEST_F(EnrollmentManagerTest, ApprovalBeforeFirstBuildMarksIndexDirty) {
    VectorIndex cold(config.index);
    IndexMaintenance cold_maintenance(cold, store, audit, config.index);
    EnrollmentManager cold_manager(store, executor, cold_maintenance, audit, config.enrollment);

    auto receipt = cold_manager.submit_enrollment(candidate("Ana", "E-1"), provider.person_images(0, 3));
    auto outcome = cold_manager.review_enrollment(receipt.request_id, ReviewDecision::approve("a"));

    EXPECT_TRUE(outcome.newly_promoted);
    EXPECT_FALSE(outcome.indexed);
    EXPECT_TRUE(cold_maintenance.is_dirty());

    cold_maintenance.rebuild("recover");
    EXPECT_FALSE(cold_maintenance.is_dirty());
    EXPECT_TRUE(cold.contains(outcome.identity->id));
}

// ==================== RE-ENROLLMENT / DEACTIVATION ====================

TEST_F(EnrollmentManagerTest, ReenrollmentSupersedesPreviousIdentity) {
    IdentityId old_id = approve(submit(0, "E-1"));
    ASSERT_TRUE(index.contains(old_id));

    RequestId again = submit(1, "E-1");
    auto outcome = manager.review_enrollment(again, ReviewDecision::approve("revisor"));

    EXPECT_EQ(outcome.superseded_id, old_id);
    EXPECT_FALSE(index.contains(old_id));
    EXPECT_TRUE(index.contains(outcome.identity->id));

    IdentityStatus status;
    ASSERT_TRUE(store.identity_status(old_id, status));
    EXPECT_EQ(status, IdentityStatus::Suspended);
    EXPECT_EQ(audit.count("identity.superseded"), 1);
}

TEST_F(EnrollmentManagerTest, DeactivationRemovesFromIndex) {
    IdentityId id = approve(submit(0, "E-1"));
    IdentityId other = approve(submit(1, "E-2"));

    EXPECT_TRUE(manager.deactivate_identity(id, "baja", "rrhh"));
    EXPECT_FALSE(index.contains(id));
    EXPECT_TRUE(index.contains(other));

    for (const auto& r : index.search(unit_vector(0), 5)) {
        EXPECT_NE(r.identity_id, id);
    }

    EXPECT_FALSE(manager.deactivate_identity(id, "otra vez"));
    EXPECT_EQ(audit.count("identity.deactivated"), 1);

    EXPECT_THROW(manager.deactivate_identity(9999, "x"), NotFoundError);
}

// ==================== LIFECYCLE SIN PROVIDER ====================

TEST(IdentityLifecycleTest, DeactivatesWithoutAnEmbeddingExecutor) {
    EngineConfig config = make_config();
    SqliteIdentityStore store(":memory:", kDim, config.enrollment.min_images);
    RecordingAuditSink audit;
    VectorIndex index(config.index);
    IndexMaintenance maintenance(index, store, audit, config.index);
    maintenance.rebuild("test");

    CandidateInfo c;
    c.name = "Ana";
    auto request = store.create_pending(c);
    for (int k = 0; k < 3; ++k) {
        store.attach_embedding(request.id, sample_vector(0, k), 0.9f);
    }
    Identity identity = store.promote(request.id, "revisor").identity;
    maintenance.insert_identity(identity);
    ASSERT_TRUE(index.contains(identity.id));

    IdentityLifecycle lifecycle(store, maintenance, audit);
    EXPECT_TRUE(lifecycle.deactivate_identity(identity.id, "faceattend_admin", "admin"));
    EXPECT_FALSE(index.contains(identity.id));

    IdentityStatus status;
    ASSERT_TRUE(store.identity_status(identity.id, status));
    EXPECT_EQ(status, IdentityStatus::Suspended);

    auto records = audit.all();
    auto deactivated = std::find_if(records.begin(), records.end(),
        [](const AuditRecord& r) { return r.action == "identity.deactivated"; });
    ASSERT_NE(deactivated, records.end());
    EXPECT_EQ(deactivated->subject_id, identity.id);
    EXPECT_EQ(deactivated->actor, "admin");
    EXPECT_EQ(deactivated->details, "faceattend_admin");

    EXPECT_FALSE(lifecycle.deactivate_identity(identity.id, "otra vez", "admin"));
    EXPECT_EQ(audit.count("identity.deactivated"), 1);
    EXPECT_THROW(lifecycle.deactivate_identity(9999, "x"), NotFoundError);
}
