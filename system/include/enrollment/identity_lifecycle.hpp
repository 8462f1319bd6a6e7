// ============= include/enrollment/identity_lifecycle.hpp =============
/*
 * Baja de identidades (active -> suspended)
 *
 * Compartido por EnrollmentManager y faceattend_admin:
 *   store.deactivate + remove del índice + audit "identity.deactivated"
 * No necesita embedding provider.
 */

#pragma once
#include "core/types.hpp"
#include "database/audit_log.hpp"
#include "database/identity_store.hpp"
#include "database/index_maintenance.hpp"
#include <string>

namespace faceattend {

class IdentityLifecycle {
public:
    IdentityLifecycle(IdentityStore& store, IndexMaintenance& maintenance, AuditSink& audit);

    // false si ya estaba suspendida; NotFoundError si no existe
    bool deactivate_identity(IdentityId identity_id,
                             const std::string& reason,
                             const std::string& actor = "system");

private:
    IdentityStore& store;
    IndexMaintenance& maintenance;
    AuditSink& audit;
};

} // namespace faceattend
