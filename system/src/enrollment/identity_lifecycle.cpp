// ============= src/enrollment/identity_lifecycle.cpp =============
#include "enrollment/identity_lifecycle.hpp"
#include <spdlog/spdlog.h>

namespace faceattend {

IdentityLifecycle::IdentityLifecycle(IdentityStore& store,
                                     IndexMaintenance& maintenance,
                                     AuditSink& audit)
    : store(store), maintenance(maintenance), audit(audit)
{
}

bool IdentityLifecycle::deactivate_identity(IdentityId identity_id,
                                            const std::string& reason,
                                            const std::string& actor) {
    bool changed = store.deactivate(identity_id);

    // También si ya estaba suspendida: limpia un remove anterior fallido
    maintenance.remove_identity(identity_id);

    if (changed) {
        AuditRecord entry;
        entry.action = "identity.deactivated";
        entry.subject_kind = "identity";
        entry.subject_id = identity_id;
        entry.actor = actor.empty() ? "system" : actor;
        entry.details = reason.empty() ? "-" : reason;
        audit.record(entry);

        spdlog::info("🚫 Identity {} desactivada: {}", identity_id, entry.details);
    }
    return changed;
}

} // namespace faceattend
