// ============= tools/faceattend_admin.cpp =============
/*
 * Herramienta de administración sobre una base existente
 *
 * EJEMPLOS DE USO:
 *
 * ./build/bin/faceattend_admin --stats
 * ./faceattend_admin --config config.toml --pending
 * ./faceattend_admin --rebuild
 * ./faceattend_admin --deactivate 42
 * ./faceattend_admin --attendance 42
 * ./faceattend_admin --audit 20
 */

#include "core/config.hpp"
#include "core/logging.hpp"
#include "database/audit_log.hpp"
#include "database/index_maintenance.hpp"
#include "database/sqlite_identity_store.hpp"
#include "database/vector_index.hpp"
#include "enrollment/identity_lifecycle.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <iostream>
#include <string>

using namespace faceattend;

class AdminTool {
private:
    EngineConfig config;
    SqliteIdentityStore store;
    SqliteAuditLog audit;
    VectorIndex index;
    IndexMaintenance maintenance;
    IdentityLifecycle lifecycle;

public:
    explicit AdminTool(const EngineConfig& cfg)
        : config(cfg),
          store(cfg.storage.db_path, cfg.embedding.dimension, cfg.enrollment.min_images),
          audit(cfg.storage.audit_path),
          index(cfg.index),
          maintenance(index, store, audit, cfg.index),
          lifecycle(store, maintenance, audit)
    {
    }

    void show_statistics() {
        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Identidades activas:     " << store.count_identities(IdentityStatus::Active) << std::endl;
        std::cout << "Identidades suspendidas: " << store.count_identities(IdentityStatus::Suspended) << std::endl;
        std::cout << "Solicitudes pendientes:  "
                  << store.list_requests(RequestStatus::Submitted).size() +
                     store.list_requests(RequestStatus::UnderReview).size() << std::endl;
        std::cout << "Solicitudes aprobadas:   " << store.list_requests(RequestStatus::Approved).size() << std::endl;
        std::cout << "Solicitudes rechazadas:  " << store.list_requests(RequestStatus::Rejected).size() << std::endl;
        std::cout << "Eventos de auditoría:    " << audit.count_total() << std::endl;
        std::cout << "Auditorías perdidas:     " << audit.failed_writes() << std::endl;
        std::cout << "Métrica / agregación:    cosine / " << to_string(config.index.aggregation) << std::endl;
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    void show_pending() {
        std::cout << "\n" << std::setw(6) << "ID"
                  << std::setw(24) << "Nombre"
                  << std::setw(14) << "Ext. ID"
                  << std::setw(14) << "Status"
                  << std::setw(6) << "Emb"
                  << std::setw(22) << "Enviado"
                  << std::endl;
        std::cout << std::string(86, '-') << std::endl;

        for (auto status : {RequestStatus::Submitted, RequestStatus::UnderReview}) {
            for (const auto& r : store.list_requests(status)) {
                std::cout << std::setw(6) << r.id
                          << std::setw(24) << r.candidate.name
                          << std::setw(14) << r.candidate.external_id
                          << std::setw(14) << to_string(r.status)
                          << std::setw(6) << r.embedding_count
                          << std::setw(22) << format_timestamp(r.submitted_at)
                          << std::endl;
            }
        }
    }

    void rebuild() {
        auto stats = maintenance.rebuild("admin");
        index.print_stats();
        if (maintenance.save_snapshot()) {
            std::cout << "Snapshot: " << config.index.snapshot_path << std::endl;
        }
        std::cout << "Rebuild: " << stats.entry_count << " entradas, "
                  << stats.identity_count << " identidades, "
                  << stats.duration_ms << " ms" << std::endl;
    }

    void deactivate(IdentityId identity_id) {
        if (!lifecycle.deactivate_identity(identity_id, "faceattend_admin", "admin")) {
            std::cout << "Identity " << identity_id << " no estaba activa" << std::endl;
            return;
        }

        // El snapshot en disco no debe seguir apuntando a la identidad
        if (!config.index.snapshot_path.empty()) {
            maintenance.rebuild("deactivate");
            maintenance.save_snapshot();
        }

        std::cout << "Identity " << identity_id << " suspendida" << std::endl;
    }

    void show_attendance(IdentityId identity_id, int limit) {
        auto identity = store.get_identity(identity_id);
        if (!identity) {
            std::cout << "Identity " << identity_id << " no existe" << std::endl;
            return;
        }

        std::cout << "\n" << identity->name << " (" << to_string(identity->status) << ")\n" << std::endl;
        std::cout << std::setw(8) << "ID"
                  << std::setw(26) << "Timestamp"
                  << std::setw(6) << "Tipo"
                  << std::setw(8) << "Conf"
                  << "  Ubicación" << std::endl;
        std::cout << std::string(60, '-') << std::endl;

        for (const auto& e : store.list_attendance(identity_id, limit)) {
            std::cout << std::setw(8) << e.id
                      << std::setw(26) << format_timestamp(e.timestamp)
                      << std::setw(6) << to_string(e.check_type)
                      << std::setw(8) << std::fixed << std::setprecision(3) << e.confidence
                      << "  " << e.location << std::endl;
        }
    }

    void show_audit(int limit) {
        for (const auto& r : audit.recent(limit)) {
            std::cout << format_timestamp(r.timestamp) << "  "
                      << std::setw(26) << std::left << r.action << std::right
                      << std::setw(10) << r.subject_kind << ":" << std::setw(6) << std::left << r.subject_id
                      << std::right << "  " << r.actor << "  " << r.details;
            if (r.score >= 0) {
                std::cout << "  score=" << std::fixed << std::setprecision(3) << r.score;
            }
            std::cout << std::endl;
        }
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " [--config config.toml] [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Mostrar estadísticas generales\n";
    std::cout << "  --pending                   Listar solicitudes pendientes\n";
    std::cout << "  --rebuild                   Reconstruir índice (y snapshot)\n";
    std::cout << "  --deactivate ID             Suspender una identidad\n";
    std::cout << "  --attendance ID             Marcas de asistencia de una identidad\n";
    std::cout << "  --audit N                   Últimos N eventos de auditoría\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " --stats\n";
    std::cout << "  " << prog << " --config prod.toml --audit 50\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file = "config.toml";
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            config_file = argv[i + 1];
        }
    }

    try {
        ConfigFile file;
        if (!file.load(config_file)) {
            spdlog::warn("No se pudo cargar {}, usando valores por defecto", config_file);
        }
        EngineConfig config = EngineConfig::from_config(file);
        config.logging.file.clear();
        init_logging(config.logging);
        spdlog::set_level(spdlog::level::warn);

        AdminTool tool(config);

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--config" && i + 1 < argc) {
                ++i;
            }
            else if (arg == "--stats") {
                tool.show_statistics();
            }
            else if (arg == "--pending") {
                tool.show_pending();
            }
            else if (arg == "--rebuild") {
                tool.rebuild();
            }
            else if (arg == "--deactivate" && i + 1 < argc) {
                tool.deactivate(std::stoll(argv[++i]));
            }
            else if (arg == "--attendance" && i + 1 < argc) {
                tool.show_attendance(std::stoll(argv[++i]), 100);
            }
            else if (arg == "--audit" && i + 1 < argc) {
                tool.show_audit(std::stoi(argv[++i]));
            }
            else {
                print_usage(argv[0]);
                return 1;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
