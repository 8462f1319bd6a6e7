// ============= include/core/config.hpp =============
/*
 * Configuración del motor (archivo TOML simple)
 *
 * FORMATO:
 *   [recognition]
 *   threshold = 0.6
 *   aggregation = "per_sample"
 *
 * Las claves se leen como "seccion.clave". Valores sin comillas o
 * entre comillas dobles, comentarios con '#'.
 */

#pragma once
#include <map>
#include <string>

namespace faceattend {

// ==================== CONFIG FILE ====================

class ConfigFile {
public:
    bool load(const std::string& filename);
    void load_string(const std::string& text);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value) { values[key] = value; }

private:
    std::map<std::string, std::string> values;

    void parse_line(std::string line, std::string& section);
    static std::string trim(const std::string& s);
};

// ==================== ENGINE CONFIG ====================

enum class Aggregation {
    PerSample,   // una entrada por embedding aceptado
    Centroid     // un vector promedio por identidad
};

const char* to_string(Aggregation aggregation);

struct EnrollmentConfig {
    int min_images = 3;
    int max_images = 10;
};

struct RecognitionConfig {
    float threshold = 0.6f;
    int top_k = 3;
    float ambiguity_margin = 0.02f;
    bool dedupe_per_day = true;
};

struct QualityConfig {
    bool enabled = true;
    float threshold = 0.4f;
};

struct EmbeddingConfig {
    int dimension = 512;
    int timeout_ms = 5000;
    int worker_threads = 4;
};

struct IndexConfig {
    int dimension = 512;
    int M = 16;
    int ef_construction = 200;
    int ef_search = 64;
    int exact_search_limit = 256;
    Aggregation aggregation = Aggregation::PerSample;
    int rebuild_interval_sec = 300;
    std::string snapshot_path;
};

struct StorageConfig {
    std::string db_path = "database/attendance.db";
    std::string audit_path = "database/audit.db";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct EngineConfig {
    EnrollmentConfig enrollment;
    RecognitionConfig recognition;
    QualityConfig quality;
    EmbeddingConfig embedding;
    IndexConfig index;
    StorageConfig storage;
    LoggingConfig logging;

    // Throws ValidationError when the values cannot work together
    void validate() const;

    static EngineConfig from_config(const ConfigFile& file);
    static EngineConfig from_file(const std::string& filename);
};

} // namespace faceattend
