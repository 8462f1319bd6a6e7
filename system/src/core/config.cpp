// ============= src/core/config.cpp =============
#include "core/config.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace faceattend {

// ==================== PARSER ====================

std::string ConfigFile::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void ConfigFile::parse_line(std::string line, std::string& section) {
    line = trim(line);
    if (line.empty() || line[0] == '#') return;

    if (line[0] == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.length() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));

    if (val.size() >= 2 && val.front() == '"') {
        auto close = val.find('"', 1);
        if (close != std::string::npos) {
            val = val.substr(1, close - 1);
        }
    } else {
        // Comentario al final de la línea
        auto hash = val.find('#');
        if (hash != std::string::npos) {
            val = trim(val.substr(0, hash));
        }
    }

    std::string full_key = section.empty() ? key : section + "." + key;
    values[full_key] = val;
}

bool ConfigFile::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string line, section;
    while (std::getline(file, line)) {
        parse_line(line, section);
    }
    return true;
}

void ConfigFile::load_string(const std::string& text) {
    std::istringstream in(text);
    std::string line, section;
    while (std::getline(in, line)) {
        parse_line(line, section);
    }
}

bool ConfigFile::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string ConfigFile::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int ConfigFile::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::exception&) {
        spdlog::warn("Config {}: '{}' no es entero, usando {}", key, get(key), def);
        return def;
    }
}

float ConfigFile::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::exception&) {
        spdlog::warn("Config {}: '{}' no es float, usando {}", key, get(key), def);
        return def;
    }
}

bool ConfigFile::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    return v == "true" || v == "1";
}

// ==================== ENGINE CONFIG ====================

const char* to_string(Aggregation aggregation) {
    return aggregation == Aggregation::Centroid ? "centroid" : "per_sample";
}

void EngineConfig::validate() const {
    if (enrollment.min_images < 1) {
        throw ValidationError("enrollment.min_images must be >= 1");
    }
    if (enrollment.max_images < enrollment.min_images) {
        throw ValidationError("enrollment.max_images must be >= enrollment.min_images");
    }
    if (recognition.threshold <= 0.0f || recognition.threshold > 1.0f) {
        throw ValidationError("recognition.threshold must be in (0, 1]");
    }
    if (recognition.top_k < 1) {
        throw ValidationError("recognition.top_k must be >= 1");
    }
    if (recognition.ambiguity_margin < 0.0f) {
        throw ValidationError("recognition.ambiguity_margin must be >= 0");
    }
    if (embedding.dimension <= 0 || index.dimension != embedding.dimension) {
        throw ValidationError("embedding.dimension must be > 0 and match the index");
    }
    if (embedding.worker_threads < 1) {
        throw ValidationError("embedding.worker_threads must be >= 1");
    }
    if (index.M < 2 || index.ef_construction < 1 || index.ef_search < 1) {
        throw ValidationError("index.M / ef_construction / ef_search out of range");
    }
}

EngineConfig EngineConfig::from_config(const ConfigFile& file) {
    EngineConfig c;

    c.enrollment.min_images = file.get_int("enrollment.min_images", c.enrollment.min_images);
    c.enrollment.max_images = file.get_int("enrollment.max_images", c.enrollment.max_images);

    c.recognition.threshold = file.get_float("recognition.threshold", c.recognition.threshold);
    c.recognition.top_k = file.get_int("recognition.top_k", c.recognition.top_k);
    c.recognition.ambiguity_margin = file.get_float("recognition.ambiguity_margin",
                                                    c.recognition.ambiguity_margin);
    c.recognition.dedupe_per_day = file.get_bool("attendance.dedupe_per_day",
                                                 c.recognition.dedupe_per_day);

    c.quality.enabled = file.get_bool("quality.enabled", c.quality.enabled);
    c.quality.threshold = file.get_float("quality.threshold", c.quality.threshold);

    c.embedding.dimension = file.get_int("embedding.dimension", c.embedding.dimension);
    c.embedding.timeout_ms = file.get_int("embedding.timeout_ms", c.embedding.timeout_ms);
    c.embedding.worker_threads = file.get_int("embedding.worker_threads", c.embedding.worker_threads);

    c.index.dimension = c.embedding.dimension;
    c.index.M = file.get_int("index.M", c.index.M);
    c.index.ef_construction = file.get_int("index.ef_construction", c.index.ef_construction);
    c.index.ef_search = file.get_int("index.ef_search", c.index.ef_search);
    c.index.exact_search_limit = file.get_int("index.exact_search_limit", c.index.exact_search_limit);
    c.index.rebuild_interval_sec = file.get_int("index.rebuild_interval_sec", c.index.rebuild_interval_sec);
    c.index.snapshot_path = file.get("index.snapshot_path", c.index.snapshot_path);

    std::string aggregation = file.get("recognition.aggregation", "per_sample");
    if (aggregation == "centroid") {
        c.index.aggregation = Aggregation::Centroid;
    } else if (aggregation == "per_sample") {
        c.index.aggregation = Aggregation::PerSample;
    } else {
        throw ValidationError("recognition.aggregation must be per_sample or centroid");
    }

    c.storage.db_path = file.get("database.path", c.storage.db_path);
    c.storage.audit_path = file.get("audit.path", c.storage.audit_path);

    c.logging.level = file.get("logging.level", c.logging.level);
    c.logging.file = file.get("logging.file", c.logging.file);

    c.validate();
    return c;
}

EngineConfig EngineConfig::from_file(const std::string& filename) {
    ConfigFile file;
    if (!file.load(filename)) {
        throw ValidationError("No se pudo cargar " + filename);
    }
    return from_config(file);
}

} // namespace faceattend
