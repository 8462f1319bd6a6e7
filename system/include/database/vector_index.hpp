// ============= include/database/vector_index.hpp =============
/*
 * HNSW Vector Index - In-Memory Similarity Search
 *
 * ALGORITMO: Hierarchical Navigable Small World
 * - Complexity: O(log n) search time
 * - Memory: O(n * d * M) donde M = max connections
 * - Índices pequeños (<= exact_search_limit) se recorren completos
 *
 * MÉTRICA: cosine distance (1 - dot) sobre vectores normalizados
 *
 * CONCURRENCIA:
 * - HnswGraph: RW lock (búsquedas en paralelo, inserts serializados)
 * - VectorIndex: shared_ptr<HnswGraph> swappeado atómicamente en rebuild,
 *   búsquedas en curso terminan sobre el grafo anterior
 * - Un solo writer (insert / remove / rebuild) a la vez
 */

#pragma once
#include "core/config.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace faceattend {

// ==================== STRUCTS ====================

struct SearchResult {
    IdentityId identity_id = -1;
    float distance = 2.0f;             // Cosine distance (lower = better)
    float similarity = -1.0f;          // 1 - distance
};

struct IndexEntry {
    IdentityId identity_id = -1;
    Embedding vector;
};

// ==================== HNSW GRAPH ====================

class HnswGraph {
public:
    static constexpr int MAX_LAYERS = 10;

    HnswGraph(int dim, int M, int ef_construction, int ef_search, int exact_search_limit);

    // false si el vector ya existe para esa identidad
    bool add(IdentityId identity_id, const Embedding& vector);

    // Elimina todas las entradas de la identidad, devuelve cuántas
    size_t remove_identity(IdentityId identity_id);

    // Best entry per identity, up to k identities, ascending distance
    std::vector<SearchResult> search(const Embedding& query, int k) const;

    bool contains(IdentityId identity_id) const;
    size_t size() const;
    size_t identity_count() const;
    size_t memory_usage() const;
    int top_layer() const;
    int dimension() const { return dim; }

    std::vector<IndexEntry> entries() const;

private:
    struct Node {
        IdentityId identity_id = -1;
        Embedding vector;
        int layer = 0;
        std::vector<uint32_t> neighbors[MAX_LAYERS];  // Connections per layer
    };

    using Candidate = std::pair<float, uint32_t>;  // (distance, node)

    int dim;
    int M;
    int M0;
    int ef_construction;
    int ef_search;
    int exact_search_limit;
    int max_layer = 0;

    std::unordered_map<uint32_t, Node> nodes;
    std::unordered_map<IdentityId, std::vector<uint32_t>> by_identity;
    uint32_t next_node = 0;
    uint32_t entry_point = 0;
    bool has_entry = false;

    std::mt19937 gen{42};
    mutable std::shared_mutex mutex;

    float distance(const Embedding& a, const Embedding& b) const;
    int get_random_layer();

    std::vector<Candidate> search_layer(const Embedding& query, uint32_t entry_id,
                                        int layer, int ef) const;
    std::vector<uint32_t> select_neighbors(const Embedding& base,
                                           const std::vector<uint32_t>& candidates,
                                           int max_count) const;

    void remove_node(uint32_t node_id);
    void pick_entry_point();

    std::vector<SearchResult> collapse(const std::vector<Candidate>& candidates, int k) const;
};

// ==================== VECTOR INDEX ====================

class VectorIndex {
public:
    explicit VectorIndex(const IndexConfig& config);

    // ===== CORE OPERATIONS =====

    // Throws IndexUnavailableError until the first build/load
    std::vector<SearchResult> search(const Embedding& query, int k) const;

    // false si no hay índice construido o el vector ya estaba
    bool insert(IdentityId identity_id, const Embedding& vector);

    // Inserta las entradas de la identidad según la política de agregación
    size_t insert_identity(const Identity& identity);

    size_t remove(IdentityId identity_id);

    // ===== REBUILD =====

    size_t rebuild_from(const std::vector<Identity>& identities);

    // Snapshot is taken while holding the writer lock, so no insert is lost
    size_t rebuild_with(const std::function<std::vector<Identity>()>& snapshot);

    // ===== PERSISTENCE =====

    bool save(const std::string& filepath) const;
    bool load(const std::string& filepath);

    // ===== STATS =====

    bool is_ready() const;
    size_t size() const;
    size_t identity_count() const;
    bool contains(IdentityId identity_id) const;
    size_t memory_usage() const;
    void print_stats() const;

    const IndexConfig& settings() const { return config; }

private:
    IndexConfig config;

    std::shared_ptr<HnswGraph> graph;  // atomic_load / atomic_store
    std::mutex writer_mutex;

    std::shared_ptr<HnswGraph> current() const;
    std::shared_ptr<HnswGraph> make_graph() const;
    size_t swap_in(const std::vector<Identity>& identities);  // writer_mutex held
    std::vector<Embedding> vectors_for(const Identity& identity) const;
    size_t fill(HnswGraph& target, const Identity& identity) const;
};

} // namespace faceattend
