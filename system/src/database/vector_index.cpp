// ============= src/database/vector_index.cpp =============
#include "database/vector_index.hpp"
#include "core/embedding_math.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <queue>
#include <unordered_set>

namespace faceattend {

namespace {

constexpr char SNAPSHOT_MAGIC[4] = {'F', 'A', 'I', 'X'};
constexpr uint32_t SNAPSHOT_VERSION = 1;
constexpr float TIE_EPSILON = 1e-6f;

} // namespace

// ==================== HNSW GRAPH ====================

HnswGraph::HnswGraph(int dim, int M, int ef_construction, int ef_search, int exact_search_limit)
    : dim(dim), M(M), M0(M * 2), ef_construction(ef_construction),
      ef_search(ef_search), exact_search_limit(exact_search_limit)
{
}

float HnswGraph::distance(const Embedding& a, const Embedding& b) const {
    return cosine_distance(a, b);
}

int HnswGraph::get_random_layer() {
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    double r = 1.0 - dis(gen);  // (0, 1]
    double ml = 1.0 / std::log(static_cast<double>(std::max(M, 2)));
    int layer = static_cast<int>(-std::log(r) * ml);
    return std::min(layer, MAX_LAYERS - 1);
}

// ==================== INSERT ====================

bool HnswGraph::add(IdentityId identity_id, const Embedding& vector) {
    if (static_cast<int>(vector.size()) != dim) {
        throw ValidationError("Embedding dimension " + std::to_string(vector.size()) +
                              " != index dimension " + std::to_string(dim));
    }

    std::unique_lock<std::shared_mutex> lock(mutex);

    auto existing = by_identity.find(identity_id);
    if (existing != by_identity.end()) {
        for (uint32_t nid : existing->second) {
            if (nodes.at(nid).vector == vector) {
                return false;
            }
        }
    }

    uint32_t id = next_node++;
    Node entry;
    entry.identity_id = identity_id;
    entry.vector = vector;
    entry.layer = get_random_layer();

    // First insertion
    if (!has_entry) {
        max_layer = entry.layer;
        entry_point = id;
        has_entry = true;
        nodes.emplace(id, std::move(entry));
        by_identity[identity_id].push_back(id);
        return true;
    }

    // Greedy descent through the upper layers
    uint32_t current = entry_point;
    for (int lc = max_layer; lc > entry.layer; --lc) {
        auto candidates = search_layer(vector, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0].second;
        }
    }

    for (int lc = std::min(entry.layer, max_layer); lc >= 0; --lc) {
        auto candidates = search_layer(vector, current, lc, ef_construction);

        std::vector<uint32_t> ids;
        ids.reserve(candidates.size());
        for (const auto& c : candidates) ids.push_back(c.second);

        int M_cur = (lc == 0) ? M0 : M;
        entry.neighbors[lc] = select_neighbors(vector, ids, M_cur);

        if (!candidates.empty()) {
            current = candidates[0].second;
        }
    }

    int layer = entry.layer;
    auto& stored = nodes.emplace(id, std::move(entry)).first->second;
    by_identity[identity_id].push_back(id);

    // Bidirectional connections
    for (int lc = std::min(layer, max_layer); lc >= 0; --lc) {
        int M_cur = (lc == 0) ? M0 : M;
        for (uint32_t neighbor_id : stored.neighbors[lc]) {
            auto& nb = nodes.at(neighbor_id);
            nb.neighbors[lc].push_back(id);
            if (static_cast<int>(nb.neighbors[lc].size()) > M_cur) {
                nb.neighbors[lc] = select_neighbors(nb.vector, nb.neighbors[lc], M_cur);
            }
        }
    }

    if (layer > max_layer) {
        max_layer = layer;
        entry_point = id;
    }

    return true;
}

// ==================== SEARCH ====================

std::vector<SearchResult> HnswGraph::search(const Embedding& query, int k) const {
    if (static_cast<int>(query.size()) != dim) {
        throw ValidationError("Query dimension " + std::to_string(query.size()) +
                              " != index dimension " + std::to_string(dim));
    }

    std::shared_lock<std::shared_mutex> lock(mutex);

    if (nodes.empty() || k <= 0) {
        return {};
    }

    std::vector<Candidate> candidates;

    if (static_cast<int>(nodes.size()) <= exact_search_limit) {
        // Exhaustivo
        candidates.reserve(nodes.size());
        for (const auto& [nid, node] : nodes) {
            candidates.push_back({distance(query, node.vector), nid});
        }
    } else {
        uint32_t current = entry_point;
        for (int lc = max_layer; lc > 0; --lc) {
            auto found = search_layer(query, current, lc, 1);
            if (!found.empty()) {
                current = found[0].second;
            }
        }
        candidates = search_layer(query, current, 0, std::max(ef_search, k));
    }

    return collapse(candidates, k);
}

std::vector<SearchResult> HnswGraph::collapse(const std::vector<Candidate>& candidates, int k) const {
    std::unordered_map<IdentityId, float> best;
    for (const auto& [d, nid] : candidates) {
        IdentityId identity = nodes.at(nid).identity_id;
        auto it = best.find(identity);
        if (it == best.end() || d < it->second) {
            best[identity] = d;
        }
    }

    std::vector<SearchResult> results;
    results.reserve(best.size());
    for (const auto& [identity, d] : best) {
        results.push_back({identity, d, 1.0f - d});
    }

    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.identity_id < b.identity_id;
    });

    // Distancias casi iguales: gana el id menor
    for (size_t i = 1; i < results.size(); ++i) {
        size_t j = i;
        while (j > 0 &&
               std::fabs(results[j].distance - results[j - 1].distance) <= TIE_EPSILON &&
               results[j].identity_id < results[j - 1].identity_id) {
            std::swap(results[j], results[j - 1]);
            --j;
        }
    }

    if (static_cast<int>(results.size()) > k) {
        results.resize(k);
    }
    return results;
}

// ==================== SEARCH LAYER ====================

std::vector<HnswGraph::Candidate> HnswGraph::search_layer(
    const Embedding& query,
    uint32_t entry_id,
    int layer,
    int ef) const
{
    std::unordered_set<uint32_t> visited;

    auto cmp = [](const Candidate& a, const Candidate& b) { return a.first > b.first; };

    std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp)> candidates(cmp);
    std::priority_queue<Candidate> w;  // Max heap

    float d = distance(query, nodes.at(entry_id).vector);
    candidates.push({d, entry_id});
    w.push({d, entry_id});
    visited.insert(entry_id);

    while (!candidates.empty()) {
        auto [current_dist, current_id] = candidates.top();
        candidates.pop();

        if (current_dist > w.top().first) {
            break;
        }

        for (uint32_t neighbor_id : nodes.at(current_id).neighbors[layer]) {
            if (!visited.insert(neighbor_id).second) {
                continue;
            }

            float d_neighbor = distance(query, nodes.at(neighbor_id).vector);

            if (d_neighbor < w.top().first || static_cast<int>(w.size()) < ef) {
                candidates.push({d_neighbor, neighbor_id});
                w.push({d_neighbor, neighbor_id});

                if (static_cast<int>(w.size()) > ef) {
                    w.pop();
                }
            }
        }
    }

    std::vector<Candidate> results;
    results.reserve(w.size());
    while (!w.empty()) {
        results.push_back(w.top());
        w.pop();
    }

    std::reverse(results.begin(), results.end());
    return results;
}

// ==================== SELECT NEIGHBORS ====================

std::vector<uint32_t> HnswGraph::select_neighbors(
    const Embedding& base,
    const std::vector<uint32_t>& candidates,
    int max_count) const
{
    if (static_cast<int>(candidates.size()) <= max_count) {
        return candidates;
    }

    // Keep the M closest
    std::vector<Candidate> scored;
    scored.reserve(candidates.size());
    for (uint32_t id : candidates) {
        scored.push_back({distance(base, nodes.at(id).vector), id});
    }

    std::sort(scored.begin(), scored.end());

    std::vector<uint32_t> selected;
    for (int i = 0; i < max_count && i < static_cast<int>(scored.size()); ++i) {
        selected.push_back(scored[i].second);
    }

    return selected;
}

// ==================== REMOVE ====================

void HnswGraph::remove_node(uint32_t node_id) {
    const Node& removed = nodes.at(node_id);

    for (int lc = 0; lc <= removed.layer; ++lc) {
        int M_cur = (lc == 0) ? M0 : M;
        const auto& orphaned = removed.neighbors[lc];

        for (auto& [other_id, other] : nodes) {
            if (other_id == node_id || other.layer < lc) continue;

            auto& links = other.neighbors[lc];
            auto it = std::find(links.begin(), links.end(), node_id);
            if (it == links.end()) continue;
            links.erase(it);

            // Reconectar con los vecinos del nodo eliminado
            std::vector<uint32_t> pool = links;
            for (uint32_t candidate : orphaned) {
                if (candidate == other_id || candidate == node_id) continue;
                if (std::find(pool.begin(), pool.end(), candidate) == pool.end()) {
                    pool.push_back(candidate);
                }
            }
            links = select_neighbors(other.vector, pool, M_cur);
        }
    }

    nodes.erase(node_id);
}

void HnswGraph::pick_entry_point() {
    if (nodes.empty()) {
        has_entry = false;
        entry_point = 0;
        max_layer = 0;
        return;
    }

    bool first = true;
    for (const auto& [nid, node] : nodes) {
        if (first || node.layer > max_layer ||
            (node.layer == max_layer && nid < entry_point)) {
            max_layer = node.layer;
            entry_point = nid;
            first = false;
        }
    }
    has_entry = true;
}

size_t HnswGraph::remove_identity(IdentityId identity_id) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = by_identity.find(identity_id);
    if (it == by_identity.end()) {
        return 0;
    }

    std::vector<uint32_t> node_ids = std::move(it->second);
    by_identity.erase(it);

    bool entry_removed = false;
    for (uint32_t nid : node_ids) {
        if (has_entry && nid == entry_point) entry_removed = true;
        remove_node(nid);
    }

    if (entry_removed || nodes.empty()) {
        pick_entry_point();
    }

    return node_ids.size();
}

// ==================== STATS ====================

bool HnswGraph::contains(IdentityId identity_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return by_identity.find(identity_id) != by_identity.end();
}

size_t HnswGraph::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return nodes.size();
}

size_t HnswGraph::identity_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return by_identity.size();
}

int HnswGraph::top_layer() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return max_layer;
}

size_t HnswGraph::memory_usage() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    size_t total = 0;
    for (const auto& [nid, node] : nodes) {
        total += sizeof(Node);
        total += node.vector.size() * sizeof(float);
        for (int i = 0; i <= node.layer; ++i) {
            total += node.neighbors[i].size() * sizeof(uint32_t);
        }
    }

    return total;
}

std::vector<IndexEntry> HnswGraph::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<uint32_t> ids;
    ids.reserve(nodes.size());
    for (const auto& [nid, node] : nodes) ids.push_back(nid);
    std::sort(ids.begin(), ids.end());

    std::vector<IndexEntry> out;
    out.reserve(ids.size());
    for (uint32_t nid : ids) {
        const auto& node = nodes.at(nid);
        out.push_back({node.identity_id, node.vector});
    }
    return out;
}

// ==================== VECTOR INDEX ====================

VectorIndex::VectorIndex(const IndexConfig& config)
    : config(config)
{
    spdlog::info("🔍 Inicializando HNSW Vector Index");
    spdlog::info("   Dimensión: {}", config.dimension);
    spdlog::info("   M: {}", config.M);
    spdlog::info("   ef_construction: {} | ef_search: {}", config.ef_construction, config.ef_search);
    spdlog::info("   Agregación: {}", to_string(config.aggregation));
}

std::shared_ptr<HnswGraph> VectorIndex::current() const {
    return std::atomic_load(&graph);
}

std::shared_ptr<HnswGraph> VectorIndex::make_graph() const {
    return std::make_shared<HnswGraph>(config.dimension, config.M, config.ef_construction,
                                       config.ef_search, config.exact_search_limit);
}

std::vector<Embedding> VectorIndex::vectors_for(const Identity& identity) const {
    std::vector<Embedding> valid;
    for (const auto& e : identity.embeddings) {
        if (static_cast<int>(e.size()) != config.dimension || !is_finite(e)) {
            spdlog::warn("Identity {}: embedding inválido ignorado (dim {})", identity.id, e.size());
            continue;
        }
        valid.push_back(l2_normalized(e));
    }

    if (config.aggregation == Aggregation::Centroid && !valid.empty()) {
        return {centroid(valid)};
    }
    return valid;
}

size_t VectorIndex::fill(HnswGraph& target, const Identity& identity) const {
    size_t added = 0;
    for (const auto& v : vectors_for(identity)) {
        if (target.add(identity.id, v)) {
            added++;
        }
    }
    return added;
}

// ==================== CORE OPERATIONS ====================

std::vector<SearchResult> VectorIndex::search(const Embedding& query, int k) const {
    auto g = current();
    if (!g) {
        throw IndexUnavailableError("Vector index has not been built yet");
    }
    return g->search(l2_normalized(query), k);
}

bool VectorIndex::insert(IdentityId identity_id, const Embedding& vector) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto g = current();
    if (!g) {
        return false;
    }
    return g->add(identity_id, l2_normalized(vector));
}

size_t VectorIndex::insert_identity(const Identity& identity) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto g = current();
    if (!g) {
        return 0;
    }

    if (config.aggregation == Aggregation::Centroid && g->contains(identity.id)) {
        return 0;
    }
    return fill(*g, identity);
}

size_t VectorIndex::remove(IdentityId identity_id) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto g = current();
    if (!g) {
        return 0;
    }
    return g->remove_identity(identity_id);
}

// ==================== REBUILD ====================

size_t VectorIndex::swap_in(const std::vector<Identity>& identities) {
    auto fresh = make_graph();
    for (const auto& identity : identities) {
        fill(*fresh, identity);
    }

    size_t count = fresh->size();
    std::atomic_store(&graph, fresh);
    return count;
}

size_t VectorIndex::rebuild_from(const std::vector<Identity>& identities) {
    std::lock_guard<std::mutex> lock(writer_mutex);
    return swap_in(identities);
}

size_t VectorIndex::rebuild_with(const std::function<std::vector<Identity>()>& snapshot) {
    std::lock_guard<std::mutex> lock(writer_mutex);
    return swap_in(snapshot());
}

// ==================== PERSISTENCE ====================

bool VectorIndex::save(const std::string& filepath) const {
    auto g = current();
    if (!g) {
        spdlog::warn("Índice no construido, nada que guardar");
        return false;
    }

    auto all = g->entries();
    std::string tmp = filepath + ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            spdlog::error("No se pudo abrir {}", tmp);
            return false;
        }

        int32_t dim = config.dimension;
        uint64_t count = all.size();
        ofs.write(SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC));
        ofs.write(reinterpret_cast<const char*>(&SNAPSHOT_VERSION), sizeof(SNAPSHOT_VERSION));
        ofs.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
        ofs.write(reinterpret_cast<const char*>(&count), sizeof(count));

        for (const auto& entry : all) {
            int64_t id = entry.identity_id;
            ofs.write(reinterpret_cast<const char*>(&id), sizeof(id));
            ofs.write(reinterpret_cast<const char*>(entry.vector.data()),
                      entry.vector.size() * sizeof(float));
        }

        if (!ofs.good()) {
            spdlog::error("Error escribiendo snapshot {}", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, filepath, ec);
    if (ec) {
        spdlog::error("No se pudo renombrar snapshot: {}", ec.message());
        return false;
    }

    spdlog::info("✓ Saved index to {} ({} entries)", filepath, all.size());
    return true;
}

bool VectorIndex::load(const std::string& filepath) {
    std::ifstream ifs(filepath, std::ios::binary);
    if (!ifs) return false;

    char magic[4];
    uint32_t version = 0;
    int32_t loaded_dim = 0;
    uint64_t count = 0;
    ifs.read(magic, sizeof(magic));
    ifs.read(reinterpret_cast<char*>(&version), sizeof(version));
    ifs.read(reinterpret_cast<char*>(&loaded_dim), sizeof(loaded_dim));
    ifs.read(reinterpret_cast<char*>(&count), sizeof(count));

    if (!ifs || std::memcmp(magic, SNAPSHOT_MAGIC, sizeof(magic)) != 0 ||
        version != SNAPSHOT_VERSION) {
        spdlog::error("Snapshot inválido: {}", filepath);
        return false;
    }

    if (loaded_dim != config.dimension) {
        spdlog::error("Dimension mismatch: {} vs {}", loaded_dim, config.dimension);
        return false;
    }

    auto fresh = make_graph();
    for (uint64_t i = 0; i < count; ++i) {
        int64_t id = 0;
        Embedding vec(config.dimension);
        ifs.read(reinterpret_cast<char*>(&id), sizeof(id));
        ifs.read(reinterpret_cast<char*>(vec.data()), config.dimension * sizeof(float));

        if (!ifs) {
            spdlog::error("Snapshot truncado en entrada {} de {}", i, count);
            return false;
        }
        fresh->add(id, vec);
    }

    std::lock_guard<std::mutex> lock(writer_mutex);
    std::atomic_store(&graph, fresh);

    spdlog::info("✓ Loaded {} vectors from {}", count, filepath);
    return true;
}

// ==================== STATS ====================

bool VectorIndex::is_ready() const {
    return current() != nullptr;
}

size_t VectorIndex::size() const {
    auto g = current();
    return g ? g->size() : 0;
}

size_t VectorIndex::identity_count() const {
    auto g = current();
    return g ? g->identity_count() : 0;
}

bool VectorIndex::contains(IdentityId identity_id) const {
    auto g = current();
    return g && g->contains(identity_id);
}

size_t VectorIndex::memory_usage() const {
    auto g = current();
    return g ? g->memory_usage() : 0;
}

void VectorIndex::print_stats() const {
    auto g = current();
    spdlog::info("=== HNSW Index Stats ===");
    if (!g) {
        spdlog::info("  (no construido)");
        return;
    }
    spdlog::info("  Entries: {}", g->size());
    spdlog::info("  Identities: {}", g->identity_count());
    spdlog::info("  Memory: {:.2f} MB", g->memory_usage() / 1024.0 / 1024.0);
    spdlog::info("  Max layer: {}", g->top_layer());
}

} // namespace faceattend
