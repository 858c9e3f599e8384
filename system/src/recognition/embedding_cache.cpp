#include "recognition/embedding_cache.hpp"
#include "recognition/matcher.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace facevault {

EmbeddingCache::EmbeddingCache(EmbeddingStore& store)
    : store(store)
{
}

// Requiere unique_lock tomado
std::shared_ptr<const EmbeddingSnapshot> EmbeddingCache::reload_locked() {
    // La generacion se lee antes de cargar: una mutacion concurrente
    // deja el snapshot marcado como viejo y se recarga en la siguiente consulta
    uint64_t gen = store.generation();
    auto snap = std::make_shared<const EmbeddingSnapshot>(store.load_snapshot());

    size_t total = 0;
    for (const auto& identity : *snap) total += identity.embeddings.size();

    current = snap;
    loaded_generation = gen;
    loaded = true;

    spdlog::info("✓ Embedding cache cargado: {} identidades, {} embeddings (gen {})",
                 snap->size(), total, gen);
    return snap;
}

std::shared_ptr<const EmbeddingSnapshot> EmbeddingCache::snapshot() {
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        if (loaded && loaded_generation == store.generation()) {
            return current;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    if (loaded && loaded_generation == store.generation()) {
        return current;
    }
    return reload_locked();
}

std::shared_ptr<const EmbeddingSnapshot> EmbeddingCache::reload() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return reload_locked();
}

void EmbeddingCache::invalidate() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    loaded = false;
    spdlog::debug("Embedding cache invalidado");
}

MatchResult EmbeddingCache::match(const Embedding& probe, double tolerance) {
    auto snap = snapshot();
    return match_embedding(probe, *snap, tolerance);
}

size_t EmbeddingCache::identity_count() {
    return snapshot()->size();
}

}  // namespace facevault
