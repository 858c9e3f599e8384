// ============= include/recognition/embedding_cache.hpp =============
/*
 * Embedding Cache - snapshot en memoria de las identidades enroladas
 *
 * CARACTERÍSTICAS:
 * - Carga perezosa: el primer match() lee el store completo
 * - Recarga automatica cuando la generacion del store cambia
 *   (enroll / delete_enrollment / delete_identity)
 * - Thread-safe: lecturas concurrentes con shared_lock, recarga con unique_lock
 * - El snapshot es inmutable (shared_ptr<const>); un match en curso no ve
 *   una recarga a medias
 */

#pragma once
#include "core/types.hpp"
#include "database/embedding_store.hpp"
#include <cstdint>
#include <memory>
#include <shared_mutex>

namespace facevault {

class EmbeddingCache {
public:
    explicit EmbeddingCache(EmbeddingStore& store);

    MatchResult match(const Embedding& probe, double tolerance);

    // Fuerza la lectura del store en la proxima consulta
    void invalidate();

    // Lee el store ahora y devuelve el nuevo snapshot
    std::shared_ptr<const EmbeddingSnapshot> reload();

    // Snapshot vigente (recarga si esta desactualizado)
    std::shared_ptr<const EmbeddingSnapshot> snapshot();

    size_t identity_count();

private:
    EmbeddingStore& store;

    mutable std::shared_mutex mutex;
    std::shared_ptr<const EmbeddingSnapshot> current;
    uint64_t loaded_generation = 0;
    bool loaded = false;

    std::shared_ptr<const EmbeddingSnapshot> reload_locked();
};

}  // namespace facevault
