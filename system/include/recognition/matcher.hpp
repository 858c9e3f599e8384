// ============= include/recognition/matcher.hpp =============
/*
 * Matcher - busqueda exhaustiva sobre el snapshot
 *
 * - Distancia euclidiana entre embeddings (no normalizada, no acotada)
 * - Por identidad: minimo sobre todos sus embeddings
 * - Global: minimo sobre todas las identidades; empate -> la primera en el snapshot
 * - matched = snapshot no vacio && distancia_min <= tolerance
 *
 * La tolerancia (0.75 por defecto) se compara literalmente contra la distancia
 * euclidiana; no es una probabilidad.
 */

#pragma once
#include "core/types.hpp"
#include "database/embedding_store.hpp"

namespace facevault {

double euclidean_distance(const Embedding& a, const Embedding& b);

MatchResult match_embedding(const Embedding& probe,
                            const EmbeddingSnapshot& snapshot,
                            double tolerance);

}  // namespace facevault
