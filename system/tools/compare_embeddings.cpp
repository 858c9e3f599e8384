// ============= compare_embeddings.cpp =============
/*
 * Compara los embeddings enrolados ENTRE identidades para encontrar
 * personas que el matcher podria confundir.
 *
 * Para cada par de identidades: distancia euclidiana minima entre
 * cualquier embedding de una y cualquiera de la otra. Los pares por
 * debajo de la tolerancia se marcan.
 *
 * USO:
 *   ./compare_embeddings faces/known
 *   ./compare_embeddings faces/known.db --sqlite --tolerance 0.70
 *   ./compare_embeddings faces/known --export pairs.csv
 */

#include "config.hpp"
#include "database/file_embedding_store.hpp"
#include "database/sqlite_embedding_store.hpp"
#include "recognition/matcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace facevault;

struct PairDistance {
    std::string a;
    std::string b;
    double min_distance;
};

class IdentityComparator {
private:
    double tolerance;
    bool verbose;

public:
    IdentityComparator(double tol, bool verb)
        : tolerance(tol), verbose(verb) {}

    // ✅ Mismo snapshot que ve el matcher (known/ o tabla enrollments)
    EmbeddingSnapshot load(const std::string& source, bool use_sqlite) {
        if (use_sqlite ? !fs::is_regular_file(source) : !fs::is_directory(source)) {
            throw std::runtime_error("❌ No existe: " + source);
        }

        std::unique_ptr<EmbeddingStore> store;
        if (use_sqlite) {
            store = std::make_unique<SqliteEmbeddingStore>(source);
        } else {
            store = std::make_unique<FileEmbeddingStore>(source);
        }
        return store->load_snapshot();
    }

    std::vector<PairDistance> compare(const EmbeddingSnapshot& snapshot) {
        auto start_time = std::chrono::steady_clock::now();
        std::vector<PairDistance> pairs;
        size_t total_comparisons = 0;

        for (size_t i = 0; i < snapshot.size(); i++) {
            for (size_t j = i + 1; j < snapshot.size(); j++) {
                double best = std::numeric_limits<double>::infinity();

                for (const auto& ea : snapshot[i].embeddings) {
                    for (const auto& eb : snapshot[j].embeddings) {
                        if (ea.size() != eb.size()) continue;
                        best = std::min(best, euclidean_distance(ea, eb));
                        total_comparisons++;
                    }
                }

                if (best == std::numeric_limits<double>::infinity()) continue;
                pairs.push_back({snapshot[i].name, snapshot[j].name, best});

                if (verbose) {
                    std::cout << "   " << snapshot[i].name << " ↔ " << snapshot[j].name
                              << "  d=" << std::fixed << std::setprecision(4) << best << "\n";
                }
            }
        }

        std::sort(pairs.begin(), pairs.end(),
                  [](const PairDistance& x, const PairDistance& y) { return x.min_distance < y.min_distance; });

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        std::cout << "✅ " << total_comparisons << " comparaciones en " << ms << " ms\n\n";
        return pairs;
    }

    void print_report(const EmbeddingSnapshot& snapshot, const std::vector<PairDistance>& pairs) {
        std::cout << "═══════════════════════════════════════════════════════════════\n";
        std::cout << "              SEPARACION ENTRE IDENTIDADES\n";
        std::cout << "═══════════════════════════════════════════════════════════════\n\n";

        size_t total = 0;
        for (const auto& identity : snapshot) total += identity.embeddings.size();
        std::cout << "Identidades: " << snapshot.size() << "  Embeddings: " << total
                  << "  Tolerancia: " << std::fixed << std::setprecision(2) << tolerance << "\n\n";

        std::cout << std::left << std::setw(24) << "Identidad A"
                  << std::setw(24) << "Identidad B"
                  << std::right << std::setw(12) << "Dist. min" << "\n";
        std::cout << std::string(64, '-') << "\n";

        int flagged = 0;
        for (const auto& p : pairs) {
            bool close = p.min_distance <= tolerance;
            if (close) flagged++;
            std::cout << std::left << std::setw(24) << p.a
                      << std::setw(24) << p.b
                      << std::right << std::setw(12) << std::setprecision(4) << p.min_distance
                      << (close ? "  ⚠️  confundible" : "") << "\n";
        }

        std::cout << "\nRESUMEN: " << flagged << " de " << pairs.size()
                  << " pares por debajo de la tolerancia\n";
        std::cout << "═══════════════════════════════════════════════════════════════\n\n";
    }

    bool export_csv(const std::vector<PairDistance>& pairs, const std::string& filename) {
        std::ofstream file(filename);
        if (!file) {
            std::cerr << "❌ No se pudo crear: " << filename << "\n";
            return false;
        }

        file << "identity_a,identity_b,min_distance,within_tolerance\n";
        for (const auto& p : pairs) {
            file << p.a << "," << p.b << ","
                 << std::setprecision(6) << p.min_distance << ","
                 << (p.min_distance <= tolerance ? 1 : 0) << "\n";
        }

        std::cout << "💾 Exportado a: " << filename << "\n\n";
        return true;
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <known_dir | known.db> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --sqlite           La ruta es una base SQLite (backend sqlite)\n";
    std::cout << "  --tolerance N      Distancia euclidiana maxima (default: 0.75)\n";
    std::cout << "  --verbose          Mostrar cada par calculado\n";
    std::cout << "  --export FILE      Exportar pares a CSV\n\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string source = argv[1];
    bool use_sqlite = false;
    double tolerance = Config::DEFAULT_TOLERANCE;
    bool verbose = false;
    std::string export_file;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--sqlite") {
            use_sqlite = true;
        }
        else if (arg == "--tolerance" && i + 1 < argc) {
            tolerance = std::stod(argv[++i]);
        }
        else if (arg == "--verbose") {
            verbose = true;
        }
        else if (arg == "--export" && i + 1 < argc) {
            export_file = argv[++i];
        }
    }

    spdlog::set_level(verbose ? spdlog::level::info : spdlog::level::warn);

    try {
        IdentityComparator comparator(tolerance, verbose);

        EmbeddingSnapshot snapshot = comparator.load(source, use_sqlite);
        if (snapshot.size() < 2) {
            std::cout << "⚠️  Se necesitan al menos 2 identidades enroladas\n";
            return 0;
        }

        auto pairs = comparator.compare(snapshot);
        comparator.print_report(snapshot, pairs);

        if (!export_file.empty() && !comparator.export_csv(pairs, export_file)) {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "❌ ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
