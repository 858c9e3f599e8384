// ============= main.cpp - FACEVAULT CLI =============
#include "config.hpp"
#include "utils.hpp"
#include "core/errors.hpp"
#include "detection/sface_detector.hpp"
#include "detection/lazy_detector.hpp"
#include "database/file_embedding_store.hpp"
#include "database/sqlite_embedding_store.hpp"
#include "database/unknown_face_store.hpp"
#include "database/event_store.hpp"
#include "database/settings_store.hpp"
#include "recognition/embedding_cache.hpp"
#include "recognition/pipeline.hpp"
#include "recognition/curation.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace facevault;

namespace {

void print_usage(const char* prog) {
    std::cout << "Uso: " << prog << " [--config config.toml] <comando> [args]\n\n"
              << "Identidades:\n"
              << "  enroll <nombre> <imagen>\n"
              << "  recognize <imagen>\n"
              << "  identities\n"
              << "  enrollments <nombre>\n"
              << "  delete-identity <nombre>\n"
              << "  delete-enrollment <nombre> <imagen_ref>\n"
              << "  export-enrollment <nombre> <imagen_ref> <salida>\n\n"
              << "Rostros desconocidos:\n"
              << "  unknown list\n"
              << "  unknown add <imagen>\n"
              << "  unknown name <id> <nombre>\n"
              << "  unknown delete <id>\n"
              << "  unknown export <id> <salida> [image|face]\n\n"
              << "Eventos de reconocimiento:\n"
              << "  events list\n"
              << "  events show <id>\n"
              << "  events delete <id>\n"
              << "  events promote <id> <face_index> <nombre>\n"
              << "  events export <id> <salida> [original|<face_index>]\n\n"
              << "Settings:\n"
              << "  settings show\n"
              << "  settings set-webhook <url> <on|off>\n"
              << "  settings set-tolerance <valor>\n";
}

void setup_logging(const SimpleToml& config) {
    std::string pattern = config.get("logging.pattern", Config::DEFAULT_LOG_PATTERN);
    std::string level = config.get("logging.level", Config::DEFAULT_LOG_LEVEL);
    std::string log_file = config.get("logging.file", "");

    if (!log_file.empty()) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        auto logger = std::make_shared<spdlog::logger>("facevault", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
    } else {
        spdlog::set_default_logger(spdlog::stderr_color_mt("facevault"));
    }

    spdlog::set_pattern(pattern);
    spdlog::set_level(spdlog::level::from_str(level));
}

Bytes read_input(const std::string& path) {
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        throw std::runtime_error("No se pudo leer " + path);
    }
    return *bytes;
}

void write_output(const std::string& path, const Bytes& bytes) {
    write_file_bytes(path, bytes);
    std::cout << "Guardado: " << path << " (" << bytes.size() << " bytes)\n";
}

int report(Status status, const std::string& what) {
    if (status == Status::Ok) {
        std::cout << "OK: " << what << "\n";
        return 0;
    }
    std::cerr << "ERROR: " << what << ": " << to_string(status) << "\n";
    return 1;
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cout << "  ⚠ " << w << "\n";
    }
}

std::string format_distance(const std::optional<double>& d) {
    if (!d) return "-";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << *d;
    return ss.str();
}

void print_faces(const std::vector<FaceResult>& faces) {
    for (const auto& f : faces) {
        std::cout << "  [" << f.face_index << "] "
                  << (f.matched ? f.name : std::string("desconocido"))
                  << "  dist=" << format_distance(f.distance)
                  << "  box=(" << f.box.top << "," << f.box.right << ","
                  << f.box.bottom << "," << f.box.left << ")";
        if (!f.face_image.empty()) std::cout << "  " << f.face_image;
        std::cout << "\n";
    }
}

// ==================== APP ====================

struct App {
    SimpleToml config;
    fs::path storage_root;
    double tolerance = Config::DEFAULT_TOLERANCE;

    std::unique_ptr<LazyFaceDetector> detector;
    std::unique_ptr<EmbeddingStore> known;
    std::unique_ptr<UnknownFaceStore> unknown_faces;
    std::unique_ptr<EventStore> events;
    std::unique_ptr<SettingsStore> settings;
    std::unique_ptr<EmbeddingCache> cache;
    std::unique_ptr<RecognitionPipeline> pipeline;
    std::unique_ptr<CurationService> curation;

    void init() {
        storage_root = config.get("storage.root", Config::DEFAULT_STORAGE_ROOT);
        std::string backend = config.get("storage.backend", Config::DEFAULT_STORAGE_BACKEND);

        SFaceDetector::Options opts;
        opts.detection_model = config.get("detector.detection_model", opts.detection_model);
        opts.recognition_model = config.get("detector.recognition_model", opts.recognition_model);
        opts.score_threshold = config.get_float("detector.score_threshold", opts.score_threshold);
        opts.nms_threshold = config.get_float("detector.nms_threshold", opts.nms_threshold);
        // los modelos se cargan en el primer detect(): enroll, recognize, unknown add|name, events promote
        detector = std::make_unique<LazyFaceDetector>([opts]() -> std::unique_ptr<FaceDetector> {
            return std::make_unique<SFaceDetector>(opts);
        });

        if (backend == "sqlite") {
            std::string db_path = config.get("storage.sqlite_path", Config::DEFAULT_SQLITE_PATH);
            known = std::make_unique<SqliteEmbeddingStore>(db_path, *detector);
        } else if (backend == "filesystem") {
            known = std::make_unique<FileEmbeddingStore>(storage_root / Config::KNOWN_DIR, *detector);
        } else {
            throw std::runtime_error("storage.backend desconocido: " + backend);
        }

        unknown_faces = std::make_unique<UnknownFaceStore>(storage_root, detector.get());
        events = std::make_unique<EventStore>(storage_root);

        tolerance = config.get_double("recognition.tolerance", Config::DEFAULT_TOLERANCE);
        settings = std::make_unique<SettingsStore>(storage_root, tolerance);
        if (settings->exists()) {
            tolerance = settings->load().tolerance;
        }

        cache = std::make_unique<EmbeddingCache>(*known);
        pipeline = std::make_unique<RecognitionPipeline>(*detector, *cache, *events, *unknown_faces, tolerance);
        curation = std::make_unique<CurationService>(*known, *unknown_faces, *events);

        spdlog::debug("Storage: {} (backend {}), tolerance {:.2f}", storage_root.string(), backend, tolerance);
    }
};

// ==================== COMMANDS ====================

int cmd_recognize(App& app, const std::string& image_path) {
    ProcessResult result = app.pipeline->process(read_input(image_path));

    std::cout << "Evento: " << result.event_id << "\n"
              << "Rostros: " << result.total_faces << "\n";
    print_faces(result.faces);
    for (const auto& id : result.unknown_ids) {
        std::cout << "  + unknown: " << id << "\n";
    }
    print_warnings(result.warnings);

    auto names = matched_identities(result);
    Settings s = app.settings->load();
    if (should_notify(s, names)) {
        std::string joined;
        for (const auto& n : names) joined += (joined.empty() ? "" : ", ") + n;
        std::cout << "Notificar webhook: " << joined << "\n";
    }
    return 0;
}

int cmd_identities(App& app) {
    auto identities = app.known->list_identities();
    std::cout << identities.size() << " identidades\n";
    for (const auto& info : identities) {
        std::cout << "  " << info.name << "  (" << info.enrollment_count << ")\n";
    }
    return 0;
}

int cmd_enrollments(App& app, const std::string& identity) {
    auto refs = app.known->list_enrollments(identity);
    if (refs.empty() && !app.known->has_identity(identity)) {
        return report(Status::NotFound, identity);
    }
    for (const auto& ref : refs) {
        std::cout << "  " << ref << "\n";
    }
    return 0;
}

int cmd_unknown(App& app, const std::vector<std::string>& args) {
    if (args.empty()) return 2;
    const std::string& sub = args[0];

    if (sub == "list") {
        auto faces = app.unknown_faces->list();
        std::cout << faces.size() << " rostros desconocidos\n";
        for (const auto& f : faces) {
            std::cout << "  " << f.id << "  " << f.timestamp
                      << (f.has_face_image ? "  [face]" : "") << "\n";
        }
        return 0;
    }
    if (sub == "add" && args.size() >= 2) {
        Outcome<std::string> created = app.unknown_faces->create(read_input(args[1]));
        std::cout << "OK: " << created.value << "\n";
        print_warnings(created.warnings);
        return 0;
    }
    if (sub == "name" && args.size() >= 3) {
        Outcome<Status> named = app.curation->name_unknown_face(args[1], args[2]);
        int rc = report(named.value, args[1] + " -> " + args[2]);
        print_warnings(named.warnings);
        return rc;
    }
    if (sub == "delete" && args.size() >= 2) {
        return report(app.curation->delete_unknown_face(args[1]), args[1]);
    }
    if (sub == "export" && args.size() >= 3) {
        UnknownImage kind = UnknownImage::Full;
        if (args.size() >= 4) {
            if (args[3] == "face") kind = UnknownImage::Face;
            else if (args[3] != "image") return 2;
        }
        auto bytes = app.unknown_faces->read_image(args[1], kind);
        if (!bytes) return report(Status::NotFound, args[1]);
        write_output(args[2], *bytes);
        return 0;
    }
    return 2;
}

int cmd_events(App& app, const std::vector<std::string>& args) {
    if (args.empty()) return 2;
    const std::string& sub = args[0];

    if (sub == "list") {
        auto list = app.events->list();
        std::cout << list.size() << " eventos\n";
        for (const auto& e : list) {
            int known = 0;
            for (const auto& f : e.faces) if (f.matched) known++;
            std::cout << "  " << e.event_id << "  " << e.timestamp
                      << "  rostros=" << e.total_faces << " conocidos=" << known << "\n";
        }
        return 0;
    }
    if (sub == "show" && args.size() >= 2) {
        auto event = app.events->get(args[1]);
        if (!event) return report(Status::NotFound, args[1]);
        std::cout << event->event_id << "  " << event->timestamp
                  << "  rostros=" << event->total_faces << "\n";
        print_faces(event->faces);
        return 0;
    }
    if (sub == "delete" && args.size() >= 2) {
        return report(app.curation->delete_event(args[1]), args[1]);
    }
    if (sub == "promote" && args.size() >= 4) {
        int index = std::stoi(args[2]);
        return report(app.curation->promote_event_face(args[1], index, args[3]),
                      args[1] + "#" + args[2] + " -> " + args[3]);
    }
    if (sub == "export" && args.size() >= 3) {
        std::optional<Bytes> bytes;
        if (args.size() < 4 || args[3] == "original") {
            bytes = app.events->read_original(args[1]);
        } else {
            bytes = app.events->read_face(args[1], std::stoi(args[3]));
        }
        if (!bytes) return report(Status::NotFound, args[1]);
        write_output(args[2], *bytes);
        return 0;
    }
    return 2;
}

int cmd_settings(App& app, const std::vector<std::string>& args) {
    if (args.empty()) return 2;
    const std::string& sub = args[0];

    Settings s = app.settings->load();

    if (sub == "show") {
        std::cout << "webhook_url:     " << (s.webhook_url.empty() ? "(vacio)" : s.webhook_url) << "\n"
                  << "webhook_enabled: " << (s.webhook_enabled ? "true" : "false") << "\n"
                  << "tolerance:       " << s.tolerance << "\n";
        return 0;
    }
    if (sub == "set-webhook" && args.size() >= 3) {
        s.webhook_url = trim_copy(args[1]);
        s.webhook_enabled = (args[2] == "on" || args[2] == "true" || args[2] == "1");
        app.settings->save(s);
        std::cout << "OK\n";
        return 0;
    }
    if (sub == "set-tolerance" && args.size() >= 2) {
        double t = std::stod(args[1]);
        if (t <= 0.0) {
            std::cerr << "ERROR: tolerance debe ser > 0\n";
            return 1;
        }
        s.tolerance = t;
        app.settings->save(s);
        app.pipeline->set_tolerance(t);
        std::cout << "OK\n";
        return 0;
    }
    return 2;
}

int run(App& app, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "enroll" && rest.size() >= 2) {
        return report(app.curation->enroll(rest[0], read_input(rest[1])), rest[0]);
    }
    if (cmd == "recognize" && rest.size() >= 1) {
        return cmd_recognize(app, rest[0]);
    }
    if (cmd == "identities") {
        return cmd_identities(app);
    }
    if (cmd == "enrollments" && rest.size() >= 1) {
        return cmd_enrollments(app, rest[0]);
    }
    if (cmd == "delete-identity" && rest.size() >= 1) {
        return report(app.curation->delete_identity(rest[0]), rest[0]);
    }
    if (cmd == "delete-enrollment" && rest.size() >= 2) {
        return report(app.curation->delete_enrollment(rest[0], rest[1]), rest[0] + "/" + rest[1]);
    }
    if (cmd == "export-enrollment" && rest.size() >= 3) {
        auto bytes = app.known->read_enrollment_image(rest[0], rest[1]);
        if (!bytes) return report(Status::NotFound, rest[0] + "/" + rest[1]);
        write_output(rest[2], *bytes);
        return 0;
    }
    if (cmd == "unknown") return cmd_unknown(app, rest);
    if (cmd == "events") return cmd_events(app, rest);
    if (cmd == "settings") return cmd_settings(app, rest);

    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_file = Config::DEFAULT_CONFIG_FILE;
    bool explicit_config = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
            explicit_config = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    App app;
    if (!app.config.load(config_file)) {
        if (explicit_config) {
            std::cerr << "No se pudo cargar " << config_file << "\n";
            return 1;
        }
    }

    try {
        setup_logging(app.config);
        spdlog::debug("Config: {}", config_file);

        app.init();

        int rc = run(app, args);
        if (rc == 2) {
            print_usage(argv[0]);
        }
        return rc;
    }
    catch (const DetectionError& e) {
        spdlog::error("Imagen no procesable: {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
