// ============= src/core/config.cpp =============
#include "core/config.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace facematch {

// ==================== SIMPLE TOML ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

bool SimpleToml::parse(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;

    while (std::getline(in, line)) {
        // Comentario al final de la linea (fuera de comillas)
        bool in_quotes = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') in_quotes = !in_quotes;
            if (line[i] == '#' && !in_quotes) {
                line = line.substr(0, i);
                break;
            }
        }

        line = trim(line);
        if (line.empty()) continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Config: ignoring malformed line '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.length() - 2);
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;

    try {
        size_t pos = 0;
        int v = std::stoi(it->second, &pos);
        if (pos != it->second.size()) throw std::invalid_argument(it->second);
        return v;
    } catch (const std::exception&) {
        throw RecognitionError(ErrorCode::ConfigError,
                               key + " is not an integer: '" + it->second + "'");
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;

    try {
        size_t pos = 0;
        float v = std::stof(it->second, &pos);
        if (pos != it->second.size()) throw std::invalid_argument(it->second);
        return v;
    } catch (const std::exception&) {
        throw RecognitionError(ErrorCode::ConfigError,
                               key + " is not a number: '" + it->second + "'");
    }
}

// ==================== APP CONFIG ====================

float default_threshold(const DescriptorKind& kind) {
    switch (kind.metric) {
        case DistanceMetricType::ChiSquare:     return Defaults::HISTOGRAM_THRESHOLD;
        case DistanceMetricType::Bhattacharyya: return Defaults::BHATTACHARYYA_THRESHOLD;
        case DistanceMetricType::Euclidean:     break;
    }
    return Defaults::EMBEDDING_THRESHOLD;
}

// from_str devuelve off para nombres desconocidos: solo "off" puede mapear a off
static spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw RecognitionError(ErrorCode::ConfigError, "unknown logging.level '" + name + "'");
    }
    return level;
}

static DescriptorKind parse_kind(const SimpleToml& toml) {
    std::string descriptor = toml.get("gallery.descriptor", "embedding");
    std::string metric = toml.get("gallery.histogram_metric", "chi_square");

    if (descriptor == "embedding") {
        int dim = toml.get_int("gallery.dim", static_cast<int>(Defaults::EMBEDDING_DIM));
        if (dim <= 0) {
            throw RecognitionError(ErrorCode::ConfigError, "gallery.dim must be positive");
        }
        return DescriptorKind::embedding(static_cast<size_t>(dim));
    }

    if (descriptor == "histogram") {
        int dim = toml.get_int("gallery.dim", static_cast<int>(Defaults::HISTOGRAM_DIM));
        if (dim <= 0) {
            throw RecognitionError(ErrorCode::ConfigError, "gallery.dim must be positive");
        }

        DistanceMetricType m;
        if (metric == "chi_square") {
            m = DistanceMetricType::ChiSquare;
        } else if (metric == "bhattacharyya") {
            m = DistanceMetricType::Bhattacharyya;
        } else {
            throw RecognitionError(ErrorCode::ConfigError,
                                   "unknown gallery.histogram_metric '" + metric + "'");
        }
        return DescriptorKind::histogram(static_cast<size_t>(dim), m);
    }

    throw RecognitionError(ErrorCode::ConfigError,
                           "unknown gallery.descriptor '" + descriptor + "'");
}

AppConfig config_from_toml(const SimpleToml& toml) {
    AppConfig config;

    config.kind = parse_kind(toml);

    auto& rec = config.recognition;
    rec.threshold = toml.get_float("recognition.threshold", default_threshold(config.kind));
    if (!toml.has("recognition.threshold")) {
        spdlog::debug("Config: recognition.threshold not set, using {:.2f} for {}",
                      rec.threshold, to_string(config.kind.metric));
    }
    rec.max_faces = toml.get_int("recognition.max_faces", Defaults::MAX_FACES);
    rec.worker_threads = toml.get_int("recognition.worker_threads", Defaults::WORKER_THREADS);
    rec.timeout_ms = toml.get_int("recognition.timeout_ms", 0);

    if (rec.threshold <= 0.0f) {
        throw RecognitionError(ErrorCode::ConfigError, "recognition.threshold must be positive");
    }
    if (rec.max_faces < 1) {
        throw RecognitionError(ErrorCode::ConfigError, "recognition.max_faces must be >= 1");
    }
    if (rec.worker_threads < 1) {
        throw RecognitionError(ErrorCode::ConfigError, "recognition.worker_threads must be >= 1");
    }
    if (rec.timeout_ms < 0) {
        throw RecognitionError(ErrorCode::ConfigError, "recognition.timeout_ms must be >= 0");
    }

    auto& det = config.detector;
    det.cascade_path = toml.get("detector.cascade_path", det.cascade_path);
    det.scale_factor = toml.get_float("detector.scale_factor", static_cast<float>(det.scale_factor));
    det.min_neighbors = toml.get_int("detector.min_neighbors", det.min_neighbors);
    det.min_size = toml.get_int("detector.min_size", det.min_size);
    det.max_width = toml.get_int("detector.max_width", det.max_width);
    det.max_height = toml.get_int("detector.max_height", det.max_height);

    if (det.scale_factor <= 1.0) {
        throw RecognitionError(ErrorCode::ConfigError, "detector.scale_factor must be > 1.0");
    }

    config.storage.db_path = toml.get("storage.db_path", config.storage.db_path);
    config.storage.history_path = toml.get("storage.history_path", config.storage.history_path);

    config.logging.level = toml.get("logging.level", config.logging.level);
    config.logging.pattern = toml.get("logging.pattern", config.logging.pattern);
    parse_log_level(config.logging.level);

    return config;
}

AppConfig load_config(const std::string& path) {
    SimpleToml toml;
    if (!toml.load(path)) {
        throw RecognitionError(ErrorCode::ConfigError, "cannot open config file " + path);
    }

    AppConfig config = config_from_toml(toml);

    spdlog::info("Config loaded: {}", path);
    spdlog::info("   Descriptor: {} (dim={}, metric={})",
                 to_string(config.kind.type), config.kind.dim, to_string(config.kind.metric));
    spdlog::info("   Threshold: {:.2f}, max faces: {}, workers: {}",
                 config.recognition.threshold, config.recognition.max_faces,
                 config.recognition.worker_threads);

    return config;
}

void setup_logging(const LoggingConfig& config) {
    auto level = parse_log_level(config.level);
    spdlog::set_pattern(config.pattern);
    spdlog::set_level(level);
}

} // namespace facematch
