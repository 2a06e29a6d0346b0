// ============= include/core/config.hpp =============
/*
 * Configuracion del servicio de reconocimiento
 *
 * FORMATO (subset de TOML):
 *
 *   [gallery]
 *   descriptor = "embedding"        # o "histogram"
 *   dim = 128
 *   histogram_metric = "chi_square" # o "bhattacharyya"
 *
 *   [recognition]
 *   threshold = 0.6                 # default segun metrica
 *   max_faces = 50
 *   worker_threads = 4
 *   timeout_ms = 0                  # 0 = sin timeout
 *
 *   [detector]
 *   cascade_path = "models/haarcascade_frontalface_default.xml"
 *   scale_factor = 1.1
 *   min_neighbors = 5
 *   min_size = 30
 *   max_width = 1920
 *   max_height = 1080
 *
 *   [storage]
 *   db_path = "database/faces.db"
 *   history_path = "database/history.db"
 *
 *   [logging]
 *   level = "info"
 *   pattern = "[%H:%M:%S.%e] [%^%l%$] %v"
 */

#pragma once
#include "core/types.hpp"
#include <map>
#include <string>

namespace facematch {

namespace Defaults {
    constexpr float EMBEDDING_THRESHOLD = 0.6f;    // distancia euclidea (dlib)
    constexpr float HISTOGRAM_THRESHOLD = 100.0f;  // chi-square (LBPH)
    constexpr float BHATTACHARYYA_THRESHOLD = 0.4f; // distancia en [0,1]
    constexpr int MAX_FACES = 50;
    constexpr int WORKER_THREADS = 4;
    constexpr size_t EMBEDDING_DIM = 128;
    constexpr size_t HISTOGRAM_DIM = 8 * 8 * 256;  // grid 8x8, 256 bins
    constexpr int MAX_IMAGE_WIDTH = 1920;
    constexpr int MAX_IMAGE_HEIGHT = 1080;
    constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
}

// ==================== SIMPLE TOML PARSER ====================
class SimpleToml {
public:
    bool load(const std::string& filename);
    bool parse(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;

private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);
};

// ==================== CONFIG STRUCTS ====================

struct RecognitionConfig {
    int max_faces = Defaults::MAX_FACES;
    float threshold = Defaults::EMBEDDING_THRESHOLD;
    int worker_threads = Defaults::WORKER_THREADS;
    int timeout_ms = 0;
};

struct DetectorConfig {
    std::string cascade_path = "models/haarcascade_frontalface_default.xml";
    double scale_factor = 1.1;
    int min_neighbors = 5;
    int min_size = 30;
    int max_width = Defaults::MAX_IMAGE_WIDTH;
    int max_height = Defaults::MAX_IMAGE_HEIGHT;
};

struct StorageConfig {
    std::string db_path = "database/faces.db";
    std::string history_path = "database/history.db";
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = Defaults::LOG_PATTERN;
};

struct AppConfig {
    DescriptorKind kind = DescriptorKind::embedding(Defaults::EMBEDDING_DIM);
    RecognitionConfig recognition;
    DetectorConfig detector;
    StorageConfig storage;
    LoggingConfig logging;
};

// Depende de la metrica: la escala de distancias cambia entre metricas
float default_threshold(const DescriptorKind& kind);

// Lanza RecognitionError(ConfigError) si el archivo no existe o un valor es invalido
AppConfig load_config(const std::string& path);
AppConfig config_from_toml(const SimpleToml& toml);

// Lanza RecognitionError(ConfigError) si level no es un nivel de spdlog
void setup_logging(const LoggingConfig& config);

} // namespace facematch
