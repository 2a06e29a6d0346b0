// ============= test/test_recognizer.cpp =============
#include "recognition/face_recognition_service.hpp"
#include "test_common.hpp"
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <thread>

using namespace facematch;

// -----------------------------------------------------
// Helpers
// -----------------------------------------------------
static const DescriptorKind KIND = DescriptorKind::embedding(3);

static cv::Mat blank_image(int width = 160, int height = 120) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(40, 40, 40));
}

static Descriptor emb(float a, float b, float c) {
    return Descriptor(DescriptorType::Embedding, {a, b, c});
}

static RecognitionConfig make_config(int workers = 4, int max_faces = 50) {
    RecognitionConfig cfg;
    cfg.threshold = 0.6f;
    cfg.worker_threads = workers;
    cfg.max_faces = max_faces;
    return cfg;
}

struct Fixture {
    std::shared_ptr<test::FakeDetector> detector;
    std::shared_ptr<test::FakeEmbedder> embedder;
    std::shared_ptr<MemoryHistorySink> history;
    std::shared_ptr<GalleryRegistry> registry;
    std::unique_ptr<FaceRecognitionService> service;

    explicit Fixture(int faces, int workers = 4)
        : detector(std::make_shared<test::FakeDetector>(faces)),
          embedder(std::make_shared<test::FakeEmbedder>()),
          history(std::make_shared<MemoryHistorySink>()),
          registry(std::make_shared<GalleryRegistry>(KIND))
    {
        service = std::make_unique<FaceRecognitionService>(detector, embedder, history,
                                                           make_config(workers));
    }

    void enroll_alice_bob() {
        auto alice = test::make_entry(1, "Alice", {1, 0, 0});
        alice.attributes["employee_id"] = "E-001";
        alice.attributes["department"] = "Engineering";
        registry->publish_entries({alice, test::make_entry(2, "Bob", {0, 1, 0})});
    }
};

// -----------------------------------------------------
// Casos basicos
// -----------------------------------------------------
void test_alice_end_to_end() {
    Fixture fx(1);
    fx.enroll_alice_bob();
    fx.embedder->by_face[0] = emb(0.95f, 0, 0);

    auto run = fx.service->recognize(blank_image(), *fx.registry, nullptr, "door.jpg");

    CHECK(run.total_detected == 1);
    CHECK(run.total_recognized == 1);
    CHECK(run.gallery_version == 1);
    CHECK(run.source == "door.jpg");
    CHECK(run.per_face_results.size() == 1);

    const auto& face = run.per_face_results[0];
    CHECK(face.is_known);
    CHECK(face.matched_entry_id && *face.matched_entry_id == 1);
    CHECK(face.matched_label == "Alice");
    CHECK(face.attributes.count("department") == 1);
    CHECK(face.confidence >= 90.0f);
    CHECK(face.observation.box == test::box_for(0));

    CHECK(fx.history->size() == 1);
    CHECK(fx.history->recent(1)[0].total_recognized == 1);
}

void test_empty_gallery_all_unknown() {
    Fixture fx(3);

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.total_detected == 3);
    CHECK(run.total_recognized == 0);
    for (const auto& r : run.per_face_results) {
        CHECK(!r.is_known);
        CHECK(r.confidence == 0.0f);
        CHECK(!r.raw_distance.has_value());
    }
    CHECK(fx.history->size() == 1);
}

void test_no_faces() {
    Fixture fx(0);
    fx.enroll_alice_bob();

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.total_detected == 0);
    CHECK(run.total_recognized == 0);
    CHECK(run.per_face_results.empty());
    CHECK(fx.embedder->calls == 0);
    // Un run vacio tambien queda en el historial
    CHECK(fx.history->size() == 1);
}

void test_counts_known_and_unknown() {
    Fixture fx(3);
    fx.enroll_alice_bob();
    fx.embedder->by_face[0] = emb(0, 0.98f, 0);   // Bob
    fx.embedder->by_face[1] = emb(0, 0, 1);       // nadie
    fx.embedder->by_face[2] = emb(1, 0.02f, 0);   // Alice

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.total_detected == 3);
    CHECK(run.total_recognized == 2);
    CHECK(run.per_face_results[0].matched_label == "Bob");
    CHECK(!run.per_face_results[1].is_known);
    CHECK(run.per_face_results[1].raw_distance.has_value());
    CHECK(run.per_face_results[2].matched_label == "Alice");
}

void test_deterministic() {
    Fixture fx(4);
    fx.enroll_alice_bob();
    fx.embedder->by_face[1] = emb(0.9f, 0.1f, 0);
    fx.embedder->by_face[3] = emb(0.1f, 0.9f, 0);

    auto image = blank_image();
    auto first = fx.service->recognize(image, *fx.registry);
    auto second = fx.service->recognize(image, *fx.registry);

    CHECK(first.per_face_results.size() == second.per_face_results.size());
    for (size_t i = 0; i < first.per_face_results.size(); i++) {
        const auto& a = first.per_face_results[i];
        const auto& b = second.per_face_results[i];
        CHECK(a.matched_entry_id == b.matched_entry_id);
        CHECK(a.raw_distance == b.raw_distance);
        CHECK(a.confidence == b.confidence);
    }
}

// -----------------------------------------------------
// Limite de caras
// -----------------------------------------------------
void test_truncates_to_max_faces() {
    Fixture fx(75);
    fx.enroll_alice_bob();

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.detected_before_truncation == 75);
    CHECK(run.total_detected == 50);
    CHECK(run.per_face_results.size() == 50);
    CHECK(fx.embedder->calls == 50);

    // Se procesan las primeras 50 en orden del detector
    for (size_t i = 0; i < run.per_face_results.size(); i++) {
        CHECK(run.per_face_results[i].observation.index == static_cast<int>(i));
        CHECK(run.per_face_results[i].observation.box == test::box_for(static_cast<int>(i)));
    }

    CHECK(run.warnings.size() == 1);
    CHECK(run.warnings[0].find("75") != std::string::npos);
}

void test_custom_max_faces() {
    Fixture fx(10);
    auto cfg = make_config(4, 3);

    auto run = fx.service->recognize(blank_image(), fx.registry->snapshot(), cfg);

    CHECK(run.total_detected == 3);
    CHECK(run.detected_before_truncation == 10);
}

// -----------------------------------------------------
// Fallos
// -----------------------------------------------------
void test_embedder_failure_degrades_face() {
    Fixture fx(3);
    fx.enroll_alice_bob();
    fx.embedder->by_face[0] = emb(1, 0, 0);
    fx.embedder->by_face[2] = emb(0, 1, 0);
    fx.embedder->failing_faces = {1};

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.total_detected == 3);
    CHECK(run.total_recognized == 2);

    const auto& failed = run.per_face_results[1];
    CHECK(!failed.is_known);
    CHECK(failed.confidence == 0.0f);
    CHECK(!failed.raw_distance.has_value());
    CHECK(!failed.error.empty());
    CHECK(failed.observation.index == 1);
}

void test_wrong_descriptor_shape_degrades_face() {
    Fixture fx(2);
    fx.enroll_alice_bob();
    fx.embedder->by_face[0] = Descriptor(DescriptorType::Embedding, {1, 0});
    fx.embedder->by_face[1] = emb(1, 0, 0);

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.total_detected == 2);
    CHECK(!run.per_face_results[0].is_known);
    CHECK(!run.per_face_results[0].error.empty());
    CHECK(run.per_face_results[1].matched_label == "Alice");
}

void test_history_failure_is_swallowed() {
    auto detector = std::make_shared<test::FakeDetector>(1);
    auto embedder = std::make_shared<test::FakeEmbedder>(emb(1, 0, 0));
    auto failing = std::make_shared<test::FailingHistorySink>();
    FaceRecognitionService service(detector, embedder, failing, make_config());

    GalleryRegistry registry(KIND);
    registry.publish_entries({test::make_entry(1, "Alice", {1, 0, 0})});

    auto run = service.recognize(blank_image(), registry);

    CHECK(failing->attempts == 1);
    CHECK(run.total_recognized == 1);
}

void test_no_history_sink() {
    auto detector = std::make_shared<test::FakeDetector>(1);
    auto embedder = std::make_shared<test::FakeEmbedder>();
    FaceRecognitionService service(detector, embedder, nullptr, make_config());
    GalleryRegistry registry(KIND);

    auto run = service.recognize(blank_image(), registry);
    CHECK(run.total_detected == 1);
}

void test_detector_failure() {
    Fixture fx(2);
    fx.detector->fail = true;

    CHECK_THROWS_CODE(fx.service->recognize(blank_image(), *fx.registry),
                      ErrorCode::DetectorUnavailable);
    CHECK(fx.history->size() == 0);

    FaceRecognitionService no_detector(nullptr, fx.embedder, fx.history, make_config());
    CHECK_THROWS_CODE(no_detector.recognize(blank_image(), *fx.registry),
                      ErrorCode::DetectorUnavailable);
}

void test_image_decode_failure() {
    Fixture fx(1);

    CHECK_THROWS_CODE(fx.service->recognize(cv::Mat(), *fx.registry),
                      ErrorCode::ImageDecodeFailure);

    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    CHECK_THROWS_CODE(fx.service->recognize(garbage, fx.registry->snapshot(), make_config()),
                      ErrorCode::ImageDecodeFailure);

    CHECK_THROWS_CODE(fx.service->recognize(std::vector<uint8_t>(), fx.registry->snapshot(),
                                            make_config()),
                      ErrorCode::ImageDecodeFailure);
    CHECK(fx.detector->calls == 0);
}

void test_encoded_bytes() {
    Fixture fx(1);
    fx.enroll_alice_bob();
    fx.embedder->by_face[0] = emb(0.95f, 0, 0);

    std::vector<uint8_t> png;
    CHECK(cv::imencode(".png", blank_image(), png));

    auto run = fx.service->recognize(png, fx.registry->snapshot(), make_config(), nullptr, "upload.png");
    CHECK(run.image_width == 160);
    CHECK(run.image_height == 120);
    CHECK(run.total_recognized == 1);
}

void test_large_image_is_downscaled() {
    Fixture fx(1);

    auto run = fx.service->recognize(blank_image(3840, 2160), *fx.registry);

    CHECK(run.image_width == 1920);
    CHECK(run.image_height == 1080);
}

// -----------------------------------------------------
// Concurrencia
// -----------------------------------------------------
void test_snapshot_isolation() {
    Fixture fx(6);
    fx.enroll_alice_bob();
    for (int i = 0; i < 6; i++) fx.embedder->by_face[i] = emb(1, 0, 0);

    // Primera llamada al embedder: se publica v2 sin Alice
    std::atomic<bool> published{false};
    fx.embedder->on_embed = [&](int) {
        if (!published.exchange(true)) {
            fx.registry->publish_entries({test::make_entry(2, "Bob", {0, 1, 0})});
        }
    };

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(published);
    CHECK(fx.registry->version() == 2);
    CHECK(run.gallery_version == 1);
    // Todas las caras se comparan contra v1
    CHECK(run.total_recognized == 6);
    for (const auto& r : run.per_face_results) {
        CHECK(r.matched_label == "Alice");
    }

    // El siguiente run ya ve v2
    fx.embedder->on_embed = nullptr;
    auto next = fx.service->recognize(blank_image(), *fx.registry);
    CHECK(next.gallery_version == 2);
    CHECK(next.total_recognized == 0);
}

void test_parallel_results_in_index_order() {
    Fixture fx(8, 4);
    fx.enroll_alice_bob();
    for (int i = 0; i < 8; i++) {
        fx.embedder->by_face[i] = (i % 2 == 0) ? emb(1, 0, 0) : emb(0, 1, 0);
    }
    // Las primeras caras terminan ultimas
    fx.embedder->on_embed = [](int face) {
        std::this_thread::sleep_for(std::chrono::milliseconds((8 - face) * 5));
    };

    auto run = fx.service->recognize(blank_image(), *fx.registry);

    CHECK(run.per_face_results.size() == 8);
    for (int i = 0; i < 8; i++) {
        const auto& r = run.per_face_results[i];
        CHECK(r.observation.index == i);
        CHECK(r.matched_label == (i % 2 == 0 ? "Alice" : "Bob"));
    }
}

void test_concurrent_runs() {
    Fixture fx(5, 4);
    fx.enroll_alice_bob();
    fx.embedder->by_face[2] = emb(0, 1, 0);

    std::atomic<int> bad{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; t++) {
        callers.emplace_back([&]() {
            for (int i = 0; i < 10; i++) {
                auto run = fx.service->recognize(blank_image(), *fx.registry);
                if (run.total_detected != 5 || run.total_recognized != 1) bad++;
            }
        });
    }
    for (auto& t : callers) t.join();

    CHECK(bad == 0);
    CHECK(fx.history->size() == 40);
}

// -----------------------------------------------------
// Cancelacion
// -----------------------------------------------------
void test_cancelled_run() {
    Fixture fx(4);
    fx.enroll_alice_bob();

    CancelToken token;
    token.cancel();

    CHECK_THROWS_CODE(fx.service->recognize(blank_image(), *fx.registry, &token),
                      ErrorCode::Cancelled);
    // Sin historial y la Gallery intacta
    CHECK(fx.history->size() == 0);
    CHECK(fx.registry->version() == 1);
}

void test_cancel_mid_run() {
    Fixture fx(6, 1);
    fx.enroll_alice_bob();

    CancelToken token;
    fx.embedder->on_embed = [&](int face) {
        if (face == 2) token.cancel();
    };

    CHECK_THROWS_CODE(fx.service->recognize(blank_image(), *fx.registry, &token),
                      ErrorCode::Cancelled);
    // Secuencial: se corta en la cara 2
    CHECK(fx.embedder->calls == 3);
    CHECK(fx.history->size() == 0);
}

void test_timeout() {
    Fixture fx(3);
    fx.embedder->on_embed = [](int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    };

    auto cfg = make_config();
    cfg.timeout_ms = 5;

    CHECK_THROWS_CODE(fx.service->recognize(blank_image(), fx.registry->snapshot(), cfg),
                      ErrorCode::Cancelled);

    auto token = CancelToken::with_timeout(std::chrono::milliseconds(5));
    CHECK_THROWS_CODE(fx.service->recognize(blank_image(), *fx.registry, &token),
                      ErrorCode::Cancelled);
    CHECK(fx.history->size() == 0);
}

// -----------------------------------------------------
// Info
// -----------------------------------------------------
void test_system_info() {
    Fixture fx(1, 3);
    fx.enroll_alice_bob();

    auto info = fx.service->system_info(*fx.registry->snapshot());

    CHECK(info.gallery_version == 1);
    CHECK(info.known_faces == 2);
    CHECK(info.kind == KIND);
    CHECK_NEAR(info.threshold, 0.6f, 1e-6f);
    CHECK(info.max_faces == 50);
    CHECK(info.worker_threads == 3);
    CHECK(info.max_image_width == 1920);
}

int main() {
    test::setup();
    spdlog::info("🧪 Face recognition service tests");

    test::run_case("Alice end to end", test_alice_end_to_end);
    test::run_case("empty gallery -> all unknown", test_empty_gallery_all_unknown);
    test::run_case("no faces detected", test_no_faces);
    test::run_case("known / unknown counts", test_counts_known_and_unknown);
    test::run_case("deterministic", test_deterministic);
    test::run_case("75 faces -> first 50", test_truncates_to_max_faces);
    test::run_case("custom max_faces", test_custom_max_faces);
    test::run_case("embedder failure degrades one face", test_embedder_failure_degrades_face);
    test::run_case("wrong descriptor shape degrades one face", test_wrong_descriptor_shape_degrades_face);
    test::run_case("history failure is swallowed", test_history_failure_is_swallowed);
    test::run_case("no history sink", test_no_history_sink);
    test::run_case("detector failure", test_detector_failure);
    test::run_case("image decode failure", test_image_decode_failure);
    test::run_case("encoded image bytes", test_encoded_bytes);
    test::run_case("large image is downscaled", test_large_image_is_downscaled);
    test::run_case("snapshot isolation under publish", test_snapshot_isolation);
    test::run_case("parallel results in index order", test_parallel_results_in_index_order);
    test::run_case("concurrent runs", test_concurrent_runs);
    test::run_case("cancelled run", test_cancelled_run);
    test::run_case("cancel mid run", test_cancel_mid_run);
    test::run_case("timeout", test_timeout);
    test::run_case("system info", test_system_info);

    return test::summary("test_recognizer");
}
