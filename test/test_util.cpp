#include "test_util.hpp"
#include <atomic>
#include <random>

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path = std::filesystem::temp_directory_path() /
           ("retrieval_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

std::vector<Record> hours_location_records() {
    return {
        {"hours", "hours_info", {"We are open 9-5."}, RecordKind::Pattern},
        {"location", "location_info", {"Main campus."}, RecordKind::Pattern},
    };
}

std::vector<Record> campus_records() {
    return {
        {"hello", "greeting", {"Hello! How can I help?", "Hi! What can I do for you?"}, RecordKind::Pattern},
        {"hi there", "greeting", {"Hello! How can I help?", "Hi! What can I do for you?"}, RecordKind::Pattern},
        {"what are your opening hours", "hours_info", {"We are open 9-5."}, RecordKind::Pattern},
        {"where is the campus located", "location_info", {"Main campus."}, RecordKind::Pattern},
        {"how do I apply for admission", "admission", {"Apply online.", "Visit the admissions office."}, RecordKind::Pattern},
    };
}

std::shared_ptr<const IndexBundle> build_test_bundle(const std::vector<Record>& records, std::size_t dim) {
    return build_bundle(records, std::make_shared<HashingEmbedder>(dim), 2, BackendPreference::Scalar);
}

PersistenceCodec test_codec() {
    return make_codec(EmbedConfig{}, BackendPreference::Scalar);
}
