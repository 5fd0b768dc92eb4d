#pragma once
#include "../include/index_bundle.hpp"
#include "../include/record.hpp"
#include <filesystem>
#include <memory>
#include <vector>

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    std::filesystem::path path;
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

// The two-record index used in the acceptance scenarios.
std::vector<Record> hours_location_records();
// A small intent corpus: greeting, hours, location, admission.
std::vector<Record> campus_records();

std::shared_ptr<const IndexBundle> build_test_bundle(const std::vector<Record>& records, std::size_t dim = 384);
PersistenceCodec test_codec();
