#pragma once
#include <string>
#include <vector>

enum class RecordKind {
    Pattern,
};

std::string to_string(RecordKind kind);
// Throws IngestError for an unknown name.
RecordKind record_kind_from_string(const std::string& name);

// One indexed pattern and the canned replies of the intent it belongs to.
struct Record {
    std::string text;
    std::string tag;
    std::vector<std::string> responses;
    RecordKind kind{RecordKind::Pattern};
};

bool operator==(const Record& a, const Record& b);
bool operator!=(const Record& a, const Record& b);

// Throws IngestError when a required field is missing or blank.
void validate_record(const Record& r);

struct SearchHit {
    int rank{0};        // 1-based
    Record record;      // copy, never a view into the store
    float distance{0.0f};
    float score{0.0f};
};
