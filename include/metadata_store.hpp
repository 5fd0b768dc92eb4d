#pragma once
#include "record.hpp"
#include <vector>
#include <cstddef>

// Records in insertion order; position i describes vector i of the index.
class MetadataStore {
public:
    MetadataStore() = default;
    explicit MetadataStore(std::vector<Record> records);

    // Validates every record before appending any of them.
    void append(const std::vector<Record>& records);

    // Throws CorruptionError when pos is past the end: a search produced a
    // position with no record behind it.
    const Record& at(std::size_t pos) const;

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const std::vector<Record>& records() const { return records_; }

private:
    std::vector<Record> records_;
};
