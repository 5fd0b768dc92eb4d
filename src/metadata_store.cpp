#include "../include/metadata_store.hpp"
#include "../include/errors.hpp"

MetadataStore::MetadataStore(std::vector<Record> records) {
    for (const auto& r : records) validate_record(r);
    records_ = std::move(records);
}

void MetadataStore::append(const std::vector<Record>& records) {
    for (const auto& r : records) validate_record(r);
    records_.insert(records_.end(), records.begin(), records.end());
}

const Record& MetadataStore::at(std::size_t pos) const {
    if (pos >= records_.size()) {
        throw CorruptionError("index position " + std::to_string(pos) + " has no record (store holds " +
                              std::to_string(records_.size()) + ")");
    }
    return records_[pos];
}
