#include "../include/record.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

std::string to_string(RecordKind kind) {
    switch (kind) {
        case RecordKind::Pattern: return "pattern";
    }
    throw IngestError("unknown record kind");
}

RecordKind record_kind_from_string(const std::string& name) {
    if (name == "pattern") return RecordKind::Pattern;
    throw IngestError("unknown record kind: " + name);
}

bool operator==(const Record& a, const Record& b) {
    return a.text == b.text && a.tag == b.tag && a.responses == b.responses && a.kind == b.kind;
}

bool operator!=(const Record& a, const Record& b) {
    return !(a == b);
}

void validate_record(const Record& r) {
    if (is_blank(r.text)) throw IngestError("record text is blank");
    if (is_blank(r.tag)) throw IngestError("record tag is blank (text: '" + truncate_for_log(r.text) + "')");
}
