#include "../include/query_json.hpp"

using json = nlohmann::json;

void to_json(json& j, const Record& r) {
    j = json{
        {"text", r.text},
        {"tag", r.tag},
        {"responses", r.responses},
        {"kind", to_string(r.kind)}
    };
}

void to_json(json& j, const SearchHit& h) {
    j = json{
        {"rank", h.rank},
        {"score", h.score},
        {"distance", h.distance},
        {"record", h.record}
    };
}

void to_json(json& j, const MatchResult& m) {
    j = json{{"matched", m.matched}, {"threshold", m.threshold}};
    if (m.best) j["best"] = *m.best;
}

void to_json(json& j, const MatcherStats& s) {
    j = json{{"loaded", s.loaded}, {"threshold", s.threshold}};
    if (!s.loaded) return;
    j["total_vectors"] = *s.total_vectors;
    j["dimension"] = *s.dimension;
    j["model_name"] = *s.model_name;
    if (s.metadata_count) j["metadata_count"] = *s.metadata_count;
    if (s.index_backend) j["index_backend"] = *s.index_backend;
}
