#include "../include/ingest.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
std::vector<std::string> string_array(const json& intent, const char* key, std::size_t idx) {
    if (!intent.contains(key) || !intent[key].is_array()) {
        throw IngestError("intent " + std::to_string(idx) + ": '" + key + "' must be an array");
    }
    std::vector<std::string> out;
    for (const auto& v : intent[key]) {
        if (!v.is_string()) throw IngestError("intent " + std::to_string(idx) + ": '" + key + "' holds a non-string");
        out.push_back(v.get<std::string>());
    }
    return out;
}
}

std::vector<Record> parse_intents_json(const std::string& text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IngestError(std::string("intents file is not valid JSON: ") + e.what());
    }
    if (!data.is_object() || !data.contains("intents") || !data["intents"].is_array()) {
        throw IngestError("intents file must hold an object with an 'intents' array");
    }

    std::vector<Record> records;
    std::size_t idx = 0;
    for (const auto& intent : data["intents"]) {
        if (!intent.is_object()) throw IngestError("intent " + std::to_string(idx) + " is not an object");
        if (!intent.contains("tag") || !intent["tag"].is_string() || is_blank(intent["tag"].get<std::string>())) {
            throw IngestError("intent " + std::to_string(idx) + ": 'tag' must be a non-empty string");
        }
        std::string tag = intent["tag"].get<std::string>();
        auto patterns = string_array(intent, "patterns", idx);
        auto responses = string_array(intent, "responses", idx);

        for (const auto& p : patterns) {
            if (is_blank(p)) {
                spdlog::warn("intent '{}': skipping blank pattern", tag);
                continue;
            }
            Record r{p, tag, responses, RecordKind::Pattern};
            validate_record(r);
            records.push_back(std::move(r));
        }
        ++idx;
    }
    spdlog::info("found {} intents, {} patterns", idx, records.size());
    return records;
}

std::vector<Record> load_intents_json(const std::filesystem::path& path) {
    spdlog::info("loading data from {}", path.string());
    std::string text;
    try {
        text = read_text_file(path);
    } catch (const std::runtime_error& e) {
        throw IngestError(e.what());
    }
    return parse_intents_json(text);
}
