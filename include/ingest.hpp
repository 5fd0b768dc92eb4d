#pragma once
#include "record.hpp"
#include <filesystem>
#include <string>
#include <vector>

// {"intents": [{"tag": ..., "patterns": [...], "responses": [...]}]}
// One Record per pattern, in file order. Throws IngestError on a malformed corpus.
std::vector<Record> load_intents_json(const std::filesystem::path& path);
std::vector<Record> parse_intents_json(const std::string& text);
