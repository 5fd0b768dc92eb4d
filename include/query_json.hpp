#pragma once
#include "intent_matcher.hpp"
#include "record.hpp"
#include <nlohmann/json.hpp>

// Shapes handed to whatever transport sits above the core.
void to_json(nlohmann::json& j, const Record& r);
void to_json(nlohmann::json& j, const SearchHit& h);
void to_json(nlohmann::json& j, const MatchResult& m);
void to_json(nlohmann::json& j, const MatcherStats& s);
