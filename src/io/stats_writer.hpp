#pragma once

#include <string>

#include <json/json.h>

#include "stats/run_stats.hpp"

namespace seqtally {

// JSON object with the library-independent fields.
Json::Value stats_to_json(const LibraryIndependentStats& stats);

// JSON object with the library-independent fields plus the library-
// dependent ones. Floating point fields are rounded to two decimals;
// low_count_templates_user is present only when a user threshold was set.
Json::Value stats_to_json(const LibraryDependentStats& stats);

// Serialize root to path. Returns false on I/O error (error_msg set).
bool write_stats_json(const std::string& path, const Json::Value& root,
                      std::string& error_msg);

// Round x to the number of decimals kept in the stats report.
double round_stat(double x);

} // namespace seqtally
