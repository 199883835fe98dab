#include "io/stats_writer.hpp"
#include "core/config.hpp"

#include <cmath>
#include <fstream>
#include <memory>

namespace seqtally {

double round_stat(double x) {
    double scale = std::pow(10.0, STATS_FLOAT_DECIMALS);
    return std::round(x * scale) / scale;
}

static Json::Value u64(uint64_t v) {
    return Json::Value(static_cast<Json::UInt64>(v));
}

Json::Value stats_to_json(const LibraryIndependentStats& s) {
    Json::Value root(Json::objectValue);
    root["sample_name"] = s.sample_name;
    root["input_reads"] = u64(s.input_reads);
    root["total_reads"] = u64(s.total_reads);
    root["discarded_reads"] = u64(s.discarded_reads);
    root["vendor_failed_reads"] = u64(s.vendor_failed_reads);
    root["length_excluded_reads"] = u64(s.length_excluded_reads);
    root["ambiguous_nt_reads"] = u64(s.ambiguous_nt_reads);
    root["masked_reads"] = u64(s.masked_reads);
    root["zero_length_reads"] = u64(s.zero_length_reads);
    return root;
}

Json::Value stats_to_json(const LibraryDependentStats& s) {
    Json::Value root = stats_to_json(s.reads);
    root["mapped_to_template_reads"] = u64(s.mapped_to_template_reads);
    root["multimap_reads"] = u64(s.multimap_reads);
    root["unmapped_reads"] = u64(s.unmapped_reads);
    root["total_templates"] = u64(s.total_templates);
    root["total_unique_templates"] = u64(s.total_unique_templates);
    root["length_excluded_templates"] = u64(s.length_excluded_templates);
    root["zero_count_templates"] = u64(s.zero_count_templates);
    root["low_count_templates_lt_15"] = u64(s.low_count_templates_lt_15);
    root["low_count_templates_lt_30"] = u64(s.low_count_templates_lt_30);
    if (s.low_count_templates_user) {
        Json::Value user(Json::objectValue);
        user["lt"] = u64(s.low_count_templates_user->lt);
        user["count"] = u64(s.low_count_templates_user->count);
        root["low_count_templates_user"] = std::move(user);
    }
    root["mean_count_per_template"] = round_stat(s.mean_count_per_template);
    root["median_count_per_template"] = round_stat(s.median_count_per_template);
    root["gini_coefficient"] = round_stat(s.gini_coefficient);
    return root;
}

bool write_stats_json(const std::string& path, const Json::Value& root,
                      std::string& error_msg) {
    std::ofstream out(path);
    if (!out.is_open()) {
        error_msg = "cannot open stats file " + path;
        return false;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["precision"] = STATS_FLOAT_DECIMALS;
    writer["precisionType"] = "decimal";
    std::unique_ptr<Json::StreamWriter> json_writer(writer.newStreamWriter());
    if (json_writer->write(root, &out) != 0) {
        error_msg = "failed writing stats file " + path;
        return false;
    }
    out << '\n';

    out.close();
    if (out.fail()) {
        error_msg = "failed writing stats file " + path;
        return false;
    }
    return true;
}

} // namespace seqtally
