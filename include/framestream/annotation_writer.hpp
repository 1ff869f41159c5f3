#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace framestream {

// Copies the annotation into a record and stamps the reserved keys
// "source_id" and "frame_time", overwriting any values already there.
// A scalar or array annotation is kept under the key "annotation".
nlohmann::json build_record(const nlohmann::json& annotation,
                            const std::string& source_id,
                            double frame_time);

// Collapses nested objects and arrays into one level: object keys are
// joined with '.', array elements are keyed by index. Scalars and empty
// containers stay at their accumulated key, so flattening a flat object
// returns it unchanged. Array order is preserved, but sets arrive as
// arrays in publisher-defined order and must not be relied upon.
nlohmann::json flatten(const nlohmann::json& value);

// Serializes one record per line, as JSON or as a CSV row over a fixed
// list of fields.
class AnnotationWriter {
public:
    struct Config {
        std::vector<std::string> csv_fields;  // non-empty selects CSV
        bool flatten = false;
    };

    explicit AnnotationWriter(const Config& config);

    bool csv_mode() const { return !config_.csv_fields.empty(); }

    // build_record, then flatten when configured.
    nlohmann::json prepare(const nlohmann::json& annotation,
                           const std::string& source_id,
                           double frame_time) const;

    std::string format(const nlohmann::json& record) const;

    // CSV header row; empty in JSON-lines mode.
    std::string header() const;

    std::string extension() const { return csv_mode() ? ".csv" : ".jsonl"; }

private:
    Config config_;
};

std::string csv_escape(const std::string& field);

} // namespace framestream
