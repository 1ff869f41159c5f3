#include "framestream/annotation_writer.hpp"

namespace framestream {

namespace {

using json = nlohmann::json;

std::string dump_compact(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

void flatten_into(const std::string& prefix, const json& value, json& out) {
    auto child_key = [&prefix](const std::string& key) {
        return prefix.empty() ? key : prefix + "." + key;
    };

    if (value.is_object() && !value.empty()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            flatten_into(child_key(it.key()), it.value(), out);
        }
    } else if (value.is_array() && !value.empty()) {
        for (size_t i = 0; i < value.size(); ++i) {
            flatten_into(child_key(std::to_string(i)), value[i], out);
        }
    } else {
        out[prefix] = value;
    }
}

std::string csv_value(const json& value) {
    if (value.is_null()) {
        return std::string();
    }
    if (value.is_string()) {
        return csv_escape(value.get<std::string>());
    }
    return csv_escape(dump_compact(value));
}

} // namespace

json build_record(const json& annotation, const std::string& source_id, double frame_time) {
    json record = json::object();
    if (annotation.is_object()) {
        record = annotation;
    } else if (!annotation.is_null()) {
        record["annotation"] = annotation;
    }
    record["source_id"] = source_id;
    record["frame_time"] = frame_time;
    return record;
}

json flatten(const json& value) {
    if (!value.is_structured() || value.empty()) {
        return value;
    }
    json out = json::object();
    flatten_into(std::string(), value, out);
    return out;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "\"";
    return quoted;
}

AnnotationWriter::AnnotationWriter(const Config& config)
    : config_(config)
{
}

json AnnotationWriter::prepare(const json& annotation, const std::string& source_id,
                               double frame_time) const {
    json record = build_record(annotation, source_id, frame_time);
    if (config_.flatten) {
        record = flatten(record);
    }
    return record;
}

std::string AnnotationWriter::format(const json& record) const {
    if (!csv_mode()) {
        return dump_compact(record);
    }

    std::string row;
    for (size_t i = 0; i < config_.csv_fields.size(); ++i) {
        if (i > 0) {
            row.push_back(',');
        }
        if (!record.is_object()) {
            continue;
        }
        auto it = record.find(config_.csv_fields[i]);
        if (it != record.end()) {
            row += csv_value(*it);
        }
    }
    return row;
}

std::string AnnotationWriter::header() const {
    std::string row;
    for (size_t i = 0; i < config_.csv_fields.size(); ++i) {
        if (i > 0) {
            row.push_back(',');
        }
        row += csv_escape(config_.csv_fields[i]);
    }
    return row;
}

} // namespace framestream
