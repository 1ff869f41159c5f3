#include "framestream/wire_codec.hpp"
#include "framestream/time_format.hpp"
#include "framestream/topic_router.hpp"

namespace framestream {

namespace {

using json = nlohmann::json;

bool parse_json(const std::string& text, json& out) {
    out = json::parse(text, nullptr, false);
    return !out.is_discarded();
}

bool decode_frame_time(const std::string& part, double& frame_time) {
    json value;
    if (!parse_json(part, value) || !value.is_number()) {
        return false;
    }
    frame_time = value.get<double>();
    return is_valid_frame_time(frame_time);
}

bool decode_meta(const std::string& part, Image& image) {
    json meta;
    if (!parse_json(part, meta) || !meta.is_object()) {
        return false;
    }
    auto dtype = meta.find("dtype");
    auto shape = meta.find("shape");
    if (dtype == meta.end() || !dtype->is_string() ||
        shape == meta.end() || !shape->is_array()) {
        return false;
    }
    image.dtype = dtype->get<std::string>();
    image.shape.clear();
    for (const auto& dim : *shape) {
        if (!dim.is_number_integer()) {
            return false;
        }
        image.shape.push_back(dim.get<int>());
    }
    return true;
}

bool decode_annotation(const std::string& part, json& annotation) {
    if (part.empty()) {
        annotation = json::object();
        return true;
    }
    if (!parse_json(part, annotation)) {
        return false;
    }
    if (annotation.is_null()) {
        annotation = json::object();
    }
    return true;
}

std::string encode_frame_time(double frame_time) {
    return json(frame_time).dump();
}

std::string encode_annotation(const json& annotation) {
    if (annotation.is_null()) {
        return std::string();
    }
    return annotation.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string wire_topic(Topic topic, const std::string& source_id, bool suffix_topic) {
    std::string name = topic_name(topic);
    if (suffix_topic) {
        name += "/" + source_id;
    }
    return name;
}

} // namespace

const char* decode_status_name(DecodeStatus status) {
    switch (status) {
    case DecodeStatus::Ok:
        return "ok";
    case DecodeStatus::ShortMessage:
        return "short_message";
    case DecodeStatus::UnknownTopic:
        return "unknown_topic";
    case DecodeStatus::BadEncoding:
        return "bad_encoding";
    }
    return "unknown";
}

std::string strip_topic_suffix(const std::string& raw_topic, const std::string& source_id) {
    const std::string suffix = "/" + source_id;
    if (raw_topic.size() > suffix.size() &&
        raw_topic.compare(raw_topic.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return raw_topic.substr(0, raw_topic.size() - suffix.size());
    }
    return raw_topic;
}

DecodeStatus decode(const std::vector<std::string>& parts, Envelope& out) {
    if (parts.size() < 2) {
        return DecodeStatus::ShortMessage;
    }

    out.source_id = parts[1];
    out.topic = topic_from_name(strip_topic_suffix(parts[0], out.source_id));

    switch (out.topic) {
    case Topic::Video:
    case Topic::Jpeg: {
        if (parts.size() != kImageMessageParts) {
            return DecodeStatus::ShortMessage;
        }
        if (!decode_frame_time(parts[2], out.frame_time) ||
            !decode_meta(parts[3], out.image) ||
            !decode_annotation(parts[5], out.annotation)) {
            return DecodeStatus::BadEncoding;
        }
        out.image.data.assign(parts[4].begin(), parts[4].end());
        if (out.topic == Topic::Video) {
            out.image.encoding = ImageEncoding::Raw;
            if (out.image.data.empty() ||
                expected_byte_size(out.image.dtype, out.image.shape) != out.image.data.size()) {
                return DecodeStatus::BadEncoding;
            }
        } else {
            out.image.encoding = ImageEncoding::Jpeg;
            if (out.image.data.empty()) {
                return DecodeStatus::BadEncoding;
            }
        }
        return DecodeStatus::Ok;
    }
    case Topic::Log:
        if (parts.size() != kLogMessageParts) {
            return DecodeStatus::ShortMessage;
        }
        if (!decode_frame_time(parts[2], out.frame_time) ||
            !decode_annotation(parts[3], out.annotation)) {
            return DecodeStatus::BadEncoding;
        }
        out.image = Image();
        return DecodeStatus::Ok;
    case Topic::Unknown:
        break;
    }
    return DecodeStatus::UnknownTopic;
}

std::vector<std::string> encode_image(const std::string& source_id,
                                      double frame_time,
                                      const Image& image,
                                      const nlohmann::json& annotation,
                                      bool suffix_topic) {
    const Topic topic = image.encoding == ImageEncoding::Jpeg ? Topic::Jpeg : Topic::Video;
    json meta = {{"dtype", image.dtype}, {"shape", image.shape}};

    std::vector<std::string> parts;
    parts.reserve(kImageMessageParts);
    parts.push_back(wire_topic(topic, source_id, suffix_topic));
    parts.push_back(source_id);
    parts.push_back(encode_frame_time(frame_time));
    parts.push_back(meta.dump());
    parts.emplace_back(image.data.begin(), image.data.end());
    parts.push_back(encode_annotation(annotation));
    return parts;
}

std::vector<std::string> encode_log(const std::string& source_id,
                                    double frame_time,
                                    const nlohmann::json& annotation,
                                    bool suffix_topic) {
    std::vector<std::string> parts;
    parts.reserve(kLogMessageParts);
    parts.push_back(wire_topic(Topic::Log, source_id, suffix_topic));
    parts.push_back(source_id);
    parts.push_back(encode_frame_time(frame_time));
    parts.push_back(encode_annotation(annotation));
    return parts;
}

} // namespace framestream
