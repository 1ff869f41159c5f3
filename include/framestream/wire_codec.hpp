#pragma once

#include "framestream/envelope.hpp"

#include <string>
#include <vector>

namespace framestream {

// Multipart layout, one message per frame:
//
//   image topics: [topic, source_id, frame_time, meta, buffer, annotation]
//   LogFrame:     [topic, source_id, frame_time, annotation]
//
// topic may carry a "/<source_id>" suffix. frame_time, meta and annotation
// are JSON text; meta is {"dtype": "...", "shape": [...]}. An empty
// annotation part stands for "no annotation".
constexpr size_t kImageMessageParts = 6;
constexpr size_t kLogMessageParts = 4;

enum class DecodeStatus {
    Ok,
    ShortMessage,
    UnknownTopic,
    BadEncoding
};

const char* decode_status_name(DecodeStatus status);

std::string strip_topic_suffix(const std::string& raw_topic, const std::string& source_id);

// Pure and non-throwing: every malformed input maps to a status.
// `out` is only complete when Ok is returned.
DecodeStatus decode(const std::vector<std::string>& parts, Envelope& out);

std::vector<std::string> encode_image(const std::string& source_id,
                                      double frame_time,
                                      const Image& image,
                                      const nlohmann::json& annotation,
                                      bool suffix_topic = false);

std::vector<std::string> encode_log(const std::string& source_id,
                                    double frame_time,
                                    const nlohmann::json& annotation,
                                    bool suffix_topic = false);

} // namespace framestream
