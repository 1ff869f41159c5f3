#pragma once

#include "framestream/envelope.hpp"
#include "framestream/jpeg_codec.hpp"

#include <string>

namespace framestream {

enum class RouteStatus {
    Image,
    Log,
    Dropped
};

Topic topic_from_name(const std::string& logical_topic);
const char* topic_name(Topic topic);

// Builds the payload downstream components consume. Jpeg envelopes are
// decompressed in place so that every routed image is Raw. Unknown topics
// and undecodable or oversized JPEG payloads come back as Dropped; the caller
// counts them.
RouteStatus route(Envelope& envelope, size_t max_decoded_bytes = kDefaultMaxDecodedBytes);

} // namespace framestream
