#pragma once

#include "framestream/config.hpp"

#include <string>

namespace framestream {

enum class ProgramKind {
    View,
    Record
};

// Fills `config` from argv. Returns false when --help was given.
// Throws ConfigError on unknown options or malformed values; does not
// validate the result.
bool parse_subscriber_args(int argc, char* argv[], ProgramKind kind, SubscriberConfig& config);

std::string subscriber_usage(const char* program, ProgramKind kind);

} // namespace framestream
