#pragma once

#include "framestream/options.hpp"

namespace framestream {

// Shared main() of the viewer and recorder: parses options, installs signal
// handlers, runs the render thread when display is enabled and the
// subscriber loop on the calling thread. Returns the process exit code.
int run_subscriber_app(int argc, char* argv[], ProgramKind kind);

} // namespace framestream
