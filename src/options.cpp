#include "framestream/options.hpp"

#include <sstream>

namespace framestream {

namespace {

double to_double(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigError(option + " expects a number, got '" + value + "'");
}

int to_int(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigError(option + " expects an integer, got '" + value + "'");
}

} // namespace

bool parse_subscriber_args(int argc, char* argv[], ProgramKind kind, SubscriberConfig& config) {
    const bool record = kind == ProgramKind::Record;
    if (!record) {
        config.display = true;
    }

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help") {
            return false;
        } else if (arg == "--connect") {
            config.connect.push_back(next());
        } else if (arg == "--bind") {
            config.bind.push_back(next());
        } else if (arg == "--topic") {
            config.topics.push_back(next());
        } else if (arg == "--hwm") {
            config.receive_hwm = to_int(arg, next());
        } else if (arg == "--stats-interval") {
            config.stats_interval = to_double(arg, next());
        } else if (arg == "--queue-size") {
            const int size = to_int(arg, next());
            config.queue_capacity = size > 0 ? static_cast<size_t>(size) : 0;
        } else if (arg == "--max-image-mb") {
            const int megabytes = to_int(arg, next());
            config.max_decoded_bytes = megabytes > 0 ? static_cast<size_t>(megabytes) << 20 : 0;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (record && arg == "--display") {
            config.display = true;
        } else if (record && arg == "--image-dir") {
            config.image_dir = next();
        } else if (record && arg == "--log-dir") {
            config.log_dir = next();
        } else if (record && arg == "--file-id-key") {
            config.file_id_key = next();
        } else if (record && arg == "--timezone") {
            config.timezone = next();
        } else if (record && arg == "--inhibit") {
            config.inhibition_period = to_double(arg, next());
        } else if (record && arg == "--log-interval") {
            config.log_dump_interval = to_double(arg, next());
        } else if (record && arg == "--flatten") {
            config.flatten = true;
        } else if (record && arg == "--csv-field") {
            config.csv_fields.push_back(next());
        } else if (record && arg == "--encoding") {
            config.image_format = parse_image_format(next());
        } else if (record && arg == "--quality") {
            config.jpeg_quality = to_int(arg, next());
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }
    return true;
}

std::string subscriber_usage(const char* program, ProgramKind kind) {
    std::ostringstream out;
    if (kind == ProgramKind::Record) {
        out << "Frame recorder for framestream\n";
    } else {
        out << "Frame viewer for framestream\n";
    }
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --connect URL         Connect to a publisher (repeatable)\n"
        << "  --bind URL            Bind and let publishers connect (repeatable)\n"
        << "  --topic PREFIX        Subscription filter (repeatable, default: all)\n"
        << "  --hwm N               Receive high water mark (default: 8)\n"
        << "  --stats-interval S    Stats period in seconds, 0 disables (default: 5)\n"
        << "  --queue-size N        Display queue capacity (default: 8)\n"
        << "  --max-image-mb N      Largest decoded JPEG frame in MiB (default: 256)\n"
        << "  --quiet               Do not echo log records to stdout\n";
    if (kind == ProgramKind::Record) {
        out << "  --display             Also render frames\n"
            << "  --image-dir DIR       Store images in DIR\n"
            << "  --log-dir DIR         Store annotation records in DIR\n"
            << "  --file-id-key PATH    Dotted annotation key naming image files\n"
            << "  --timezone TZ         Timezone for file names (default: local)\n"
            << "  --inhibit S           Minimum seconds between persisted frames (default: 0)\n"
            << "  --log-interval S      Seconds per log file, >= 1 (default: 60)\n"
            << "  --flatten             Flatten nested annotations into dotted keys\n"
            << "  --csv-field NAME      Write CSV with this column (repeatable)\n"
            << "  --encoding jpeg|pnm   Image file format (default: jpeg)\n"
            << "  --quality N           JPEG quality 0-100 (default: 95)\n";
    }
    out << "  --help                Show this help\n";
    return out.str();
}

} // namespace framestream
