#include "framestream/frame_processor.hpp"
#include "framestream/logger.hpp"

#include <exception>

namespace framestream {

FrameProcessor::FrameProcessor(const SubscriberConfig& config, DisplayQueue* display_queue,
                               double now)
    : config_(config)
    , display_queue_(display_queue)
    , stats_(config.stats_interval, now)
    , gate_(config.inhibition_period)
    , annotation_writer_(AnnotationWriter::Config{config.csv_fields, config.flatten})
{
    if (!config_.image_dir.empty()) {
        ImageWriter::Config writer_config;
        writer_config.directory = config_.image_dir;
        writer_config.file_id_key = config_.file_id_key;
        writer_config.format = config_.image_format;
        writer_config.jpeg_quality = config_.jpeg_quality;
        image_writer_ = std::make_unique<ImageWriter>(writer_config);
    }
    if (!config_.log_dir.empty()) {
        LogWindow::Config window_config;
        window_config.directory = config_.log_dir;
        window_config.interval = config_.log_dump_interval;
        window_config.extension = annotation_writer_.extension();
        window_config.header = annotation_writer_.header();
        log_window_ = std::make_unique<LogWindow>(window_config);
    }
}

FrameProcessor::~FrameProcessor() {
    shutdown();
}

void FrameProcessor::handle_message(const std::vector<std::string>& parts, double now) {
    counters_.messages++;
    stats_.on_received();

    try {
        Envelope envelope;
        const DecodeStatus status = decode(parts, envelope);
        if (status != DecodeStatus::Ok) {
            count_decode_failure(status);
            return;
        }
        stats_.on_delay(envelope.frame_time, now);

        const RouteStatus kind = route(envelope, config_.max_decoded_bytes);
        if (kind == RouteStatus::Dropped) {
            if (envelope.topic == Topic::Unknown) {
                counters_.unknown_topics++;
            } else {
                counters_.undecodable_images++;
            }
            stats_.on_dropped();
            return;
        }

        if (kind == RouteStatus::Image) {
            counters_.images++;
        } else {
            counters_.records++;
            echo(envelope);
        }

        if (config_.persistence_enabled()) {
            persist(envelope, kind, now);
        }
        if (kind == RouteStatus::Image && display_queue_ != nullptr) {
            enqueue(envelope);
        }
    } catch (const std::exception& e) {
        counters_.internal_errors++;
        stats_.on_dropped();
        Logger::warn(std::string("Dropped message after error: ") + e.what());
    }
}

void FrameProcessor::count_decode_failure(DecodeStatus status) {
    switch (status) {
    case DecodeStatus::ShortMessage:
        counters_.short_messages++;
        break;
    case DecodeStatus::UnknownTopic:
        counters_.unknown_topics++;
        break;
    case DecodeStatus::BadEncoding:
    case DecodeStatus::Ok:
        counters_.bad_encodings++;
        break;
    }
    stats_.on_dropped();
    Logger::debug(std::string("Dropped message: ") + decode_status_name(status));
}

void FrameProcessor::persist(const Envelope& envelope, RouteStatus kind, double now) {
    if (!gate_.try_pass(now)) {
        counters_.inhibited++;
        return;
    }

    if (kind == RouteStatus::Image && image_writer_) {
        if (image_writer_->write(envelope.image, envelope.frame_time, envelope.annotation,
                                 envelope.source_id)) {
            counters_.images_written++;
        } else {
            counters_.write_failures++;
        }
    }

    if (log_window_) {
        const nlohmann::json record =
            annotation_writer_.prepare(envelope.annotation, envelope.source_id, envelope.frame_time);
        if (log_window_->append(annotation_writer_.format(record), envelope.frame_time)) {
            counters_.records_written++;
        } else {
            counters_.write_failures++;
        }
    }
}

void FrameProcessor::echo(const Envelope& envelope) {
    if (config_.quiet) {
        return;
    }
    const nlohmann::json record =
        build_record(envelope.annotation, envelope.source_id, envelope.frame_time);
    Logger::info(record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void FrameProcessor::enqueue(Envelope& envelope) {
    DisplayItem item{envelope.source_id, std::move(envelope.image)};
    if (!display_queue_->try_enqueue(std::move(item))) {
        counters_.queue_full++;
        Logger::debug("Display queue full, dropped frame from " + envelope.source_id);
    }
}

void FrameProcessor::tick(double now) {
    if (log_window_) {
        log_window_->expire(now);
    }

    StatsReport report;
    if (stats_.poll(now, report)) {
        std::string line = format_report(report);
        if (counters_.queue_full > 0) {
            line += " queue_full=" + std::to_string(counters_.queue_full);
        }
        if (counters_.write_failures > 0) {
            line += " write_failures=" + std::to_string(counters_.write_failures);
        }
        Logger::info(line);
    }
}

void FrameProcessor::shutdown() {
    if (log_window_) {
        log_window_->close();
    }
}

} // namespace framestream
