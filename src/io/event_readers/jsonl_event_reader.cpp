#include "jsonl_event_reader.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <iostream>
#include <stdexcept>

JsonLinesEventReader::JsonLinesEventReader(const std::string &path,
                                           bool follow)
    : input_(&std::cin), follow_(follow) {
  if (path == "-") {
    LOG(LogLevel::INFO, LogComponent::IO_INGEST,
        "Reading message events from standard input.");
    return;
  }

  file_stream_.open(path);
  if (!file_stream_.is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_INGEST,
        "Failed to open event source file: " << path);
    throw std::runtime_error("Failed to open event source file: " + path);
  }
  input_ = &file_stream_;
  LOG(LogLevel::INFO, LogComponent::IO_INGEST,
      "Reading message events from " << path
                                     << (follow_ ? " (following)" : ""));
}

JsonLinesEventReader::JsonLinesEventReader(std::istream &input, bool follow)
    : input_(&input), follow_(follow) {}

JsonLinesEventReader::~JsonLinesEventReader() {
  LOG(LogLevel::INFO, LogComponent::IO_INGEST,
      "JsonLinesEventReader closed. Lines read: "
          << line_number_ << ", malformed: " << malformed_lines_);
}

void JsonLinesEventReader::handle_line(const std::string &line,
                                       std::vector<IngestEvent> &batch) {
  static LabeledCounter *malformed_counter =
      MetricsManager::instance().register_labeled_counter(
          "gw_ingest_malformed_lines_total",
          "Ingest lines that could not be parsed into an event.");

  if (Utils::trim_copy(line).empty())
    return;
  ++line_number_;

  if (auto event = parse_ingest_line(line)) {
    batch.push_back(std::move(*event));
    return;
  }

  ++malformed_lines_;
  malformed_counter->increment();
  LOG(LogLevel::WARN, LogComponent::IO_INGEST,
      "Skipping malformed event at line " << line_number_);
}

std::vector<IngestEvent> JsonLinesEventReader::get_next_batch() {
  static Histogram *batch_fetch_timer =
      MetricsManager::instance().register_histogram(
          "gw_ingest_batch_fetch_duration_seconds",
          "Latency of fetching a batch of events from the source.");
  ScopedTimer timer(*batch_fetch_timer);

  std::vector<IngestEvent> batch;
  if (finished_)
    return batch;

  batch.reserve(BATCH_SIZE);
  std::string line;
  while (batch.size() < BATCH_SIZE && std::getline(*input_, line)) {
    if (input_->eof()) {
      // No trailing newline: the writer may still be mid-line
      if (follow_) {
        partial_line_ += line;
        break;
      }
    }
    if (!partial_line_.empty()) {
      line = partial_line_ + line;
      partial_line_.clear();
    }
    handle_line(line, batch);
  }

  if (input_->eof()) {
    if (follow_) {
      input_->clear();
    } else {
      if (!partial_line_.empty()) {
        handle_line(partial_line_, batch);
        partial_line_.clear();
      }
      finished_ = true;
    }
  } else if (input_->bad()) {
    LOG(LogLevel::ERROR, LogComponent::IO_INGEST,
        "Event source stream failed after line " << line_number_);
    finished_ = true;
  }

  if (!batch.empty())
    LOG(LogLevel::DEBUG, LogComponent::IO_INGEST,
        "Read " << batch.size() << " events, line number " << line_number_);
  return batch;
}
