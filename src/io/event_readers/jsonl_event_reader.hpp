#ifndef JSONL_EVENT_READER_HPP
#define JSONL_EVENT_READER_HPP

#include "base_event_reader.hpp"

#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

// Reads newline-delimited JSON events from a file, or from standard input
// when the path is "-". In follow mode the end of the file is not the end of
// the source, so a growing file can be tailed.
class JsonLinesEventReader : public IEventReader {
public:
  JsonLinesEventReader(const std::string &path, bool follow);
  // Reads from an existing stream; used for standard input and tests
  JsonLinesEventReader(std::istream &input, bool follow);
  ~JsonLinesEventReader() override;

  std::vector<IngestEvent> get_next_batch() override;
  bool is_finished() const override { return finished_; }

  uint64_t lines_read() const { return line_number_; }
  uint64_t malformed_lines() const { return malformed_lines_; }

private:
  void handle_line(const std::string &line, std::vector<IngestEvent> &batch);

  std::ifstream file_stream_;
  std::istream *input_;
  bool follow_;
  bool finished_ = false;
  std::string partial_line_;
  uint64_t line_number_ = 0;
  uint64_t malformed_lines_ = 0;
  static constexpr size_t BATCH_SIZE = 1000;
};

#endif // JSONL_EVENT_READER_HPP
