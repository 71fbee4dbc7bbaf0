#ifndef BASE_EVENT_READER_HPP
#define BASE_EVENT_READER_HPP

#include "core/message_event.hpp"

#include <vector>

class IEventReader {
public:
  virtual ~IEventReader() = default;

  // Fetches the next batch of events. The definition of a "batch" is
  // implementation-specific; an empty vector means nothing new right now.
  virtual std::vector<IngestEvent> get_next_batch() = 0;

  // True once the source is exhausted and will never yield more events
  virtual bool is_finished() const = 0;
};

#endif // BASE_EVENT_READER_HPP
