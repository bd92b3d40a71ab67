#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include "output/event_serializer.hpp"

namespace hvault {
namespace cli {

// Reads newline-delimited JSON events and forwards each object record
class EventReader {
public:
  using RecordSink = std::function<void(output::Record)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  EventReader(std::istream& input, RecordSink sink);


  // ---- STARTUP ----
  // Reads until end of input; returns the number of records forwarded
  std::size_t run();


  // ---- GETTERS ----
  std::size_t skipped() const { return skipped_; }

private:
  // ---- PARAMETERS ----
  std::istream& input_;
  RecordSink sink_;
  std::size_t line_number_{0};
  std::size_t skipped_{0};


  // ---- LINE PROCESSING ----
  bool process_line(const std::string& line);
};

} // namespace cli
} // namespace hvault
