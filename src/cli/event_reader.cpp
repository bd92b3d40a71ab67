#include "cli/event_reader.hpp"
#include <boost/log/trivial.hpp>

namespace hvault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

EventReader::EventReader(std::istream& input, RecordSink sink)
  : input_(input)
  , sink_(std::move(sink)) {
}


//==============================================
// STARTUP
//==============================================

std::size_t EventReader::run() {
  std::size_t forwarded = 0;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Event reader: Reading events";

  while (std::getline(input_, line)) {
    ++line_number_;
    if (process_line(line)) {
      ++forwarded;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Event reader: End of input after " << line_number_ << " lines, "
                          << forwarded << " records forwarded, " << skipped_ << " skipped";
  return forwarded;
}


//==============================================
// LINE PROCESSING
//==============================================

bool EventReader::process_line(const std::string& line) {
  if (line.find_first_not_of(" \t\r") == std::string::npos) {
    return false;
  }

  output::Record entry;
  try {
    entry = output::Record::parse(line);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Event reader: Skipping malformed line " << line_number_ << ": " << e.what();
    ++skipped_;
    return false;
  }

  if (!entry.is_object()) {
    BOOST_LOG_TRIVIAL(warning) << "Event reader: Skipping line " << line_number_ << ": not a JSON object";
    ++skipped_;
    return false;
  }

  sink_(std::move(entry));
  return true;
}

} // namespace cli
} // namespace hvault
