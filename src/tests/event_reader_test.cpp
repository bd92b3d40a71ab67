#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "cli/event_reader.hpp"

using namespace hvault::cli;
using hvault::output::Record;

class EventReaderTest : public ::testing::Test {
protected:
  std::vector<Record> records;

  std::size_t read(const std::string& text) {
    std::istringstream input(text);
    EventReader reader(input, [this](Record entry) { records.push_back(std::move(entry)); });
    const std::size_t forwarded = reader.run();
    skipped = reader.skipped();
    return forwarded;
  }

  std::size_t skipped{0};
};

TEST_F(EventReaderTest, ForwardsObjects) {
  const std::size_t forwarded = read(
    "{\"eventid\":\"cowrie.session.connect\",\"session\":\"a1\"}\n"
    "{\"eventid\":\"cowrie.session.closed\",\"session\":\"a1\",\"duration\":1.5}\n");

  EXPECT_EQ(forwarded, 2u);
  EXPECT_EQ(skipped, 0u);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0]["eventid"], "cowrie.session.connect");
  EXPECT_EQ(records[1]["duration"], 1.5);
}

TEST_F(EventReaderTest, SkipsBlankLines) {
  EXPECT_EQ(read("\n   \n\t\r\n{\"session\":\"a1\"}\r\n\n"), 1u);
  EXPECT_EQ(skipped, 0u);
  EXPECT_EQ(records.size(), 1u);
}

TEST_F(EventReaderTest, SkipsMalformedLines) {
  const std::size_t forwarded = read(
    "{\"session\":\"a1\"\n"
    "not json at all\n"
    "[1,2,3]\n"
    "\"just a string\"\n"
    "{\"session\":\"a2\"}\n");

  EXPECT_EQ(forwarded, 1u);
  EXPECT_EQ(skipped, 4u);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0]["session"], "a2");
}

TEST_F(EventReaderTest, LastLineWithoutNewline) {
  EXPECT_EQ(read("{\"session\":\"a1\"}\n{\"session\":\"a2\"}"), 2u);
}

TEST_F(EventReaderTest, EmptyInput) {
  EXPECT_EQ(read(""), 0u);
  EXPECT_TRUE(records.empty());
}
