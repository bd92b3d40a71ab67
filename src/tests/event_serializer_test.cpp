#include <gtest/gtest.h>
#include "output/event_serializer.hpp"
#include "crypto/digest.hpp"

using namespace hvault::output;

TEST(EventSerializerTest, ClassifiesByEventId) {
  EXPECT_EQ(classify(Record{{"eventid", "cowrie.session.file_download"}}), RecordKind::FileDownload);
  EXPECT_EQ(classify(Record{{"eventid", "cowrie.session.file_upload"}}), RecordKind::FileUpload);
  EXPECT_EQ(classify(Record{{"eventid", "cowrie.login.success"}}), RecordKind::GenericEvent);
  EXPECT_EQ(classify(Record{{"eventid", 42}}), RecordKind::GenericEvent);
  EXPECT_EQ(classify(Record::object()), RecordKind::GenericEvent);
}

TEST(EventSerializerTest, TransportFields) {
  EXPECT_TRUE(is_transport_field("log_level"));
  EXPECT_TRUE(is_transport_field("log_"));
  EXPECT_TRUE(is_transport_field("time"));
  EXPECT_TRUE(is_transport_field("system"));
  EXPECT_FALSE(is_transport_field("timestamp"));
  EXPECT_FALSE(is_transport_field("login"));
  EXPECT_FALSE(is_transport_field("session"));
}

TEST(EventSerializerTest, StripsTransportFields) {
  const Record entry = {
    {"eventid", "cowrie.command.input"},
    {"input", "uname -a"},
    {"session", "abc123"},
    {"log_namespace", "cowrie.ssh"},
    {"log_format", "CMD: {input}"},
    {"time", 1700000000.5},
    {"system", "SSHChannel session"}
  };

  const Record stripped = strip_transport_fields(entry);
  EXPECT_EQ(stripped, (Record{
    {"eventid", "cowrie.command.input"},
    {"input", "uname -a"},
    {"session", "abc123"}
  }));
  // Input is left untouched
  EXPECT_EQ(entry.size(), 7u);
}

TEST(EventSerializerTest, CanonicalJsonIsSortedAndCompact) {
  Record first;
  first["session"] = "abc123";
  first["eventid"] = "cowrie.login.success";
  first["password"] = "123456";

  Record second;
  second["password"] = "123456";
  second["eventid"] = "cowrie.login.success";
  second["session"] = "abc123";

  EXPECT_EQ(canonical_json(first),
            R"({"eventid":"cowrie.login.success","password":"123456","session":"abc123"})");
  EXPECT_EQ(canonical_json(first), canonical_json(second));
  EXPECT_EQ(content_hash(first), content_hash(second));
}

TEST(EventSerializerTest, ContentHashIsSha256OfCanonicalForm) {
  const Record entry = {{"session", "abc123"}, {"eventid", "cowrie.session.closed"}};
  EXPECT_EQ(content_hash(entry), hvault::crypto::sha256_hex(canonical_json(entry)));
  EXPECT_EQ(content_hash(entry).size(), 64u);
}

TEST(EventSerializerTest, InvalidUtf8CannotBeSerialized) {
  Record entry = {{"session", "abc123"}};
  entry["input"] = std::string("\xff\xfe");

  EXPECT_THROW(canonical_json(entry), nlohmann::json::type_error);
  EXPECT_NO_THROW(describe(entry));
}
