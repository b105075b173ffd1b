/**
 * @file test_record.cpp
 * @brief Tests for record.hpp - spool file codec.
 */

#include "dnd/record.hpp"

#include "test_util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("ParseRecordText reads scalar and repeated fields", "[record]") {
  const dnd::Record rec = dnd::ParseRecordText(
      "created = 1700000000\n"
      "src_host = poller01\n"
      "dst_host = master01\n"
      "dst_host = master02\n"
      "cmd = echo one\n"
      "cmd = echo two\n",
      "self");
  REQUIRE(rec.created.has_value());
  REQUIRE(rec.created.value() == "1700000000");
  REQUIRE(rec.src_host.value() == "poller01");
  REQUIRE(rec.dst_hosts == std::vector<std::string>{"master01", "master02"});
  REQUIRE(rec.commands == std::vector<std::string>{"echo one", "echo two"});
  REQUIRE(rec.comments.empty());
  REQUIRE(rec.extra.empty());
}

TEST_CASE("ParseRecordText trims around the separator", "[record]") {
  const dnd::Record rec =
      dnd::ParseRecordText("  cmd\t=   /bin/echo a=b   \r\n", "self");
  REQUIRE(rec.commands.size() == 1U);
  REQUIRE(rec.commands[0] == "/bin/echo a=b");
}

TEST_CASE("ParseRecordText non-field lines become comments", "[record]") {
  const dnd::Record rec = dnd::ParseRecordText(
      "just some text\n"
      " = no key\n"
      "novalue =\n"
      "comments = explicit note\n",
      "self");
  REQUIRE(rec.comments.size() == 4U);
  REQUIRE(rec.comments[0] == "just some text");
  REQUIRE(rec.comments[1] == " = no key");
  REQUIRE(rec.comments[2] == "novalue =");
  REQUIRE(rec.comments[3] == "explicit note");
}

TEST_CASE("ParseRecordText last write wins for scalars", "[record]") {
  const dnd::Record rec = dnd::ParseRecordText(
      "src_host = a\nsrc_host = b\nprio = 1\nowner = x\nprio = 2\n", "self");
  REQUIRE(rec.src_host.value() == "b");
  REQUIRE(rec.extra.size() == 2U);
  REQUIRE(rec.extra[0].first == "prio");
  REQUIRE(rec.extra[0].second == "2");
  REQUIRE(*rec.FindExtra("owner") == "x");
  REQUIRE(rec.FindExtra("missing") == nullptr);
}

TEST_CASE("ParseRecordText maps loopback destinations to this host",
          "[record]") {
  const dnd::Record rec = dnd::ParseRecordText(
      "dst_host = localhost\ndst_host = 127.0.0.1\ndst_host = LOCALHOST\n",
      "mon01");
  REQUIRE(rec.dst_hosts ==
          std::vector<std::string>{"mon01", "mon01", "mon01"});
}

TEST_CASE("ParseRecordText empty input is a valid record", "[record]") {
  const dnd::Record rec = dnd::ParseRecordText("", "self");
  REQUIRE(!rec.created.has_value());
  REQUIRE(rec.dst_hosts.empty());
  REQUIRE(rec.comments.empty());
}

TEST_CASE("ParseRecord reports a missing file", "[record]") {
  auto r = dnd::ParseRecord("/nonexistent/dnd_notify_x", "self");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dnd::RecordError::kOpenFailed);
}

TEST_CASE("ParseRecord reads a file", "[record]") {
  dnd_test::TempDir dir;
  const std::string path = dir.Sub("entry");
  REQUIRE(dnd_test::WriteFile(path, "dst_host = h1\ncmd = true\nhello\n"));
  auto r = dnd::ParseRecord(path, "self");
  REQUIRE(r.has_value());
  REQUIRE(r.value().dst_hosts.size() == 1U);
  REQUIRE(r.value().comments == std::vector<std::string>{"hello"});
}

TEST_CASE("SerializeRecord field order", "[record]") {
  dnd::Record rec;
  rec.comments.push_back("note");
  rec.commands.push_back("c1");
  rec.dst_hosts.push_back("h1");
  rec.dst_hosts.push_back("h2");
  rec.SetExtra("prio", "high");
  rec.src_host = std::string("src");
  rec.created = std::string("123");

  const std::vector<std::string> lines = dnd::SerializeRecord(rec);
  const std::vector<std::string> want = {
      "created = 123", "src_host = src", "prio = high", "dst_host = h1",
      "dst_host = h2", "cmd = c1",       "note"};
  REQUIRE(lines == want);
  REQUIRE(dnd::RecordToString(rec) ==
          "created = 123\nsrc_host = src\nprio = high\ndst_host = h1\n"
          "dst_host = h2\ncmd = c1\nnote\n");
}

TEST_CASE("SerializeRecord strips separators from comments", "[record]") {
  dnd::Record rec;
  rec.comments.push_back("a = b == c");
  rec.dst_hosts.push_back("");
  const std::vector<std::string> lines = dnd::SerializeRecord(rec);
  REQUIRE(lines.size() == 1U);
  REQUIRE(lines[0] == "a  b  c");
}

TEST_CASE("Parse of serialized record reproduces fields", "[record]") {
  dnd::Record rec;
  rec.created = std::string("1700000000");
  rec.src_host = std::string("poller01");
  rec.dst_hosts = {"m2", "m1", "m3"};
  rec.commands = {"echo 'x=1'", "logger done"};
  rec.comments = {"first = line", "second"};
  rec.SetExtra("ticket", "42");

  const dnd::Record back = dnd::ParseRecordText(dnd::RecordToString(rec), "self");
  REQUIRE(back.created.value() == rec.created.value());
  REQUIRE(back.src_host.value() == rec.src_host.value());
  REQUIRE(back.dst_hosts == rec.dst_hosts);
  REQUIRE(back.commands == rec.commands);
  REQUIRE(back.extra == rec.extra);
  REQUIRE(back.comments == std::vector<std::string>{"first  line", "second"});
}
