#include "terminal/shell_protocol.hpp"

#include <gtest/gtest.h>

using shellproto::MarkerParser;

TEST(ShellProtocol, FramedTextNeverContainsMarkerLiterally) {
  auto f = shellproto::Frame("ls -la", "7_1");
  EXPECT_EQ(f.begin, "__SHMX_BEGIN_7_1__");
  EXPECT_EQ(f.done, "__SHMX_DONE_7_1__");
  EXPECT_EQ(f.text.find(f.begin), std::string::npos);
  EXPECT_EQ(f.text.find(f.done), std::string::npos);
  EXPECT_EQ(f.text.back(), '\n');
  EXPECT_NE(f.text.find("; ls -la; "), std::string::npos);
}

TEST(ShellProtocol, MultiLineCommandIsOneBraceGroup) {
  auto f = shellproto::Frame("cd /tmp\npwd", "1_2");
  EXPECT_EQ(f.text.rfind("{ echo ", 0), 0u);
  EXPECT_NE(f.text.find("\ncd /tmp\npwd\n"), std::string::npos);
  EXPECT_EQ(f.text.substr(f.text.size() - 4), "; }\n");
  EXPECT_EQ(f.text.find(f.done), std::string::npos);
}

TEST(ShellProtocol, CommentCannotSwallowDoneEcho) {
  auto f = shellproto::Frame("echo hi # note", "1_3");
  EXPECT_NE(f.text.find("echo hi # note\n"), std::string::npos);
  EXPECT_EQ(f.text.substr(f.text.size() - 4), "; }\n");
}

TEST(ShellProtocol, IgnoresNoiseBeforeBegin) {
  auto f = shellproto::Frame("id", "1_1");
  MarkerParser p(f);
  EXPECT_EQ(p.Feed("$ leftover prompt").kind, MarkerParser::Kind::kIgnore);
  EXPECT_EQ(p.Feed("__SHMX_DONE_0_9__ 0").kind, MarkerParser::Kind::kIgnore);
  EXPECT_FALSE(p.Started());
  EXPECT_EQ(p.Feed("$ __SHMX_BEGIN_1_1__").kind, MarkerParser::Kind::kIgnore);
  EXPECT_TRUE(p.Started());

  auto out = p.Feed("uid=0(root)");
  EXPECT_EQ(out.kind, MarkerParser::Kind::kOutput);
  EXPECT_EQ(out.line, "uid=0(root)");

  auto done = p.Feed("__SHMX_DONE_1_1__ 0");
  EXPECT_EQ(done.kind, MarkerParser::Kind::kDone);
  EXPECT_EQ(done.exit_code, 0);
  EXPECT_TRUE(done.line.empty());
}

TEST(ShellProtocol, DoneMarkerAfterUnterminatedOutput) {
  auto f = shellproto::Frame("printf abc", "2_5");
  MarkerParser p(f);
  p.Feed("__SHMX_BEGIN_2_5__");
  auto done = p.Feed("abc__SHMX_DONE_2_5__ 3");
  EXPECT_EQ(done.kind, MarkerParser::Kind::kDone);
  EXPECT_EQ(done.line, "abc");
  EXPECT_EQ(done.exit_code, 3);
}

TEST(ShellProtocol, MissingExitStatusIsNegative) {
  auto f = shellproto::Frame("true", "3_3");
  MarkerParser p(f);
  p.Feed("__SHMX_BEGIN_3_3__");
  EXPECT_EQ(p.Feed("__SHMX_DONE_3_3__").exit_code, -1);
}

TEST(ShellProtocol, MarkerIdsAreUnique) {
  EXPECT_NE(shellproto::NextMarkerId(), shellproto::NextMarkerId());
}

TEST(ShellProtocol, OverheadCoversLongestId) {
  auto f = shellproto::Frame("", shellproto::NextMarkerId());
  EXPECT_LE(f.text.size(), shellproto::FramingOverhead());
}

TEST(ShellProtocol, ShellQuote) {
  EXPECT_EQ(shellproto::ShellQuote("plain"), "'plain'");
  EXPECT_EQ(shellproto::ShellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(shellproto::ShellQuote(""), "''");
}
