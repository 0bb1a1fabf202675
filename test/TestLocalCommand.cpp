#include "local/local_command.hpp"
#include "local/tool_policy.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace std::chrono_literals;

namespace {

class RecordingSink : public EventSink {
public:
  void Emit(Event ev) override { events.push_back(std::move(ev)); }
  bool Cancelled() const override { return cancelled; }

  std::vector<Event> events;
  bool cancelled = false;
};

local::RunOptions Quick(std::chrono::milliseconds timeout) {
  local::RunOptions o;
  o.timeout = timeout;
  o.grace = 500ms;
  return o;
}

} // namespace

TEST(LocalCommand, SeparatesStdoutAndStderr) {
  RecordingSink sink;
  auto r = local::RunLocalCommand("echo out; echo err >&2; exit 3", Quick(5s),
                                  sink);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->stdout_text, "out\n");
  EXPECT_EQ(r->stderr_text, "err\n");
  EXPECT_EQ(r->exit_code, 3);
  EXPECT_FALSE(r->Success());
  EXPECT_EQ(sink.events.size(), 2u);
}

TEST(LocalCommand, TimeoutKeepsPartialOutput) {
  RecordingSink sink;
  const auto start = std::chrono::steady_clock::now();
  auto r = local::RunLocalCommand("echo started; sleep 30", Quick(500ms), sink);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->timed_out);
  EXPECT_EQ(r->stdout_text, "started\n");
  EXPECT_TRUE(r->Success());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(LocalCommand, SilentCommandHitsBlockingTimeout) {
  RecordingSink sink;
  auto opt = Quick(10s);
  opt.blocking_timeout = 300ms;
  auto r = local::RunLocalCommand("sleep 30", opt, sink);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::kTimeout);
}

TEST(LocalCommand, CancelledConsumerStopsCommand) {
  RecordingSink sink;
  sink.cancelled = true;
  auto r = local::RunLocalCommand("sleep 30", Quick(10s), sink);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::kConnection);
}

TEST(LocalCommand, UnterminatedLastLineIsDelivered) {
  RecordingSink sink;
  auto r = local::RunLocalCommand("printf 'a\\nb'", Quick(5s), sink);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_text, "a\nb\n");
  EXPECT_EQ(r->exit_code, 0);
}

TEST(ToolPolicy, ToolName) {
  EXPECT_EQ(toolpolicy::ToolName("nmap -sV 10.0.0.1"), "nmap");
  EXPECT_EQ(toolpolicy::ToolName("  sudo /usr/bin/ffuf -u x"), "ffuf");
  EXPECT_EQ(toolpolicy::ToolName("LANG=C nikto -h x"), "nikto");
  EXPECT_EQ(toolpolicy::ToolName(""), "");
}

TEST(ToolPolicy, Classification) {
  EXPECT_TRUE(toolpolicy::IsBlocked("ssh"));
  EXPECT_TRUE(toolpolicy::IsBlocked("nc"));
  EXPECT_FALSE(toolpolicy::IsBlocked("nmap"));
  EXPECT_TRUE(toolpolicy::IsStreaming("gobuster"));
  EXPECT_FALSE(toolpolicy::IsStreaming("ls"));
  EXPECT_EQ(toolpolicy::TimeoutFor("nmap"), std::chrono::seconds(3600));
  EXPECT_EQ(toolpolicy::TimeoutFor("ffuf"), std::chrono::seconds(1800));
  EXPECT_EQ(toolpolicy::TimeoutFor("ls"), toolpolicy::kDefaultTimeout);
}
