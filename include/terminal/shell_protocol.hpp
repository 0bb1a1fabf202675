#pragma once

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>
#include <string_view>

// namespace shellproto: BEGIN/DONE marker framing for commands written to
// an interactive shell.
//
// A command is sent as a single line
//   echo '__SHMX_'"BEGIN_<id>__"; <cmd>; echo '__SHMX_'"DONE_<id>__ $?"
// A multi-line command is wrapped in one brace group
//   { echo ...BEGIN...
//   <cmd>
//   echo ...DONE... $?; }
// so an interactive shell parses the whole group before running any of it
// and its prompts land before BEGIN or after DONE, never in between. The
// quoting split means a terminal echo of the command itself never contains
// the marker text; only the output of the echo does.
namespace shellproto {

inline constexpr std::string_view kMarkerPrefix = "__SHMX_";

struct Framed {
  std::string text;
  std::string begin;
  std::string done;
};

inline std::string NextMarkerId() {
  static std::atomic<std::uint64_t> counter{0};
  static const std::uint32_t salt = std::random_device{}();
  return std::to_string(salt) + "_" +
         std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

inline Framed Frame(const std::string &cmd, const std::string &id) {
  Framed f;
  f.begin = std::string(kMarkerPrefix) + "BEGIN_" + id + "__";
  f.done = std::string(kMarkerPrefix) + "DONE_" + id + "__";
  const std::string beginEcho = "echo '" + std::string(kMarkerPrefix) +
                                "'\"BEGIN_" + id + "__\"";
  const std::string doneEcho = "echo '" + std::string(kMarkerPrefix) +
                               "'\"DONE_" + id + "__ $?\"";
  if (cmd.find_first_of("\n#") == std::string::npos) {
    f.text = beginEcho + "; " + cmd + "; " + doneEcho + "\n";
  } else {
    f.text = "{ " + beginEcho + "\n" + cmd + "\n" + doneEcho + "; }\n";
  }
  return f;
}

// Extra bytes a framed command adds around the user command.
inline std::size_t FramingOverhead() {
  return Frame("\n", "4294967295_18446744073709551615").text.size() - 1;
}

// MarkerParser
// Classifies the lines of one framed command. Lines before BEGIN are noise
// (prompts, output of an earlier timed-out command); a marker may appear
// anywhere in a line and the text before a DONE marker is a final output
// line without terminator.
class MarkerParser {
public:
  enum class Kind { kIgnore, kOutput, kDone };

  struct Step {
    Kind kind;
    std::string line;
    int exit_code = 0;
  };

  explicit MarkerParser(const Framed &f) : begin_(f.begin), done_(f.done) {}

  bool Started() const { return started_; }

  Step Feed(std::string line) {
    if (!started_) {
      if (line.find(begin_) != std::string::npos) {
        started_ = true;
      }
      return {Kind::kIgnore, {}, 0};
    }
    auto pos = line.find(done_);
    if (pos == std::string::npos) {
      return {Kind::kOutput, std::move(line), 0};
    }
    Step s{Kind::kDone, line.substr(0, pos), ParseExit(line, pos + done_.size())};
    return s;
  }

private:
  static int ParseExit(const std::string &line, std::size_t from) {
    auto start = line.find_first_of("0123456789", from);
    if (start == std::string::npos) {
      return -1;
    }
    return std::atoi(line.c_str() + start);
  }

  std::string begin_;
  std::string done_;
  bool started_ = false;
};

// Single-quotes s for /bin/sh.
inline std::string ShellQuote(std::string_view s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

} // namespace shellproto
