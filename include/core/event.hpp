#pragma once

#include "core/error.hpp"
#include <string>
#include <string_view>
#include <variant>

enum class OutputSource { kStdout, kStderr };

inline std::string_view OutputSourceName(OutputSource s) {
  return s == OutputSource::kStdout ? "stdout" : "stderr";
}

struct OutputEvent {
  OutputSource source;
  std::string line;
};

struct HeartbeatEvent {};

struct ResultEvent {
  bool success;
  int exit_code;
  bool timed_out = false;
};

struct ErrorEvent {
  ErrorKind kind;
  std::string message;
};

struct CompleteEvent {};

using Event = std::variant<OutputEvent, HeartbeatEvent, ResultEvent,
                           ErrorEvent, CompleteEvent>;

inline std::string_view EventTypeName(const Event &ev) {
  struct Visitor {
    std::string_view operator()(const OutputEvent &) const { return "output"; }
    std::string_view operator()(const HeartbeatEvent &) const {
      return "heartbeat";
    }
    std::string_view operator()(const ResultEvent &) const { return "result"; }
    std::string_view operator()(const ErrorEvent &) const { return "error"; }
    std::string_view operator()(const CompleteEvent &) const {
      return "complete";
    }
  };
  return std::visit(Visitor{}, ev);
}

inline bool IsTerminal(const Event &ev) {
  return std::holds_alternative<ResultEvent>(ev) ||
         std::holds_alternative<ErrorEvent>(ev);
}

// Outcome of one command. stdout_text/stderr_text are the emitted output
// lines joined with '\n', each line terminated.
struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  bool timed_out = false;
  // Local tool runs: a timed out run that produced output still counts.
  bool partial_ok = false;

  bool Success() const {
    if (timed_out) {
      return partial_ok && (!stdout_text.empty() || !stderr_text.empty());
    }
    return exit_code == 0;
  }
};
