#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Turns raw byte chunks into lines. Partial reads are kept until the
// terminating '\n' arrives; carriage returns are dropped so "\r\n" from a
// terminal yields the same lines as "\n" from a pipe.
class LineBuffer {
public:
  template <typename Fn> void Feed(std::string_view bytes, Fn &&onLine) {
    for (char c : bytes) {
      if (c == '\r') {
        continue;
      }
      if (c == '\n') {
        onLine(std::move(partial_));
        partial_.clear();
        continue;
      }
      partial_.push_back(c);
    }
  }

  std::vector<std::string> Feed(std::string_view bytes) {
    std::vector<std::string> out;
    Feed(bytes, [&out](std::string line) { out.push_back(std::move(line)); });
    return out;
  }

  // Returns the unterminated tail as a final line, if any.
  std::optional<std::string> Flush() {
    if (partial_.empty()) {
      return std::nullopt;
    }
    std::string line = std::move(partial_);
    partial_.clear();
    return line;
  }

  bool HasPartial() const { return !partial_.empty(); }
  void Clear() { partial_.clear(); }

private:
  std::string partial_;
};
