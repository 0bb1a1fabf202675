#pragma once

#include "core/config.hpp"
#include "core/error.hpp"
#include "crypto/base64.hpp"
#include "crypto/sha256.hpp"
#include "logging/console.hpp"
#include "sessions/itransport.hpp"
#include "sessions/session_manager.hpp"
#include "terminal/shell_protocol.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace transfer {

enum class Method { kDirect, kChunked };
enum class SizeClass { kSmall, kMedium, kLarge };

inline std::string_view MethodName(Method m) {
  return m == Method::kDirect ? "direct" : "chunked";
}

inline std::string_view SizeClassName(SizeClass c) {
  switch (c) {
  case SizeClass::kSmall:
    return "small";
  case SizeClass::kMedium:
    return "medium";
  case SizeClass::kLarge:
    return "large";
  }
  return "unknown";
}

struct Estimate {
  SizeClass size_class;
  std::size_t chunk_size;
  // bytes per second the estimate assumed
  double throughput;
  double seconds;
};

struct Plan {
  Method method;
  SizeClass size_class;
  std::size_t chunk_size;
  std::size_t chunk_count;
};

struct TransferRecord {
  std::string source;
  std::string destination;
  std::size_t size = 0;
  std::string source_checksum;
  std::string destination_checksum;
  bool verified = false;
  Method method = Method::kDirect;
  std::size_t chunk_size = 0;
  std::size_t chunk_count = 0;
  std::chrono::milliseconds duration{0};
};

struct DownloadResult {
  std::string data;
  TransferRecord record;
};

struct PerformanceReport {
  std::uint64_t transfers = 0;
  std::uint64_t failures = 0;
  std::uint64_t bytes = 0;
  double average_seconds = 0;
  // bytes per second over all successful transfers, 0 before the first one
  double average_throughput = 0;
};

inline SizeClass ClassifySize(std::size_t size,
                              const config::TransferOptions &opt) {
  if (size < opt.small_limit) {
    return SizeClass::kSmall;
  }
  if (size < opt.medium_limit) {
    return SizeClass::kMedium;
  }
  return SizeClass::kLarge;
}

// Relative speed of a transport compared with SSH.
inline double TransportSpeedFactor(TransportKind kind) {
  return kind == TransportKind::kSsh ? 1.0 : 0.5;
}

// Pure. Without an observed throughput the nominal rate of the size class,
// scaled by the transport factor, is used.
inline Estimate EstimateTransferTime(std::size_t size,
                                     std::optional<double> observedThroughput,
                                     const config::TransferOptions &opt = {},
                                     TransportKind kind = TransportKind::kSsh) {
  Estimate e{};
  e.size_class = ClassifySize(size, opt);
  double nominal = 0;
  switch (e.size_class) {
  case SizeClass::kSmall:
    e.chunk_size = opt.small_chunk;
    nominal = opt.small_rate;
    break;
  case SizeClass::kMedium:
    e.chunk_size = opt.medium_chunk;
    nominal = opt.medium_rate;
    break;
  case SizeClass::kLarge:
    e.chunk_size = opt.large_chunk;
    nominal = opt.large_rate;
    break;
  }
  e.throughput = observedThroughput && *observedThroughput > 0
                     ? *observedThroughput
                     : nominal * TransportSpeedFactor(kind);
  e.seconds = static_cast<double>(size) / e.throughput + opt.verify_overhead_s;
  return e;
}

// Fixed text of an upload command around the base64 payload.
inline std::size_t UploadCommandOverhead(const std::string &destination) {
  return std::string("printf '%s' '' | openssl base64 -d -A >> ").size() +
         shellproto::ShellQuote(destination).size() +
         shellproto::FramingOverhead();
}

// Largest raw chunk whose encoded upload command fits in maxCommandLength.
inline std::size_t MaxRawPerCommand(std::size_t maxCommandLength,
                                    const std::string &destination) {
  const std::size_t overhead = UploadCommandOverhead(destination);
  if (maxCommandLength <= overhead + 4) {
    return 0;
  }
  return (maxCommandLength - overhead) / 4 * 3;
}

// The method is decided once per transfer: direct strictly below the
// effective threshold, chunked at or above it. The effective threshold is
// the configured one, lowered when the channel cannot carry that much in one
// command.
inline Plan PlanTransfer(std::size_t size, const config::TransferOptions &opt,
                         std::size_t maxRawPerCommand) {
  const auto est = EstimateTransferTime(size, std::nullopt, opt);
  Plan p{};
  p.size_class = est.size_class;
  const std::size_t threshold =
      std::min(opt.direct_threshold, maxRawPerCommand + 1);
  if (size < threshold) {
    p.method = Method::kDirect;
    p.chunk_size = size;
    p.chunk_count = 1;
    return p;
  }
  p.method = Method::kChunked;
  std::size_t chunk = std::min(est.chunk_size, maxRawPerCommand);
  chunk -= chunk % 3;
  p.chunk_size = std::max<std::size_t>(chunk, 3);
  p.chunk_count = (size + p.chunk_size - 1) / p.chunk_size;
  return p;
}

// TransferEngine
// Checksum-verified file transfer on top of command execution. Payloads
// travel base64 encoded inside ordinary shell commands; both ends compute
// SHA-256 and the transfer only succeeds when the digests match.
// Threading model:
// - Stateless apart from the performance counters; any number of transfers
//   may run concurrently, commands within one session are serialized by the
//   session itself
class TransferEngine {
public:
  using Clock = std::chrono::steady_clock;

  TransferEngine(config::TransferOptions options, config::Timeouts timeouts)
      : options_(options), timeouts_(timeouts) {}

  Result<TransferRecord> Upload(ICommandRunner &runner, std::string_view data,
                                const std::string &destination) {
    const auto start = Clock::now();
    TransferRecord rec;
    rec.source = "memory";
    rec.destination = destination;
    rec.size = data.size();
    auto sum = crypto::Sha256Hex(data);
    if (!sum) {
      return Failed(sum.error());
    }
    rec.source_checksum = *sum;

    auto codec = ProbeCodec(runner, start);
    if (!codec) {
      return Failed(codec.error());
    }
    const Plan plan =
        PlanTransfer(data.size(), options_,
                     MaxRawPerCommand(runner.MaxCommandLength(), destination));
    rec.method = plan.method;
    rec.chunk_size = plan.chunk_size;
    rec.chunk_count = plan.chunk_count;
    const std::string quoted = shellproto::ShellQuote(destination);

    for (std::size_t i = 0; i < plan.chunk_count; ++i) {
      const std::size_t off = i * plan.chunk_size;
      std::string_view piece =
          plan.method == Method::kDirect
              ? data
              : data.substr(off, std::min(plan.chunk_size, data.size() - off));
      const std::string cmd = "printf '%s' '" + crypto::Base64Encode(piece) +
                              "' | " + DecodeCommand(*codec) +
                              (i == 0 ? " > " : " >> ") + quoted;
      auto st = RunChecked(runner, cmd, start,
                           "write chunk " + std::to_string(i + 1) + "/" +
                               std::to_string(plan.chunk_count));
      if (!st) {
        Cleanup(runner, quoted);
        return Failed(st.error());
      }
    }

    auto remote = RemoteChecksum(runner, quoted, start);
    if (!remote) {
      Cleanup(runner, quoted);
      return Failed(remote.error());
    }
    rec.destination_checksum = *remote;
    if (rec.destination_checksum != rec.source_checksum) {
      Cleanup(runner, quoted);
      return Failed(Error{ErrorKind::kIntegrity,
                          "checksum mismatch for " + destination +
                              ": local " + rec.source_checksum +
                              " remote " + rec.destination_checksum});
    }
    rec.verified = true;
    rec.duration = Elapsed(start);
    Account(rec);
    return rec;
  }

  Result<DownloadResult> Download(ICommandRunner &runner,
                                  const std::string &source) {
    const auto start = Clock::now();
    DownloadResult out;
    TransferRecord &rec = out.record;
    rec.source = source;
    rec.destination = "memory";
    const std::string quoted = shellproto::ShellQuote(source);

    auto size = RunChecked(runner, "wc -c < " + quoted, start, "stat");
    if (!size) {
      return Failed(size.error());
    }
    auto digits = size->stdout_text.find_first_of("0123456789");
    if (digits == std::string::npos) {
      return Failed(Error{ErrorKind::kTransfer,
                          "cannot read size of " + source});
    }
    rec.size = static_cast<std::size_t>(
        std::strtoull(size->stdout_text.c_str() + digits, nullptr, 10));

    auto remote = RemoteChecksum(runner, quoted, start);
    if (!remote) {
      return Failed(remote.error());
    }
    rec.source_checksum = *remote;

    auto codec = ProbeCodec(runner, start);
    if (!codec) {
      return Failed(codec.error());
    }
    // Output is not bound by the command line limit; only the configured
    // threshold and size class matter.
    const Plan plan = PlanTransfer(rec.size, options_, rec.size + 1);
    rec.method = plan.method;
    rec.chunk_size = plan.chunk_size;
    rec.chunk_count = plan.chunk_count;
    out.data.reserve(rec.size);

    for (std::size_t i = 0; i < plan.chunk_count; ++i) {
      std::string cmd =
          plan.method == Method::kDirect
              ? EncodeFileCommand(*codec, quoted)
              : "dd if=" + quoted + " bs=" + std::to_string(plan.chunk_size) +
                    " skip=" + std::to_string(i) + " count=1 2>/dev/null | " +
                    EncodePipeCommand(*codec);
      auto r = RunChecked(runner, cmd, start,
                          "read chunk " + std::to_string(i + 1) + "/" +
                              std::to_string(plan.chunk_count));
      if (!r) {
        return Failed(r.error());
      }
      auto bytes = crypto::Base64Decode(crypto::FilterBase64(r->stdout_text));
      if (!bytes) {
        return Failed(bytes.error());
      }
      out.data += *bytes;
    }

    auto local = crypto::Sha256Hex(out.data);
    if (!local) {
      return Failed(local.error());
    }
    rec.destination_checksum = *local;
    if (rec.destination_checksum != rec.source_checksum) {
      return Failed(Error{ErrorKind::kIntegrity,
                          "checksum mismatch for " + source + ": remote " +
                              rec.source_checksum + " local " +
                              rec.destination_checksum});
    }
    rec.verified = true;
    rec.duration = Elapsed(start);
    Account(rec);
    return out;
  }

  // Session-addressed variants; an unknown session is reported as NotFound.
  Result<TransferRecord> Upload(SessionManager &manager, const std::string &id,
                                std::string_view data,
                                const std::string &destination) {
    if (auto s = manager.Get(id); !s) {
      return std::unexpected(s.error());
    }
    SessionCommandRunner runner(manager, id);
    return Upload(runner, data, destination);
  }

  Result<DownloadResult> Download(SessionManager &manager,
                                  const std::string &id,
                                  const std::string &source) {
    if (auto s = manager.Get(id); !s) {
      return std::unexpected(s.error());
    }
    SessionCommandRunner runner(manager, id);
    return Download(runner, source);
  }

  PerformanceReport Report() const {
    std::lock_guard lk(stats_mu_);
    return stats_;
  }

  const config::TransferOptions &Options() const { return options_; }

private:
  enum class Codec { kBase64, kOpenssl };

  Result<Codec> ProbeCodec(ICommandRunner &runner, Clock::time_point start) {
    auto r = RunChecked(runner,
                        "if command -v base64 >/dev/null 2>&1; then echo "
                        "base64; elif command -v openssl >/dev/null 2>&1; then "
                        "echo openssl; else echo none; fi",
                        start, "probe encoder");
    if (!r) {
      return std::unexpected(r.error());
    }
    if (r->stdout_text.find("base64") != std::string::npos) {
      return Codec::kBase64;
    }
    if (r->stdout_text.find("openssl") != std::string::npos) {
      return Codec::kOpenssl;
    }
    return MakeError(ErrorKind::kTransfer,
                     "remote has neither base64 nor openssl");
  }

  static std::string DecodeCommand(Codec c) {
    return c == Codec::kBase64 ? "base64 -d" : "openssl base64 -d -A";
  }

  // GNU base64 needs -w 0 to keep one line; other builds wrap and the
  // newlines are stripped.
  static std::string EncodeFileCommand(Codec c, const std::string &quoted) {
    if (c == Codec::kBase64) {
      return "{ base64 -w 0 " + quoted + " 2>/dev/null || base64 " + quoted +
             "; } | tr -d '\\n'";
    }
    return "openssl base64 -A -in " + quoted;
  }

  static std::string EncodePipeCommand(Codec c) {
    return c == Codec::kBase64 ? "base64 | tr -d '\\n'" : "openssl base64 -A";
  }

  Result<std::string> RemoteChecksum(ICommandRunner &runner,
                                     const std::string &quoted,
                                     Clock::time_point start) {
    const std::string cmd =
        "if command -v sha256sum >/dev/null 2>&1; then sha256sum " + quoted +
        " | cut -d' ' -f1; elif command -v shasum >/dev/null 2>&1; then "
        "shasum -a 256 " +
        quoted +
        " | cut -d' ' -f1; else openssl dgst -sha256 " + quoted +
        " | awk '{print $NF}'; fi";
    auto r = RunChecked(runner, cmd, start, "checksum");
    if (!r) {
      return std::unexpected(r.error());
    }
    std::string digest = crypto::ExtractHexDigest(r->stdout_text);
    if (digest.empty()) {
      return MakeError(ErrorKind::kTransfer,
                       "no checksum in remote output: " + r->stdout_text);
    }
    return digest;
  }

  // Runs one step under the chunk timeout, bounded by the total deadline.
  // Any failure, including a non-zero exit, is a transfer error.
  Result<CommandResult> RunChecked(ICommandRunner &runner,
                                   const std::string &cmd,
                                   Clock::time_point start,
                                   const std::string &step) {
    const auto left = timeouts_.transfer_total - Elapsed(start);
    if (left.count() <= 0) {
      return MakeError(ErrorKind::kTransfer,
                       step + ": transfer exceeded total timeout");
    }
    auto r = runner.Run(cmd, std::min(timeouts_.transfer_chunk, left));
    if (!r) {
      if (r.error().kind == ErrorKind::kNotFound) {
        return std::unexpected(r.error());
      }
      return MakeError(ErrorKind::kTransfer, step + ": " + r.error().message);
    }
    if (r->exit_code != 0) {
      return MakeError(ErrorKind::kTransfer,
                       step + ": exit " + std::to_string(r->exit_code) + " " +
                           r->stdout_text + r->stderr_text);
    }
    return r;
  }

  void Cleanup(ICommandRunner &runner, const std::string &quoted) {
    auto r = runner.Run("rm -f " + quoted, timeouts_.transfer_chunk);
    if (!r) {
      logging::Warn("transfer", "", "cleanup of " + quoted +
                                        " failed: " + r.error().message);
    }
  }

  std::unexpected<Error> Failed(Error err) {
    {
      std::lock_guard lk(stats_mu_);
      ++stats_.failures;
    }
    logging::Warn("transfer", "",
                  std::string(ErrorKindName(err.kind)) + ": " + err.message);
    return std::unexpected(std::move(err));
  }

  void Account(const TransferRecord &rec) {
    std::lock_guard lk(stats_mu_);
    const double secs = std::max(0.001, rec.duration.count() / 1000.0);
    total_seconds_ += secs;
    ++stats_.transfers;
    stats_.bytes += rec.size;
    stats_.average_seconds = total_seconds_ / stats_.transfers;
    stats_.average_throughput = stats_.bytes / total_seconds_;
  }

  static std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                 start);
  }

  config::TransferOptions options_;
  config::Timeouts timeouts_;
  mutable std::mutex stats_mu_;
  PerformanceReport stats_;
  double total_seconds_ = 0;
};

} // namespace transfer
