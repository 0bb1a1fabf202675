#pragma once

#include "core/config.hpp"
#include "core/event_channel.hpp"
#include "core/worker_pool.hpp"
#include "crypto/base64.hpp"
#include "http/reply.hpp"
#include "local/local_command.hpp"
#include "local/tool_policy.hpp"
#include "sessions/session_manager.hpp"
#include "transfer/transfer_engine.hpp"
#include "util/time.hpp"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace api {

inline std::string Dump(const json &j) {
  // command output is not guaranteed to be valid UTF-8
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline json EventToJson(const Event &ev) {
  json j;
  j["type"] = std::string(EventTypeName(ev));
  if (auto *o = std::get_if<OutputEvent>(&ev)) {
    j["source"] = std::string(OutputSourceName(o->source));
    j["line"] = o->line;
  } else if (auto *r = std::get_if<ResultEvent>(&ev)) {
    j["success"] = r->success;
    j["return_code"] = r->exit_code;
    j["timed_out"] = r->timed_out;
  } else if (auto *e = std::get_if<ErrorEvent>(&ev)) {
    j["kind"] = std::string(ErrorKindName(e->kind));
    j["message"] = e->message;
  }
  return j;
}

inline json SummaryToJson(const SessionSummary &s) {
  json j{{"session_id", s.id},
         {"type", std::string(TransportKindName(s.kind))},
         {"state", std::string(TransportStateName(s.state))},
         {"connected", s.connected},
         {"created_at", timeutil::IsoTime(s.created_at)},
         {"last_activity", timeutil::IsoTime(s.last_activity)},
         {"command_count", s.command_count},
         {"metadata", s.metadata}};
  if (s.last_trigger) {
    const auto &t = *s.last_trigger;
    j["last_trigger"] = {{"command", t.command},
                         {"finished", t.finished},
                         {"success", t.success},
                         {"return_code", t.exit_code},
                         {"timed_out", t.timed_out},
                         {"output", t.output},
                         {"error", t.error}};
  }
  return j;
}

inline json RecordToJson(const transfer::TransferRecord &r) {
  return json{{"source", r.source},
              {"destination", r.destination},
              {"size", r.size},
              {"source_checksum", r.source_checksum},
              {"destination_checksum", r.destination_checksum},
              {"verified", r.verified},
              {"method", std::string(transfer::MethodName(r.method))},
              {"chunk_size", r.chunk_size},
              {"chunk_count", r.chunk_count},
              {"duration_ms", r.duration.count()}};
}

inline json ResultToJson(const CommandResult &r) {
  return json{{"success", r.Success()},
              {"stdout", r.stdout_text},
              {"stderr", r.stderr_text},
              {"return_code", r.exit_code},
              {"timed_out", r.timed_out},
              {"partial_results", r.timed_out && r.Success()}};
}

inline HttpResponse JsonResponse(http::status status, const json &body,
                                 unsigned version = 11) {
  HttpResponse res{status, version};
  res.set(http::field::content_type, "application/json");
  res.body() = Dump(body);
  return res;
}

inline HttpResponse ErrorResponse(const Error &err, unsigned version = 11) {
  return JsonResponse(static_cast<http::status>(HttpStatusFor(err.kind)),
                      json{{"success", false},
                           {"error", err.message},
                           {"kind", std::string(ErrorKindName(err.kind))}},
                      version);
}

inline std::optional<std::chrono::milliseconds> TimeoutField(const json &body) {
  if (!body.contains("timeout") || !body["timeout"].is_number()) {
    return std::nullopt;
  }
  double secs = body["timeout"].get<double>();
  if (secs <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(static_cast<long long>(secs * 1000));
}

inline std::optional<std::string> StringField(const json &body,
                                              const char *key) {
  if (!body.contains(key) || !body[key].is_string()) {
    return std::nullopt;
  }
  return body[key].get<std::string>();
}

// Router
// Maps JSON requests onto the session manager, the transfer engine and the
// local executor. Streamed executions come back as StreamReply and are
// written by the server as server-sent events.
class Router {
public:
  Router(SessionManager &manager, transfer::TransferEngine &transfers,
         WorkerPool &pool, config::Timeouts timeouts)
      : manager_(manager), transfers_(transfers), pool_(pool),
        timeouts_(timeouts) {}

  Reply Handle(const HttpRequest &req) {
    std::string path(req.target());
    if (auto q = path.find('?'); q != std::string::npos) {
      path.resize(q);
    }
    std::vector<std::string> parts;
    boost::algorithm::split(parts, path, boost::algorithm::is_any_of("/"),
                            boost::algorithm::token_compress_on);
    std::erase_if(parts, [](const std::string &p) { return p.empty(); });

    json body = json::object();
    if (!req.body().empty()) {
      body = json::parse(req.body(), nullptr, false);
      if (body.is_discarded() || !body.is_object()) {
        return Bad("request body must be a JSON object");
      }
    }
    const auto verb = req.method();

    if (parts.size() == 1 && parts[0] == "health" && verb == http::verb::get) {
      return Health();
    }
    if (parts.size() < 2 || parts[0] != "api") {
      return NotFound(path);
    }
    if (parts.size() == 2 && parts[1] == "command" &&
        verb == http::verb::post) {
      return LocalCommand(body);
    }
    if (parts.size() == 3 && parts[1] == "transfer" &&
        parts[2] == "estimate" && verb == http::verb::post) {
      return Estimate(body);
    }
    if (parts[1] != "sessions") {
      return NotFound(path);
    }
    if (parts.size() == 2 && verb == http::verb::get) {
      return ListSessions();
    }
    if (parts.size() == 3 && parts[2] == "ssh" && verb == http::verb::post) {
      return CreateSsh(body);
    }
    if (parts.size() == 3 && parts[2] == "listener" &&
        verb == http::verb::post) {
      return CreateListener(body);
    }
    if (parts.size() == 3 && verb == http::verb::get) {
      return GetSession(parts[2]);
    }
    if (parts.size() == 3 && verb == http::verb::delete_) {
      const bool removed = manager_.Stop(parts[2]);
      return JsonResponse(http::status::ok,
                          json{{"success", true}, {"stopped", removed}});
    }
    if (parts.size() == 4 && verb == http::verb::post) {
      const std::string &id = parts[2];
      const std::string &op = parts[3];
      if (op == "command") {
        return SessionCommand(id, body);
      }
      if (op == "payload") {
        return Payload(id, body);
      }
      if (op == "upload") {
        return Upload(id, body);
      }
      if (op == "download") {
        return Download(id, body);
      }
    }
    return NotFound(path);
  }

private:
  static HttpResponse Bad(const std::string &msg) {
    return ErrorResponse(Error{ErrorKind::kInvalidArgument, msg});
  }

  static HttpResponse NotFound(const std::string &path) {
    return ErrorResponse(Error{ErrorKind::kNotFound, "no route for " + path});
  }

  static StreamReply Stream(std::shared_ptr<EventChannel> channel) {
    return StreamReply{std::move(channel),
                       [](const Event &ev) { return Dump(EventToJson(ev)); }};
  }

  HttpResponse Health() {
    const auto report = transfers_.Report();
    return JsonResponse(
        http::status::ok,
        json{{"status", "ok"},
             {"sessions", manager_.Count()},
             {"transfers",
              {{"completed", report.transfers},
               {"failed", report.failures},
               {"bytes", report.bytes},
               {"average_seconds", report.average_seconds},
               {"average_throughput", report.average_throughput}}}});
  }

  Reply LocalCommand(const json &body) {
    auto command = StringField(body, "command");
    if (!command || command->empty()) {
      return Bad("command required");
    }
    const std::string tool = toolpolicy::ToolName(*command);
    if (toolpolicy::IsBlocked(tool)) {
      return ErrorResponse(Error{
          ErrorKind::kInvalidArgument,
          tool + " is interactive or holds a connection; use an ssh or "
                 "listener session instead"});
    }
    local::RunOptions opt;
    opt.timeout = TimeoutField(body).value_or(toolpolicy::TimeoutFor(tool));
    opt.grace = timeouts_.process_grace;
    const bool stream = body.contains("stream") && body["stream"].is_boolean()
                            ? body["stream"].get<bool>()
                            : toolpolicy::IsStreaming(tool);
    if (!stream) {
      NullSink sink;
      auto r = local::RunLocalCommand(*command, opt, sink);
      if (!r) {
        return ErrorResponse(r.error());
      }
      return JsonResponse(http::status::ok, ResultToJson(*r));
    }
    opt.blocking_timeout = timeouts_.local_blocking;
    auto channel = std::make_shared<EventChannel>(timeouts_.heartbeat);
    const bool posted = pool_.Post([channel, cmd = *command, opt] {
      RunInvocation(*channel, [&](EventSink &sink) {
        return local::RunLocalCommand(cmd, opt, sink);
      });
    });
    if (!posted) {
      return ErrorResponse(
          Error{ErrorKind::kCapacity, "too many background tasks, retry later"});
    }
    return Stream(channel);
  }

  HttpResponse Estimate(const json &body) {
    if (!body.contains("size") || !body["size"].is_number_unsigned()) {
      return Bad("size (bytes) required");
    }
    std::optional<double> observed;
    if (body.contains("throughput") && body["throughput"].is_number()) {
      observed = body["throughput"].get<double>();
    }
    TransportKind kind = TransportKind::kSsh;
    if (StringField(body, "transport").value_or("ssh") != "ssh") {
      kind = TransportKind::kReverseShell;
    }
    auto e = transfer::EstimateTransferTime(body["size"].get<std::size_t>(),
                                            observed, transfers_.Options(),
                                            kind);
    return JsonResponse(
        http::status::ok,
        json{{"success", true},
             {"size_class", std::string(transfer::SizeClassName(e.size_class))},
             {"chunk_size", e.chunk_size},
             {"throughput", e.throughput},
             {"estimated_seconds", e.seconds}});
  }

  HttpResponse ListSessions() {
    json arr = json::array();
    for (const auto &s : manager_.List()) {
      arr.push_back(SummaryToJson(s));
    }
    return JsonResponse(http::status::ok,
                        json{{"success", true}, {"sessions", arr}});
  }

  HttpResponse GetSession(const std::string &id) {
    auto s = manager_.Get(id);
    if (!s) {
      return ErrorResponse(s.error());
    }
    json j = SummaryToJson((*s)->Summary());
    j["success"] = true;
    return JsonResponse(http::status::ok, j);
  }

  HttpResponse CreateSsh(const json &body) {
    SshRequest req;
    auto target = StringField(body, "target");
    if (!target) {
      return Bad("target required");
    }
    req.target = *target;
    if (body.contains("port")) {
      if (!body["port"].is_number_unsigned() ||
          body["port"].get<unsigned>() == 0 ||
          body["port"].get<unsigned>() > 65535) {
        return Bad("port must be 1-65535");
      }
      req.port = body["port"].get<std::uint16_t>();
    }
    req.username = StringField(body, "username").value_or("");
    req.password = StringField(body, "password");
    req.key_path = StringField(body, "key_path");
    req.passphrase = StringField(body, "passphrase");
    req.session_id = StringField(body, "session_id");
    auto id = manager_.CreateSsh(req);
    if (!id) {
      return ErrorResponse(id.error());
    }
    return JsonResponse(http::status::created,
                        json{{"success", true}, {"session_id", *id}});
  }

  HttpResponse CreateListener(const json &body) {
    ListenerRequest req;
    if (!body.contains("port") || !body["port"].is_number_unsigned() ||
        body["port"].get<unsigned>() > 65535) {
      return Bad("port required");
    }
    req.port = body["port"].get<std::uint16_t>();
    auto type = ParseListenerType(StringField(body, "listener_type").value_or(""));
    if (!type) {
      return Bad("listener_type must be native or netcat");
    }
    req.type = *type;
    req.bind_address = StringField(body, "bind_address").value_or("0.0.0.0");
    req.session_id = StringField(body, "session_id");
    auto id = manager_.CreateListener(req);
    if (!id) {
      return ErrorResponse(id.error());
    }
    return JsonResponse(http::status::created,
                        json{{"success", true}, {"session_id", *id}});
  }

  Reply SessionCommand(const std::string &id, const json &body) {
    auto command = StringField(body, "command");
    if (!command || command->empty()) {
      return Bad("command required");
    }
    const auto timeout = TimeoutField(body);
    if (body.contains("stream") && body["stream"].is_boolean() &&
        body["stream"].get<bool>()) {
      auto channel = manager_.ExecuteStreaming(id, *command, timeout);
      if (!channel) {
        return ErrorResponse(channel.error());
      }
      return Stream(*channel);
    }
    auto r = manager_.Execute(id, *command, timeout);
    if (!r) {
      return ErrorResponse(r.error());
    }
    return JsonResponse(http::status::ok, ResultToJson(*r));
  }

  HttpResponse Payload(const std::string &id, const json &body) {
    auto command = StringField(body, "command");
    if (!command || command->empty()) {
      return Bad("command required");
    }
    auto ack = manager_.SendPayload(id, *command);
    if (!ack) {
      return ErrorResponse(ack.error());
    }
    return JsonResponse(http::status::accepted,
                        json{{"success", ack->accepted},
                             {"message", ack->message}});
  }

  HttpResponse Upload(const std::string &id, const json &body) {
    auto dest = StringField(body, "destination");
    auto content = StringField(body, "content");
    if (!dest || !content) {
      return Bad("destination and content (base64) required");
    }
    auto data = crypto::Base64Decode(crypto::FilterBase64(*content));
    if (!data) {
      return Bad("content is not valid base64");
    }
    auto rec = transfers_.Upload(manager_, id, *data, *dest);
    if (!rec) {
      return ErrorResponse(rec.error());
    }
    json j = RecordToJson(*rec);
    j["success"] = true;
    return JsonResponse(http::status::ok, j);
  }

  HttpResponse Download(const std::string &id, const json &body) {
    auto source = StringField(body, "source");
    if (!source) {
      return Bad("source required");
    }
    auto r = transfers_.Download(manager_, id, *source);
    if (!r) {
      return ErrorResponse(r.error());
    }
    json j = RecordToJson(r->record);
    j["success"] = true;
    j["content"] = crypto::Base64Encode(r->data);
    return JsonResponse(http::status::ok, j);
  }

  SessionManager &manager_;
  transfer::TransferEngine &transfers_;
  WorkerPool &pool_;
  config::Timeouts timeouts_;
};

} // namespace api
