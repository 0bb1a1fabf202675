#pragma once

#include "core/event.hpp"
#include "core/event_channel.hpp"
#include <boost/beast/http.hpp>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace http = beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Server-sent events backed by a live event channel. format turns one event
// into the text of one "data:" frame.
struct StreamReply {
  std::shared_ptr<EventChannel> channel;
  std::function<std::string(const Event &)> format;
};

using Reply = std::variant<HttpResponse, StreamReply>;
