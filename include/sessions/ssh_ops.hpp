#pragma once

#include "core/error.hpp"
#include "crypto/base64.hpp"
#include "terminal/unique_fd.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <libssh2.h>
#include <mutex>
#include <optional>
#include <string>

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

// namespace sshops: thin libssh2 and socket wrappers returning Result/Status.
namespace sshops {

inline Status GlobalInit() {
  static std::once_flag once;
  static int rc = 0;
  std::call_once(once, [] { rc = libssh2_init(0); });
  if (rc != 0) {
    return MakeError(ErrorKind::kConnection,
                     "libssh2_init failed: " + std::to_string(rc));
  }
  return {};
}

inline std::string LastError(LIBSSH2_SESSION *session) {
  char *msg = nullptr;
  int len = 0;
  libssh2_session_last_error(session, &msg, &len, 0);
  if (msg == nullptr || len <= 0) {
    return "unknown libssh2 error";
  }
  return std::string(msg, static_cast<std::size_t>(len));
}

// Resolves and connects under one deadline. The descriptor is returned in
// blocking mode, detached from asio.
inline Result<UniqueFd> ConnectTcp(const std::string &host, std::uint16_t port,
                                   std::chrono::milliseconds timeout) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::error_code ec;
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    return MakeError(ErrorKind::kConnection,
                     "resolve " + host + ": " + ec.message());
  }
  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout);
  stream.async_connect(endpoints,
                       [&ec](const beast::error_code &e,
                             const tcp::endpoint &) { ec = e; });
  ioc.run();
  if (ec == beast::error::timeout) {
    return MakeError(ErrorKind::kConnection,
                     "connect to " + host + ":" + std::to_string(port) +
                         " timed out");
  }
  if (ec) {
    return MakeError(ErrorKind::kConnection, "connect to " + host + ":" +
                                                 std::to_string(port) + ": " +
                                                 ec.message());
  }
  beast::error_code nd;
  stream.socket().set_option(tcp::no_delay(true), nd);
  UniqueFd fd(::dup(stream.socket().native_handle()));
  if (!fd) {
    return MakeError(ErrorKind::kConnection, "dup socket failed");
  }
  SetCloseOnExec(fd.Get());
  SetNonBlocking(fd.Get(), false);
  return fd;
}

// OpenSSH style "SHA256:<base64 without padding>".
inline std::string HostKeyFingerprint(LIBSSH2_SESSION *session) {
  const char *hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
  if (hash == nullptr) {
    return "unavailable";
  }
  std::string b64 = crypto::Base64Encode(std::string_view(hash, 32));
  while (!b64.empty() && b64.back() == '=') {
    b64.pop_back();
  }
  return "SHA256:" + b64;
}

inline Status Handshake(LIBSSH2_SESSION *session, int sock) {
  int rc = libssh2_session_handshake(session, sock);
  if (rc != 0) {
    return MakeError(ErrorKind::kConnection,
                     "handshake: " + LastError(session));
  }
  return {};
}

struct Credentials {
  std::string username;
  std::optional<std::string> password;
  std::optional<std::string> key_path;
  std::optional<std::string> passphrase;
};

inline Status Authenticate(LIBSSH2_SESSION *session, const Credentials &cred) {
  int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
  if (cred.key_path) {
    rc = libssh2_userauth_publickey_fromfile(
        session, cred.username.c_str(), nullptr, cred.key_path->c_str(),
        cred.passphrase ? cred.passphrase->c_str() : nullptr);
  }
  if (rc != 0 && cred.password) {
    rc = libssh2_userauth_password(session, cred.username.c_str(),
                                   cred.password->c_str());
  }
  if (rc == 0) {
    return {};
  }
  switch (rc) {
  case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
  case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
  case LIBSSH2_ERROR_FILE:
  case LIBSSH2_ERROR_PASSWORD_EXPIRED:
    return MakeError(ErrorKind::kAuthentication,
                     "authentication failed for " + cred.username + ": " +
                         LastError(session));
  default:
    return MakeError(ErrorKind::kConnection,
                     "authentication: " + LastError(session));
  }
}

inline Result<LIBSSH2_CHANNEL *> OpenShell(LIBSSH2_SESSION *session) {
  LIBSSH2_CHANNEL *ch = libssh2_channel_open_session(session);
  if (ch == nullptr) {
    return MakeError(ErrorKind::kConnection,
                     "channel open: " + LastError(session));
  }
  if (libssh2_channel_request_pty_ex(ch, "dumb", 4, nullptr, 0, 250, 50, 0,
                                     0) != 0) {
    std::string msg = LastError(session);
    libssh2_channel_free(ch);
    return MakeError(ErrorKind::kConnection, "pty request: " + msg);
  }
  if (libssh2_channel_shell(ch) != 0) {
    std::string msg = LastError(session);
    libssh2_channel_free(ch);
    return MakeError(ErrorKind::kConnection, "shell request: " + msg);
  }
  return ch;
}

} // namespace sshops
