#include "net/endpoint.hpp"
#include "sessions/ssh_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <pwd.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace fs = std::filesystem;

namespace {

// A port that was bound a moment ago and is now closed.
std::uint16_t ClosedPort() {
  net::io_context ioc;
  tcp::acceptor a(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  auto port = a.local_endpoint().port();
  a.close();
  return port;
}

SshParams Params(std::uint16_t port) {
  SshParams p;
  p.host = "127.0.0.1";
  p.port = port;
  p.credentials.username = "root";
  p.credentials.password = "secret";
  return p;
}

config::Timeouts ShortTimeouts() {
  config::Timeouts t;
  t.connect = 2s;
  t.join = 1s;
  return t;
}

std::string FindSshd() {
  for (const char *p : {"/usr/sbin/sshd", "/usr/bin/sshd",
                        "/usr/local/sbin/sshd"}) {
    if (::access(p, X_OK) == 0) {
      return p;
    }
  }
  return {};
}

std::string ReadText(const fs::path &p) {
  std::ifstream in(p);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool PortOpen(std::uint16_t port) {
  net::io_context ioc;
  tcp::socket s(ioc);
  boost::system::error_code ec;
  s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port), ec);
  return !ec;
}

// A throwaway sshd on loopback that accepts one generated key for the
// current user.
class LiveSshTest : public ::testing::Test {
protected:
  void SetUp() override {
    ::signal(SIGPIPE, SIG_IGN);
    const std::string sshd = FindSshd();
    if (sshd.empty()) {
      GTEST_SKIP() << "sshd not installed";
    }
    char tmpl[] = "/tmp/shellmux_sshd_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
    for (const char *key : {"host_key", "user_key", "other_key"}) {
      const std::string cmd = "ssh-keygen -q -t ecdsa -b 256 -m PEM -N '' -f " +
                              (dir_ / key).string() + " >/dev/null 2>&1";
      ASSERT_EQ(std::system(cmd.c_str()), 0) << cmd;
    }
    fs::copy_file(dir_ / "user_key.pub", dir_ / "authorized_keys");
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace);

    port_ = ClosedPort();
    {
      std::ofstream cfg(dir_ / "sshd_config");
      cfg << "Port " << port_ << "\n"
          << "ListenAddress 127.0.0.1\n"
          << "HostKey " << (dir_ / "host_key").string() << "\n"
          << "AuthorizedKeysFile " << (dir_ / "authorized_keys").string()
          << "\n"
          << "PidFile " << (dir_ / "sshd.pid").string() << "\n"
          << "StrictModes no\n"
          << "UsePAM no\n"
          << "PasswordAuthentication no\n"
          << "KbdInteractiveAuthentication no\n"
          << "PubkeyAuthentication yes\n"
          << "PermitRootLogin prohibit-password\n";
    }
    const std::string log = (dir_ / "sshd.log").string();
    const std::string cfgPath = (dir_ / "sshd_config").string();
    sshd_ = ::fork();
    ASSERT_GE(sshd_, 0);
    if (sshd_ == 0) {
      ::execl(sshd.c_str(), sshd.c_str(), "-D", "-f", cfgPath.c_str(), "-E",
              log.c_str(), static_cast<char *>(nullptr));
      ::_exit(127);
    }
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!PortOpen(port_) && std::chrono::steady_clock::now() < deadline) {
      if (::waitpid(sshd_, nullptr, WNOHANG) == sshd_) {
        sshd_ = -1;
        break;
      }
      std::this_thread::sleep_for(50ms);
    }
    if (!PortOpen(port_)) {
      const std::string why = ReadText(log);
      if (why.find("privilege separation") != std::string::npos) {
        GTEST_SKIP() << "sshd cannot run here: " << why;
      }
      FAIL() << "sshd did not come up: " << why;
    }

    const passwd *pw = ::getpwuid(::getuid());
    ASSERT_NE(pw, nullptr);
    user_ = pw->pw_name;
  }

  void TearDown() override {
    if (sshd_ > 0) {
      ::kill(sshd_, SIGTERM);
      ::waitpid(sshd_, nullptr, 0);
    }
    if (!dir_.empty()) {
      std::error_code ec;
      fs::remove_all(dir_, ec);
    }
  }

  SshParams WithKey(const std::string &key) const {
    SshParams p;
    p.host = "127.0.0.1";
    p.port = port_;
    p.credentials.username = user_;
    p.credentials.key_path = (dir_ / key).string();
    return p;
  }

  config::Timeouts Timeouts() const {
    config::Timeouts t;
    t.connect = 5s;
    t.ssh_probe = 10s;
    t.join = 3s;
    return t;
  }

  fs::path dir_;
  std::uint16_t port_ = 0;
  pid_t sshd_ = -1;
  std::string user_;
};

class LineSink : public EventSink {
public:
  void Emit(Event ev) override {
    if (auto *o = std::get_if<OutputEvent>(&ev)) {
      joined += o->line + "\n";
    }
  }
  std::string joined;
};

} // namespace

TEST_F(LiveSshTest, EchoOverShell) {
  SshTransport t("ssh_live", WithKey("user_key"), Timeouts());
  auto st = t.Start();
  ASSERT_TRUE(st.has_value()) << st.error().message;
  EXPECT_EQ(t.State(), TransportState::kConnected);
  EXPECT_FALSE(t.Describe().at("host_key").empty());

  auto r = t.RunCommand("echo hello", 5s);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->stdout_text, "hello\n");
  EXPECT_EQ(r->exit_code, 0);
  EXPECT_TRUE(r->Success());

  LineSink sink;
  auto streamed = t.Execute("echo a\necho b\n(exit 4)", 5s, sink);
  ASSERT_TRUE(streamed.has_value()) << streamed.error().message;
  EXPECT_EQ(streamed->stdout_text, "a\nb\n");
  EXPECT_EQ(sink.joined, streamed->stdout_text);
  EXPECT_EQ(streamed->exit_code, 4);
  t.Stop();
  EXPECT_EQ(t.State(), TransportState::kTerminated);
}

TEST_F(LiveSshTest, TimeoutKeepsChannelUsable) {
  SshTransport t("ssh_live", WithKey("user_key"), Timeouts());
  auto st = t.Start();
  ASSERT_TRUE(st.has_value()) << st.error().message;

  auto slow = t.RunCommand("sleep 2", 300ms);
  ASSERT_FALSE(slow.has_value());
  EXPECT_EQ(slow.error().kind, ErrorKind::kTimeout);
  EXPECT_EQ(t.State(), TransportState::kConnected);

  auto r = t.RunCommand("echo again", 10s);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->stdout_text, "again\n");
  t.Stop();
}

TEST_F(LiveSshTest, StopInterruptsRunningCommand) {
  SshTransport t("ssh_live", WithKey("user_key"), Timeouts());
  auto st = t.Start();
  ASSERT_TRUE(st.has_value()) << st.error().message;

  std::optional<Result<CommandResult>> outcome;
  std::jthread runner([&] { outcome = t.RunCommand("sleep 30", 60s); });
  std::this_thread::sleep_for(300ms);
  const auto start = std::chrono::steady_clock::now();
  t.Stop();
  runner.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  ASSERT_TRUE(outcome.has_value());
  ASSERT_FALSE(outcome->has_value());
  EXPECT_EQ(outcome->error().kind, ErrorKind::kConnection);
  EXPECT_EQ(t.State(), TransportState::kTerminated);
}

TEST_F(LiveSshTest, UnknownKeyIsAuthenticationError) {
  SshTransport t("ssh_live", WithKey("other_key"), Timeouts());
  auto st = t.Start();
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().kind, ErrorKind::kAuthentication);
  EXPECT_EQ(t.State(), TransportState::kDisconnected);
}

TEST(SshTransport, RefusedConnectionIsConnectionError) {
  SshTransport t("ssh_test", Params(ClosedPort()), ShortTimeouts());
  EXPECT_EQ(t.State(), TransportState::kDisconnected);
  auto st = t.Start();
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().kind, ErrorKind::kConnection);
  EXPECT_EQ(t.State(), TransportState::kDisconnected);
  EXPECT_FALSE(t.Alive());
  EXPECT_FALSE(t.IsConnected());
}

TEST(SshTransport, PeerWithoutSshBannerFailsHandshake) {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc,
                         tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  const auto port = acceptor.local_endpoint().port();
  std::jthread server([&acceptor] {
    boost::system::error_code ec;
    tcp::socket s = acceptor.accept(ec);
    if (!ec) {
      net::write(s, net::buffer(std::string("HTTP/1.0 400 Bad Request\r\n\r\n")),
                 ec);
      s.close(ec);
    }
  });
  SshTransport t("ssh_test", Params(port), ShortTimeouts());
  auto st = t.Start();
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().kind, ErrorKind::kConnection);
}

TEST(SshTransport, ExecuteWithoutConnection) {
  SshTransport t("ssh_test", Params(22), ShortTimeouts());
  auto r = t.RunCommand("id", 1s);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::kConnection);
  auto payload = t.SendPayload("id");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ErrorKind::kInvalidArgument);
}

TEST(SshTransport, StopIsIdempotent) {
  SshTransport t("ssh_test", Params(22), ShortTimeouts());
  t.Stop();
  t.Stop();
  EXPECT_EQ(t.State(), TransportState::kTerminated);
  EXPECT_EQ(t.Describe().at("username"), "root");
  EXPECT_EQ(t.DefaultTimeout(), ShortTimeouts().ssh_command);
}

TEST(Endpoint, ParseTarget) {
  auto plain = endpoint::ParseTarget("example.org");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->host, "example.org");
  EXPECT_EQ(plain->port, 22);
  EXPECT_EQ(plain->user, "");

  auto full = endpoint::ParseTarget("ssh://admin@10.0.0.5:2222/");
  ASSERT_TRUE(full.has_value());
  EXPECT_EQ(full->user, "admin");
  EXPECT_EQ(full->host, "10.0.0.5");
  EXPECT_EQ(full->port, 2222);

  auto v6 = endpoint::ParseTarget("[::1]:2200");
  ASSERT_TRUE(v6.has_value());
  EXPECT_EQ(v6->host, "::1");
  EXPECT_EQ(v6->port, 2200);

  auto bare6 = endpoint::ParseTarget("fe80::1", 2022);
  ASSERT_TRUE(bare6.has_value());
  EXPECT_EQ(bare6->host, "fe80::1");
  EXPECT_EQ(bare6->port, 2022);

  EXPECT_FALSE(endpoint::ParseTarget("").has_value());
  EXPECT_FALSE(endpoint::ParseTarget("host:99999").has_value());
  EXPECT_FALSE(endpoint::ParseTarget("[::1").has_value());
}
