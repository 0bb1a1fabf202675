#include "local/local_command.hpp"
#include "transfer/transfer_engine.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <netinet/in.h>
#include <random>
#include <sstream>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Runs commands with the local /bin/sh, standing in for a remote shell.
class LocalRunner : public ICommandRunner {
public:
  explicit LocalRunner(std::size_t maxLen = 100000) : max_len_(maxLen) {}

  Result<CommandResult> Run(const std::string &command,
                            std::chrono::milliseconds timeout) override {
    commands.push_back(command);
    NullSink sink;
    local::RunOptions opt;
    opt.timeout = timeout;
    opt.grace = 500ms;
    return local::RunLocalCommand(command, opt, sink);
  }

  std::size_t MaxCommandLength() const override { return max_len_; }

  std::vector<std::string> commands;

private:
  std::size_t max_len_;
};

enum class Damage { kChecksum, kPayload };

// Lies about checksums or damages encoded output on the way back.
void Tamper(Damage damage, const std::string &command, CommandResult &r) {
  const bool checksum = command.find("sha256sum") != std::string::npos;
  const bool payload = command.rfind("{ base64", 0) == 0 ||
                       command.rfind("dd if=", 0) == 0 ||
                       command.rfind("openssl base64 -A -in", 0) == 0;
  if (damage == Damage::kChecksum && checksum) {
    r.stdout_text = std::string(64, '0') + "\n";
  }
  if (damage == Damage::kPayload && payload && !r.stdout_text.empty()) {
    char &c = r.stdout_text[0];
    c = c == 'A' ? 'B' : 'A';
  }
}

class CorruptingRunner : public LocalRunner {
public:
  using Mode = Damage;
  explicit CorruptingRunner(Mode mode) : mode_(mode) {}

  Result<CommandResult> Run(const std::string &command,
                            std::chrono::milliseconds timeout) override {
    auto r = LocalRunner::Run(command, timeout);
    if (r) {
      Tamper(mode_, command, *r);
    }
    return r;
  }

private:
  Mode mode_;
};

class CorruptingSessionRunner : public SessionCommandRunner {
public:
  CorruptingSessionRunner(SessionManager &manager, std::string id,
                          Damage damage)
      : SessionCommandRunner(manager, std::move(id)), damage_(damage) {}

  Result<CommandResult> Run(const std::string &command,
                            std::chrono::milliseconds timeout) override {
    auto r = SessionCommandRunner::Run(command, timeout);
    if (r) {
      Tamper(damage_, command, *r);
    }
    return r;
  }

private:
  Damage damage_;
};

std::string RandomBytes(std::size_t n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string out(n, '\0');
  for (auto &c : out) {
    c = static_cast<char>(dist(gen));
  }
  return out;
}

std::string ReadFile(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class TransferEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/shellmux_transfer_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string Path(const std::string &name) const { return (dir_ / name).string(); }

  fs::path dir_;
  config::Timeouts timeouts_;
  transfer::TransferEngine engine_{config::TransferOptions{}, timeouts_};
};

} // namespace

TEST_F(TransferEngineTest, LargeUploadAndDownloadVerified) {
  const std::string data = RandomBytes(5 * 1024 * 1024, 7);
  const std::string dst = Path("big.bin");
  LocalRunner runner;

  auto up = engine_.Upload(runner, data, dst);
  ASSERT_TRUE(up.has_value()) << up.error().message;
  EXPECT_TRUE(up->verified);
  EXPECT_EQ(up->method, transfer::Method::kChunked);
  EXPECT_GT(up->chunk_count, 1u);
  EXPECT_EQ(up->source_checksum, up->destination_checksum);
  EXPECT_EQ(ReadFile(dst), data);
  for (const auto &cmd : runner.commands) {
    EXPECT_LE(cmd.size() + shellproto::FramingOverhead(),
              runner.MaxCommandLength());
  }

  auto down = engine_.Download(runner, dst);
  ASSERT_TRUE(down.has_value()) << down.error().message;
  EXPECT_TRUE(down->record.verified);
  EXPECT_EQ(down->record.size, data.size());
  EXPECT_EQ(down->data, data);

  auto report = engine_.Report();
  EXPECT_EQ(report.transfers, 2u);
  EXPECT_EQ(report.failures, 0u);
  EXPECT_EQ(report.bytes, 2u * data.size());
  EXPECT_GT(report.average_throughput, 0.0);
}

TEST_F(TransferEngineTest, MethodSwitchesAtThreshold) {
  const std::size_t t = config::TransferOptions{}.direct_threshold;
  const std::size_t sizes[] = {t - 1, t, t + 1};
  const transfer::Method expected[] = {transfer::Method::kDirect,
                                       transfer::Method::kChunked,
                                       transfer::Method::kChunked};
  for (int i = 0; i < 3; ++i) {
    LocalRunner runner;
    const std::string data = RandomBytes(sizes[i], static_cast<unsigned>(i));
    const std::string dst = Path("t" + std::to_string(i));
    auto up = engine_.Upload(runner, data, dst);
    ASSERT_TRUE(up.has_value()) << up.error().message;
    EXPECT_EQ(up->method, expected[i]) << sizes[i];
    EXPECT_EQ(ReadFile(dst), data);

    auto down = engine_.Download(runner, dst);
    ASSERT_TRUE(down.has_value()) << down.error().message;
    EXPECT_EQ(down->record.method, expected[i]) << sizes[i];
    EXPECT_EQ(down->data, data);
  }
}

TEST_F(TransferEngineTest, EmptyFileRoundTrip) {
  LocalRunner runner;
  const std::string dst = Path("empty");
  auto up = engine_.Upload(runner, "", dst);
  ASSERT_TRUE(up.has_value()) << up.error().message;
  EXPECT_TRUE(fs::exists(dst));
  auto down = engine_.Download(runner, dst);
  ASSERT_TRUE(down.has_value()) << down.error().message;
  EXPECT_TRUE(down->data.empty());
}

TEST_F(TransferEngineTest, UploadChecksumMismatchCleansUp) {
  CorruptingRunner runner(CorruptingRunner::Mode::kChecksum);
  const std::string dst = Path("bad.bin");
  auto up = engine_.Upload(runner, RandomBytes(1000, 3), dst);
  ASSERT_FALSE(up.has_value());
  EXPECT_EQ(up.error().kind, ErrorKind::kIntegrity);
  EXPECT_FALSE(fs::exists(dst));
  EXPECT_EQ(engine_.Report().failures, 1u);
}

TEST_F(TransferEngineTest, DownloadOfDamagedPayloadIsIntegrityError) {
  const std::string src = Path("src.bin");
  {
    std::ofstream out(src, std::ios::binary);
    out << RandomBytes(200 * 1024, 11);
  }
  CorruptingRunner runner(CorruptingRunner::Mode::kPayload);
  auto down = engine_.Download(runner, src);
  ASSERT_FALSE(down.has_value());
  EXPECT_EQ(down.error().kind, ErrorKind::kIntegrity);
}

TEST_F(TransferEngineTest, MissingSourceIsTransferError) {
  LocalRunner runner;
  auto down = engine_.Download(runner, Path("does-not-exist"));
  ASSERT_FALSE(down.has_value());
  EXPECT_EQ(down.error().kind, ErrorKind::kTransfer);
}

TEST_F(TransferEngineTest, UnwritableDestinationIsTransferError) {
  LocalRunner runner;
  auto up = engine_.Upload(runner, "data", Path("no/such/dir/file"));
  ASSERT_FALSE(up.has_value());
  EXPECT_EQ(up.error().kind, ErrorKind::kTransfer);
}

TEST_F(TransferEngineTest, UnknownSessionIsNotFound) {
  WorkerPool pool;
  SessionManager manager(config::ManagerOptions{}, timeouts_, pool);
  auto up = engine_.Upload(manager, "ssh_missing", "x", "/tmp/x");
  ASSERT_FALSE(up.has_value());
  EXPECT_EQ(up.error().kind, ErrorKind::kNotFound);
  auto down = engine_.Download(manager, "ssh_missing", "/etc/hostname");
  ASSERT_FALSE(down.has_value());
  EXPECT_EQ(down.error().kind, ErrorKind::kNotFound);
}

// The engine driven through a live reverse-shell session: framing, the
// transport's command length limit and long base64 lines over the socket.
class TransferOverSessionTest : public TransferEngineTest {
protected:
  void SetUp() override {
    TransferEngineTest::SetUp();
    ::signal(SIGPIPE, SIG_IGN);
    pool_.Start(4);
    session_timeouts_.listener_connection = 10s;
    session_timeouts_.join = 2s;
    manager_ = std::make_unique<SessionManager>(config::ManagerOptions{},
                                                session_timeouts_, pool_);
    ListenerRequest req;
    req.bind_address = "127.0.0.1";
    auto id = manager_->CreateListener(req);
    ASSERT_TRUE(id.has_value()) << id.error().message;
    id_ = *id;
    const int port =
        std::stoi(manager_->List().front().metadata.at("port"));

    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(sock, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(
        ::connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
    shell_ = ::fork();
    if (shell_ == 0) {
      ::dup2(sock, 0);
      ::dup2(sock, 1);
      ::dup2(sock, 2);
      ::close(sock);
      ::execl("/bin/sh", "sh", static_cast<char *>(nullptr));
      ::_exit(127);
    }
    ::close(sock);
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!manager_->List().front().connected &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(20ms);
    }
    ASSERT_TRUE(manager_->List().front().connected);
  }

  void TearDown() override {
    if (manager_) {
      manager_->ShutdownAll();
      manager_.reset();
    }
    if (shell_ > 0) {
      ::kill(shell_, SIGKILL);
      ::waitpid(shell_, nullptr, 0);
    }
    pool_.Stop();
    TransferEngineTest::TearDown();
  }

  WorkerPool pool_;
  config::Timeouts session_timeouts_;
  std::unique_ptr<SessionManager> manager_;
  std::string id_;
  pid_t shell_ = -1;
};

TEST_F(TransferOverSessionTest, RoundTripThroughReverseShell) {
  const std::string data = RandomBytes(300 * 1024, 21);
  const std::string dst = Path("session.bin");

  auto up = engine_.Upload(*manager_, id_, data, dst);
  ASSERT_TRUE(up.has_value()) << up.error().message;
  EXPECT_TRUE(up->verified);
  EXPECT_EQ(up->method, transfer::Method::kChunked);
  EXPECT_GT(up->chunk_count, 1u);
  EXPECT_EQ(ReadFile(dst), data);

  auto down = engine_.Download(*manager_, id_, dst);
  ASSERT_TRUE(down.has_value()) << down.error().message;
  EXPECT_TRUE(down->record.verified);
  EXPECT_EQ(down->data, data);

  // the session is still usable afterwards
  auto r = manager_->Execute(id_, "echo done", 5s);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_text, "done\n");
}

TEST_F(TransferOverSessionTest, DamagedDownloadThroughSessionIsIntegrityError) {
  const std::string src = Path("remote.bin");
  {
    std::ofstream out(src, std::ios::binary);
    out << RandomBytes(100 * 1024, 5);
  }
  CorruptingSessionRunner runner(*manager_, id_, Damage::kPayload);
  auto down = engine_.Download(runner, src);
  ASSERT_FALSE(down.has_value());
  EXPECT_EQ(down.error().kind, ErrorKind::kIntegrity);
}

TEST(TransferPlanning, EstimateIsPure) {
  config::TransferOptions opt;
  auto small = transfer::EstimateTransferTime(512 * 1024, std::nullopt, opt);
  EXPECT_EQ(small.size_class, transfer::SizeClass::kSmall);
  EXPECT_EQ(small.chunk_size, opt.small_chunk);
  EXPECT_DOUBLE_EQ(small.seconds, 1.5);

  auto medium = transfer::EstimateTransferTime(1024 * 1024, std::nullopt, opt);
  EXPECT_EQ(medium.size_class, transfer::SizeClass::kMedium);
  EXPECT_DOUBLE_EQ(medium.seconds, 1.5);

  auto shell = transfer::EstimateTransferTime(
      1024 * 1024, std::nullopt, opt, TransportKind::kReverseShell);
  EXPECT_DOUBLE_EQ(shell.seconds, 2.5);

  auto observed =
      transfer::EstimateTransferTime(4 * 1024 * 1024, 2.0 * 1024 * 1024, opt);
  EXPECT_DOUBLE_EQ(observed.seconds, 2.5);

  auto large =
      transfer::EstimateTransferTime(100 * 1024 * 1024, std::nullopt, opt);
  EXPECT_EQ(large.size_class, transfer::SizeClass::kLarge);
  EXPECT_EQ(large.chunk_size, opt.large_chunk);
  EXPECT_DOUBLE_EQ(large.seconds, 50.5);
}

TEST(TransferPlanning, ChannelLimitLowersThreshold) {
  config::TransferOptions opt;
  const std::size_t maxRaw = transfer::MaxRawPerCommand(4000, "/tmp/f");
  ASSERT_GT(maxRaw, 0u);
  EXPECT_EQ(maxRaw % 3, 0u);
  auto fits = transfer::PlanTransfer(maxRaw, opt, maxRaw);
  EXPECT_EQ(fits.method, transfer::Method::kDirect);
  auto over = transfer::PlanTransfer(maxRaw + 1, opt, maxRaw);
  EXPECT_EQ(over.method, transfer::Method::kChunked);
  EXPECT_LE(over.chunk_size, maxRaw);
  EXPECT_EQ(over.chunk_size % 3, 0u);
  EXPECT_EQ(over.chunk_count, (maxRaw + 1 + over.chunk_size - 1) / over.chunk_size);
}
