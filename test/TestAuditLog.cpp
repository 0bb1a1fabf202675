#include "logging/audit_log.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

class AuditLogTest : public ::testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/shellmux_audit_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string ReadOnlyLog() {
    std::vector<fs::path> files;
    for (const auto &e : fs::directory_iterator(dir_)) {
      files.push_back(e.path());
    }
    EXPECT_EQ(files.size(), 1u);
    if (files.empty()) {
      return {};
    }
    std::ifstream in(files[0]);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path dir_;
};

} // namespace

TEST_F(AuditLogTest, RecordsReachSessionFile) {
  logging::AuditLog log(dir_.string());
  ASSERT_TRUE(log.Enabled());
  log.Start();
  auto trail = log.Open("shell_4444");
  trail->Record("exec", "id");
  trail->Record("exit", "0");
  trail->Record("exec", "printf 'a\\nb'\nsecond line");
  trail->Close();
  log.Join();

  const std::string text = ReadOnlyLog();
  EXPECT_NE(text.find(" exec id\n"), std::string::npos);
  EXPECT_NE(text.find(" exit 0\n"), std::string::npos);
  // embedded newlines are flattened to keep one record per line
  EXPECT_NE(text.find("printf 'a\\nb' second line\n"), std::string::npos);
  EXPECT_EQ(trail->Dropped(), 0u);
}

TEST_F(AuditLogTest, LongRecordsAreTruncated) {
  logging::AuditLog log(dir_.string());
  auto trail = log.Open("ssh_host_root");
  trail->Record("exec", std::string(1000, 'x'));
  log.Join();
  const std::string text = ReadOnlyLog();
  EXPECT_LE(text.size(), sizeof(logging::AuditRecord::buf));
  EXPECT_NE(text.find("...\n"), std::string::npos);
}

TEST_F(AuditLogTest, FullQueueDropsInsteadOfBlocking) {
  logging::AuditLog log(dir_.string());
  auto trail = log.Open("busy");
  for (int i = 0; i < 3000; ++i) {
    trail->Record("exec", "echo " + std::to_string(i));
  }
  EXPECT_GT(trail->Dropped(), 0u);
  log.Join();
}

TEST(AuditLogDisabled, TrailRecordsNothing) {
  logging::AuditLog log("");
  EXPECT_FALSE(log.Enabled());
  log.Start();
  auto trail = log.Open("shell_1");
  trail->Record("exec", "id");
  EXPECT_EQ(trail->Dropped(), 0u);
  log.Join();
}
