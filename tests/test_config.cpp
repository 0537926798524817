#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "seacmd_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, Defaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.terminal().type, "xterm");
    EXPECT_EQ(c.terminal().cols, 80);
    EXPECT_EQ(c.terminal().rows, 24);
    EXPECT_EQ(c.timeouts().connect, 30);
    EXPECT_EQ(c.timeouts().exec, 60);
    EXPECT_EQ(c.timeouts().stream, 300);
    EXPECT_EQ(c.timeouts().pending_login, 120);
    EXPECT_EQ(c.defaults().port, 22);
    EXPECT_TRUE(c.log().enabled);
}

TEST_F(ConfigTest, ParsesSections) {
    auto r = Config::parse(R"(
terminal:
  type: xterm-256color
  cols: 132
timeouts:
  connect: 10
  pending_login: 30
defaults:
  port: 2222
  key_path: ~/.ssh/id_ed25519
transfer:
  local_dir: /srv/downloads
log:
  enabled: false
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.terminal().type, "xterm-256color");
    EXPECT_EQ(c.terminal().cols, 132);
    EXPECT_EQ(c.terminal().rows, 24);
    EXPECT_EQ(c.timeouts().connect, 10);
    EXPECT_EQ(c.timeouts().exec, 60);
    EXPECT_EQ(c.timeouts().pending_login, 30);
    EXPECT_EQ(c.defaults().port, 2222);
    EXPECT_EQ(c.defaults().key_path, "~/.ssh/id_ed25519");
    EXPECT_FALSE(c.log().enabled);

    auto pty = c.pty();
    EXPECT_EQ(pty.term, "xterm-256color");
    EXPECT_EQ(pty.cols, 132);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_TRUE(Config::parse("timeouts:\n  exec: 0\n").is_err());
    EXPECT_TRUE(Config::parse("defaults:\n  port: 70000\n").is_err());
    EXPECT_TRUE(Config::parse("terminal:\n  type: \"\"\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
    EXPECT_TRUE(Config::parse("timeouts: [unclosed\n").is_err());
}

TEST_F(ConfigTest, LoadMissingFileGivesDefaults) {
    auto r = Config::load(test_dir / "absent.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.defaults().port, 22);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream(test_dir / "config.yaml") << "defaults:\n  port: 2022\n";
    auto r = Config::load(test_dir / "config.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.defaults().port, 2022);
}

TEST_F(ConfigTest, LoadReportsPath) {
    std::ofstream(test_dir / "broken.yaml") << "defaults: [\n";
    auto r = Config::load(test_dir / "broken.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("broken.yaml"), std::string::npos);
}

TEST_F(ConfigTest, ResolveLocal) {
    auto r = Config::parse("transfer:\n  local_dir: " + test_dir.string() + "\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.resolve_local("out.txt"), test_dir / "out.txt");
    EXPECT_EQ(r.value.resolve_local("/abs/file"), fs::path("/abs/file"));

    Config plain;
    EXPECT_EQ(plain.resolve_local("out.txt"), fs::current_path() / "out.txt");
}
