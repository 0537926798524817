#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include "fake_transport.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class FileTransferTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<Session> session;
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "seacmd_sftp_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        session = std::make_unique<Session>(fake_factory(server));
    }

    void TearDown() override {
        session.reset();
        fs::remove_all(test_dir);
    }

    void connect_and_start() {
        ASSERT_TRUE(session->connect("10.0.0.5", 22, "alice", "secret123").is_ok());
        auto r = session->sftp().start();
        ASSERT_TRUE(r.is_ok()) << r.error;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(FileTransferTest, OperationsBeforeStart) {
    ASSERT_TRUE(session->connect("10.0.0.5", 22, "alice", "secret123").is_ok());
    server->files["report.txt"] = "data";

    auto local = test_dir / "report.txt";
    auto r = session->sftp().download("report.txt", local);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(r.error, "SFTP not connected. Use 'sftp-start' first.");
    EXPECT_FALSE(fs::exists(local));

    EXPECT_EQ(session->sftp().list(".").kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(session->sftp().mkdir("x").kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(session->sftp().remove("report.txt").kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(server->files.count("report.txt"), 1u);
}

TEST_F(FileTransferTest, StartNeedsSession) {
    auto r = session->sftp().start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PRECONDITION);
    EXPECT_FALSE(session->sftp().is_open());
}

TEST_F(FileTransferTest, StartDenied) {
    server->sftp_denied = true;
    ASSERT_TRUE(session->connect("10.0.0.5", 22, "alice", "secret123").is_ok());
    auto r = session->sftp().start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_AUTHORIZED);
    EXPECT_EQ(r.error.rfind("SFTP not authorized", 0), 0u);
    EXPECT_TRUE(session->is_connected());
}

TEST_F(FileTransferTest, StartTwiceIsNoop) {
    connect_and_start();
    auto r = session->sftp().start();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "SFTP session started");
}

TEST_F(FileTransferTest, ListSortsDirectoriesFirst) {
    server->dirs.insert("src");
    server->dirs.insert("build");
    server->files["zeta.txt"] = "z";
    server->files["alpha.txt"] = "abc";
    connect_and_start();

    auto r = session->sftp().list(".");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 4u);
    EXPECT_EQ(r.value[0].name, "build");
    EXPECT_EQ(r.value[1].name, "src");
    EXPECT_EQ(r.value[2].name, "alpha.txt");
    EXPECT_EQ(r.value[3].name, "zeta.txt");
    EXPECT_EQ(r.value[2].size, 3u);
}

TEST_F(FileTransferTest, EmptyDirectoryListing) {
    server->dirs.insert("empty");
    connect_and_start();

    auto r = session->sftp().list("empty");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
    EXPECT_EQ(FileTransfer::format_listing(r.value), "(empty directory)");
}

TEST_F(FileTransferTest, FormatListing) {
    DirectoryEntry dir;
    dir.name = "logs";
    dir.is_directory = true;
    dir.permissions = 0040755;
    DirectoryEntry file;
    file.name = "notes.md";
    file.size = 2048;
    file.permissions = 0100600;

    auto text = FileTransfer::format_listing({dir, file});
    EXPECT_NE(text.find("drwxr-xr-x"), std::string::npos);
    EXPECT_NE(text.find("logs/"), std::string::npos);
    EXPECT_NE(text.find("-rw-------"), std::string::npos);
    EXPECT_NE(text.find("2.0 KB"), std::string::npos);
    EXPECT_NE(text.find('\n'), std::string::npos);
}

TEST_F(FileTransferTest, ListMissingPath) {
    connect_and_start();
    auto r = session->sftp().list("nowhere");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::REMOTE);
}

TEST_F(FileTransferTest, DownloadWritesFile) {
    server->files["data/results.csv"] = "a,b\n1,2\n";
    server->dirs.insert("data");
    connect_and_start();

    auto local = test_dir / "nested" / "results.csv";
    auto r = session->sftp().download("data/results.csv", local);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 8u);
    EXPECT_EQ(read_file(local), "a,b\n1,2\n");
    EXPECT_FALSE(fs::exists(test_dir / "nested" / "results.csv.part"));
}

TEST_F(FileTransferTest, FailedDownloadLeavesLocalFileAlone) {
    connect_and_start();
    auto local = test_dir / "keep.txt";
    std::ofstream(local) << "original";

    auto r = session->sftp().download("missing.txt", local);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::REMOTE);
    EXPECT_EQ(read_file(local), "original");
    EXPECT_FALSE(fs::exists(test_dir / "keep.txt.part"));
}

TEST_F(FileTransferTest, DownloadDirectoryIsRejected) {
    server->dirs.insert("src");
    connect_and_start();
    auto local = test_dir / "src";
    auto r = session->sftp().download("src", local);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("is a directory"), std::string::npos);
    EXPECT_FALSE(fs::exists(local));
}

TEST_F(FileTransferTest, UploadCopiesFile) {
    connect_and_start();
    auto local = test_dir / "upload.bin";
    std::ofstream(local, std::ios::binary) << "payload";

    auto r = session->sftp().upload(local, "upload.bin");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 7u);
    EXPECT_EQ(server->files["upload.bin"], "payload");
}

TEST_F(FileTransferTest, UploadMissingLocalFile) {
    connect_and_start();
    auto r = session->sftp().upload(test_dir / "nope.txt", "nope.txt");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LOCAL_IO);
    EXPECT_EQ(server->files.count("nope.txt"), 0u);
}

TEST_F(FileTransferTest, MkdirAndRemove) {
    connect_and_start();
    ASSERT_TRUE(session->sftp().mkdir("out").is_ok());
    EXPECT_EQ(server->dirs.count("out"), 1u);

    auto again = session->sftp().mkdir("out");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::REMOTE);

    server->files["out/a.txt"] = "a";
    auto not_empty = session->sftp().remove("out");
    ASSERT_TRUE(not_empty.is_err());
    EXPECT_NE(not_empty.error.find("not empty"), std::string::npos);

    ASSERT_TRUE(session->sftp().remove("out/a.txt").is_ok());
    ASSERT_TRUE(session->sftp().remove("out").is_ok());
    EXPECT_EQ(server->dirs.count("out"), 0u);
    EXPECT_EQ(server->files.count("out/a.txt"), 0u);
}

TEST_F(FileTransferTest, DroppedSessionClosesSftp) {
    connect_and_start();
    server->alive = false;

    auto r = session->sftp().list(".");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DISCONNECTED);
    EXPECT_FALSE(session->sftp().is_open());
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
}
