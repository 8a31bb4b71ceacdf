#include <gtest/gtest.h>
#include <remote/remote_client.hpp>
#include "fake_remote.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

class RemoteClientTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransport* transport = nullptr;

    std::unique_ptr<RemoteClient> make_client(bool sudo = false, int max_sessions = 4) {
        auto t = std::make_unique<FakeTransport>(host);
        transport = t.get();
        return std::make_unique<RemoteClient>(std::move(t), sudo, max_sessions);
    }
};

// ── Writes ──────────────────────────────────────────────────

TEST_F(RemoteClientTest, WriteThenReadRoundTrip) {
    auto client = make_client();
    ASSERT_TRUE(client->write_file("blabetiblou", "/tmp/file").is_ok());

    auto read = client->read_file("/tmp/file");
    ASSERT_TRUE(read.is_ok());
    EXPECT_TRUE(read.value.exists);
    EXPECT_EQ(read.value.content, "blabetiblou");
}

TEST_F(RemoteClientTest, WriteStreamsContentThroughTee) {
    auto client = make_client();
    ASSERT_TRUE(client->write_file("x", "/tmp/a").is_ok());
    ASSERT_EQ(host->commands().size(), 1u);
    EXPECT_EQ(host->commands()[0], "cat /dev/stdin | tee /tmp/a");
}

TEST_F(RemoteClientTest, WriteWithEnsureDirCreatesParent) {
    auto client = make_client();
    ASSERT_TRUE(client->write_file("nested", "/tmp/x/y/file", true).is_ok());
    EXPECT_EQ(host->commands()[0], "mkdir -p /tmp/x/y && cat /dev/stdin | tee /tmp/x/y/file");
    EXPECT_TRUE(host->node("/tmp/x/y").dir);
    EXPECT_EQ(host->node("/tmp/x/y/file").content, "nested");
}

TEST_F(RemoteClientTest, WriteIntoMissingDirectoryFails) {
    auto client = make_client();
    const std::string path = "/etc/doesnt-exist-4711/file";

    auto r = client->write_file("content", path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Command);
    EXPECT_EQ(r.error.command, "cat /dev/stdin | tee " + path);
    EXPECT_EQ(r.error.stderr_data, "tee: " + path + ": No such file or directory\n");
}

TEST_F(RemoteClientTest, WriteWithoutPrivilegeIsDenied) {
    auto client = make_client();
    auto r = client->write_file("content", "/home/file");
    ASSERT_TRUE(r.is_err());
    const std::string suffix = "Permission denied\n";
    ASSERT_GE(r.error.stderr_data.size(), suffix.size());
    EXPECT_EQ(r.error.stderr_data.substr(r.error.stderr_data.size() - suffix.size()), suffix);
}

TEST_F(RemoteClientTest, SudoPrefixesPrivilegedCommands) {
    auto client = make_client(true);
    ASSERT_TRUE(client->write_file("content", "/home/file").is_ok());
    ASSERT_TRUE(client->chown("/home/file", "1001").is_ok());
    ASSERT_TRUE(client->chgrp("/home/file", "deploy").is_ok());
    ASSERT_TRUE(client->chmod("/home/file", "0600").is_ok());
    ASSERT_TRUE(client->read_permissions("/home/file").is_ok());

    auto cmds = host->commands();
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(cmds[0], "cat /dev/stdin | sudo tee /home/file");
    EXPECT_EQ(cmds[1], "sudo chown 1001 /home/file");
    EXPECT_EQ(cmds[2], "sudo chgrp deploy /home/file");
    EXPECT_EQ(cmds[3], "sudo chmod 0600 /home/file");
    EXPECT_EQ(cmds[4], "sudo stat -c %a /home/file");

    EXPECT_EQ(host->node("/home/file").uid, 1001);
    EXPECT_EQ(host->node("/home/file").gid, 1001);
}

TEST_F(RemoteClientTest, EnsureDirPrefixIsNeverSudo) {
    auto client = make_client(true);
    ASSERT_TRUE(client->write_file("x", "/tmp/d/file", true).is_ok());
    EXPECT_EQ(host->commands()[0], "mkdir -p /tmp/d && cat /dev/stdin | sudo tee /tmp/d/file");
}

TEST_F(RemoteClientTest, CreateDirIsIdempotent) {
    auto client = make_client();
    ASSERT_TRUE(client->create_dir("/srv/app/data").is_ok());
    ASSERT_TRUE(client->create_dir("/srv/app/data").is_ok());
    EXPECT_EQ(host->commands()[0], "mkdir -p /srv/app/data");
    EXPECT_TRUE(host->node("/srv/app/data").dir);
}

// ── Reads ───────────────────────────────────────────────────

TEST_F(RemoteClientTest, ReadMissingFileIsNotAnError) {
    auto client = make_client();
    auto r = client->read_file("/tmp/nope");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.exists);
    EXPECT_EQ(r.value.content, "");
}

TEST_F(RemoteClientTest, ReadOtherFailureIsAnError) {
    auto client = make_client();
    host->fail_when("cat /etc/shadow", 1, "cat: /etc/shadow: Permission denied\n");
    auto r = client->read_file("/etc/shadow");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Command);
}

TEST_F(RemoteClientTest, PermissionsArePaddedToFourDigits) {
    auto client = make_client();
    host->add_file("/tmp/plain", "", FakeHost::USER_ID, FakeHost::USER_ID, 0644);
    host->add_file("/tmp/setuid", "", FakeHost::USER_ID, FakeHost::USER_ID, 04755);

    auto plain = client->read_permissions("/tmp/plain");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value, "0644");

    auto setuid = client->read_permissions("/tmp/setuid");
    ASSERT_TRUE(setuid.is_ok());
    EXPECT_EQ(setuid.value, "4755");
}

TEST_F(RemoteClientTest, StatReadsIdsAndNames) {
    auto client = make_client();
    host->add_file("/srv/owned", "", 1001, 0);

    EXPECT_EQ(client->read_owner("/srv/owned").value, "1001");
    EXPECT_EQ(client->read_group("/srv/owned").value, "0");
    EXPECT_EQ(client->read_owner_name("/srv/owned").value, "deploy");
    EXPECT_EQ(client->read_group_name("/srv/owned").value, "root");

    auto cmds = host->commands();
    EXPECT_EQ(cmds[0], "stat -c %u /srv/owned");
    EXPECT_EQ(cmds[3], "stat -c %G /srv/owned");
}

TEST_F(RemoteClientTest, StatOnMissingPathFails) {
    auto client = make_client();
    auto r = client->read_owner("/tmp/nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Command);
}

// ── Existence probes ────────────────────────────────────────

TEST_F(RemoteClientTest, DirExists) {
    auto client = make_client();
    host->add_file("/tmp/file", "");

    EXPECT_TRUE(client->dir_exists("/tmp").value);
    EXPECT_FALSE(client->dir_exists("/tmp/nope").value);
    EXPECT_FALSE(client->dir_exists("/tmp/file").value);
    EXPECT_EQ(host->commands()[0], "[ -d \"/tmp\" ] && exit 0 || exit 1");
}

TEST_F(RemoteClientTest, DirExistsSwallowsChannelFailure) {
    auto client = make_client();
    host->break_channel_when("[ -d");
    auto r = client->dir_exists("/tmp");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value);
}

TEST_F(RemoteClientTest, DirExistsFailsOnClosedPool) {
    auto client = make_client();
    client->close();
    auto r = client->dir_exists("/tmp");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::PoolClosed);
}

TEST_F(RemoteClientTest, FileExistsUsesSecondProbeForAbsence) {
    auto client = make_client();
    host->add_file("/tmp/here", "");

    EXPECT_TRUE(client->file_exists("/tmp/here").value);
    host->clear_commands();

    auto absent = client->file_exists("/tmp/gone");
    ASSERT_TRUE(absent.is_ok());
    EXPECT_FALSE(absent.value);
    auto cmds = host->commands();
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[0], "test -f /tmp/gone");
    EXPECT_EQ(cmds[1], "test ! -f /tmp/gone");
}

TEST_F(RemoteClientTest, FileExistsInconclusiveWhenBothProbesFail) {
    auto client = make_client();
    host->fail_when("test ", 2, "test: cannot access\n");
    auto r = client->file_exists("/tmp/locked");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.message.find("inconclusive"), std::string::npos);
}

TEST_F(RemoteClientTest, FileExistsWorksWithSingleChannel) {
    auto client = make_client(false, 1);
    auto r = client->file_exists("/tmp/gone");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value);
}

// ── Deletes ─────────────────────────────────────────────────

TEST_F(RemoteClientTest, DeleteFile) {
    auto client = make_client();
    host->add_file("/tmp/doomed", "x");
    ASSERT_TRUE(client->delete_file("/tmp/doomed").is_ok());
    EXPECT_FALSE(host->exists("/tmp/doomed"));
    EXPECT_EQ(host->commands()[0], "rm /tmp/doomed");
}

TEST_F(RemoteClientTest, DeleteMissingFileIsNotFound) {
    auto client = make_client();
    auto r = client->delete_file("/tmp/never");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::NotFound);
    EXPECT_EQ(r.error.command, "rm /tmp/never");
}

TEST_F(RemoteClientTest, DeleteFolderIsRecursive) {
    auto client = make_client();
    host->add_dir("/srv/tree");
    host->add_dir("/srv/tree/sub");
    host->add_file("/srv/tree/sub/leaf", "x");

    ASSERT_TRUE(client->delete_folder("/srv/tree").is_ok());
    EXPECT_EQ(host->commands()[0], "rm -rf /srv/tree");
    EXPECT_FALSE(host->exists("/srv/tree"));
    EXPECT_FALSE(host->exists("/srv/tree/sub/leaf"));
}

// ── Lifecycle ───────────────────────────────────────────────

TEST_F(RemoteClientTest, EveryChannelIsReleased) {
    auto client = make_client(false, 2);
    host->add_file("/tmp/a", "a");
    host->break_channel_when("cat /tmp/broken");

    client->read_file("/tmp/a");
    client->read_file("/tmp/missing");
    client->read_file("/tmp/broken");
    client->write_file("x", "/home/denied");
    client->file_exists("/tmp/missing");
    client->dir_exists("/tmp");
    client->delete_file("/tmp/missing");

    EXPECT_EQ(client->pool().in_use(), 0);
    EXPECT_EQ(transport->live(), 0);
}

TEST_F(RemoteClientTest, CloseIsIdempotentAndRefusesFurtherWork) {
    auto client = make_client();
    client->close();
    client->close();
    EXPECT_TRUE(transport->closed());

    auto r = client->read_file("/tmp/a");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::PoolClosed);
}

TEST_F(RemoteClientTest, CloseWaitsForInFlightLeaseBeforeClosingTransport) {
    auto client = make_client();
    auto held = client->pool().acquire();
    ASSERT_TRUE(held.is_ok());

    std::atomic<bool> closed{false};
    std::thread closer([&] {
        client->close();
        closed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(client->pool().is_closed());
    EXPECT_FALSE(transport->closed());
    EXPECT_FALSE(closed);

    // The in-flight command still completes on its channel
    auto r = held.value->exec("mkdir -p /tmp/late", "");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 0);

    held.value.release();
    closer.join();
    EXPECT_TRUE(closed);
    EXPECT_TRUE(transport->closed());
    EXPECT_EQ(client->pool().in_use(), 0);
}
