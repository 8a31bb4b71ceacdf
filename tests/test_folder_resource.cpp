#include <gtest/gtest.h>
#include <resources/folder_resource.hpp>
#include "fake_remote.hpp"

class FolderResourceTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    std::unique_ptr<RemoteClient> client;

    void connect(bool sudo = false) {
        client = std::make_unique<RemoteClient>(std::make_unique<FakeTransport>(host), sudo, 4);
    }

    void SetUp() override { connect(); }

    static FolderDesired plan_for(const std::string& path) {
        FolderDesired plan;
        plan.path = path;
        return plan;
    }
};

TEST_F(FolderResourceTest, CreateMakesNestedDirectory) {
    FolderResource res(*client);
    auto r = res.create(plan_for("/srv/app/releases"));
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();

    EXPECT_EQ(r.value.id, "/srv/app/releases");
    EXPECT_TRUE(r.value.exists);
    EXPECT_EQ(r.value.attrs.owner_name, "tester");
    EXPECT_EQ(r.value.attrs.permissions, "0755");
    EXPECT_TRUE(host->node("/srv/app").dir);
    EXPECT_EQ(host->mutations()[0], "mkdir -p /srv/app/releases");
}

TEST_F(FolderResourceTest, CreateAppliesOwnershipAndMode) {
    connect(true);
    FolderResource res(*client);
    auto plan = plan_for("/var/lib/app");
    plan.ownership.owner_name = Attr<std::string>::known("deploy");
    plan.ownership.group = Attr<int64_t>::known(1001);
    plan.ownership.permissions = Attr<std::string>::known("0750");

    auto r = res.create(plan);
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();

    auto mutations = host->mutations();
    ASSERT_EQ(mutations.size(), 4u);
    EXPECT_EQ(mutations[0], "sudo mkdir -p /var/lib/app");
    EXPECT_EQ(mutations[1], "sudo chown deploy /var/lib/app");
    EXPECT_EQ(mutations[2], "sudo chgrp 1001 /var/lib/app");
    EXPECT_EQ(mutations[3], "sudo chmod 0750 /var/lib/app");
    EXPECT_EQ(r.value.attrs.owner, 1001);
    EXPECT_EQ(r.value.attrs.group_name, "deploy");
    EXPECT_EQ(r.value.attrs.permissions, "0750");
}

TEST_F(FolderResourceTest, CreateWithoutPrivilegeFails) {
    FolderResource res(*client);
    auto r = res.create(plan_for("/etc/app.d"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Command);
    EXPECT_NE(r.error.message.find("Could not create folder /etc/app.d"), std::string::npos);
}

TEST_F(FolderResourceTest, ReadReturnsNulloptWhenGone) {
    FolderResource res(*client);
    auto created = res.create(plan_for("/srv/cache"));
    ASSERT_TRUE(created.is_ok());

    host->remove("/srv/cache");
    auto r = res.read(created.value);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.has_value());
}

TEST_F(FolderResourceTest, ReadRefreshesAttributes) {
    FolderResource res(*client);
    auto created = res.create(plan_for("/srv/cache"));
    ASSERT_TRUE(created.is_ok());

    host->add_dir("/srv/cache", FakeHost::USER_ID, 1001, 0770);
    auto r = res.read(created.value);
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(r.value->attrs.group_name, "deploy");
    EXPECT_EQ(r.value->attrs.permissions, "0770");
}

TEST_F(FolderResourceTest, UpdateWithoutChangesIssuesNoMutations) {
    FolderResource res(*client);
    auto plan = plan_for("/srv/stable");
    plan.ownership.permissions = Attr<std::string>::known("0755");
    auto created = res.create(plan);
    ASSERT_TRUE(created.is_ok());

    host->clear_commands();
    auto r = res.update(plan, created.value);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(host->mutations().empty());
}

TEST_F(FolderResourceTest, UpdateChangesOnlyWhatDiffers) {
    FolderResource res(*client);
    auto created = res.create(plan_for("/srv/www"));
    ASSERT_TRUE(created.is_ok());

    auto plan = plan_for("/srv/www");
    plan.ownership.owner = Attr<int64_t>::known(FakeHost::USER_ID);
    plan.ownership.permissions = Attr<std::string>::known("0700");

    host->clear_commands();
    auto r = res.update(plan, created.value);
    ASSERT_TRUE(r.is_ok());

    auto mutations = host->mutations();
    ASSERT_EQ(mutations.size(), 1u);
    EXPECT_EQ(mutations[0], "chmod 0700 /srv/www");
    EXPECT_EQ(r.value.attrs.permissions, "0700");
}

TEST_F(FolderResourceTest, DeleteIsRecursive) {
    FolderResource res(*client);
    auto created = res.create(plan_for("/srv/tree"));
    ASSERT_TRUE(created.is_ok());
    host->add_file("/srv/tree/leaf", "x");

    ASSERT_TRUE(res.destroy(created.value).is_ok());
    EXPECT_FALSE(host->exists("/srv/tree"));
    EXPECT_FALSE(host->exists("/srv/tree/leaf"));
}

TEST_F(FolderResourceTest, DeleteOfAbsentFolderSucceeds) {
    FolderResource res(*client);
    FolderObserved state;
    state.id = state.path = "/srv/never";
    EXPECT_TRUE(res.destroy(state).is_ok());
}

TEST_F(FolderResourceTest, PathChangeRequiresReplace) {
    FolderObserved state;
    state.id = state.path = "/srv/a";
    EXPECT_TRUE(FolderResource::requires_replace(plan_for("/srv/b"), state));
    EXPECT_FALSE(FolderResource::requires_replace(plan_for("/srv/a"), state));
}
