#include "test_support.hpp"
#include <managers/job_registry.hpp>
#include <sys/stat.h>

class JobRegistryTest : public ScratchTest {
protected:
    fs::path jobs_root;
    fs::path workspace;

    void SetUp() override {
        ScratchTest::SetUp();
        jobs_root = test_dir / "jobs";
        workspace = test_dir / "dest" / "42";
        fs::create_directories(workspace);
    }
};

TEST_F(JobRegistryTest, RootCreatedPrivate) {
    JobRegistry reg(jobs_root);
    ASSERT_TRUE(reg.ensure_root().is_ok());

    struct stat st;
    ASSERT_EQ(stat(jobs_root.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_mode & 07777, 0700u);
}

TEST_F(JobRegistryTest, ExistingRootTightened) {
    fs::create_directories(jobs_root);
    chmod(jobs_root.c_str(), 0755);

    JobRegistry reg(jobs_root);
    ASSERT_TRUE(reg.ensure_root().is_ok());

    struct stat st;
    ASSERT_EQ(stat(jobs_root.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0700u);
}

TEST_F(JobRegistryTest, RegisterCreatesSymlink) {
    JobRegistry reg(jobs_root);
    auto r = reg.register_job("42", workspace);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(r.value, jobs_root / "42");
    EXPECT_TRUE(fs::is_symlink(r.value));
    EXPECT_EQ(fs::read_symlink(r.value), workspace);
    EXPECT_TRUE(reg.contains("42"));

    auto target = reg.lookup("42");
    ASSERT_TRUE(target.is_ok());
    EXPECT_EQ(target.value, workspace);
}

TEST_F(JobRegistryTest, DuplicateLeavesOriginalUntouched) {
    JobRegistry reg(jobs_root);
    ASSERT_TRUE(reg.register_job("42", workspace).is_ok());

    auto other = test_dir / "dest" / "other";
    fs::create_directories(other);
    auto dup = reg.register_job("42", other);
    ASSERT_TRUE(dup.is_err());
    EXPECT_EQ(dup.code, ErrorCode::DuplicateJob);
    EXPECT_EQ(fs::read_symlink(jobs_root / "42"), workspace);
}

TEST_F(JobRegistryTest, DanglingEntryStillDuplicate) {
    JobRegistry reg(jobs_root);
    ASSERT_TRUE(reg.register_job("42", workspace).is_ok());
    fs::remove_all(workspace);

    EXPECT_TRUE(reg.contains("42"));
    auto dup = reg.register_job("42", workspace);
    ASSERT_TRUE(dup.is_err());
    EXPECT_EQ(dup.code, ErrorCode::DuplicateJob);

    auto entries = reg.list();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].dangling);
}

TEST_F(JobRegistryTest, InvalidIdRejectedBeforeAnythingIsCreated) {
    JobRegistry reg(jobs_root);
    auto r = reg.register_job("../escape", workspace);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Filesystem);
    EXPECT_FALSE(fs::exists(jobs_root));
    EXPECT_FALSE(fs::exists(test_dir / "escape"));
}

TEST_F(JobRegistryTest, DeregisterRemovesOnlyTheLink) {
    JobRegistry reg(jobs_root);
    write_file(workspace / "site.yml", "- hosts: all\n");
    ASSERT_TRUE(reg.register_job("42", workspace).is_ok());

    ASSERT_TRUE(reg.deregister("42").is_ok());
    EXPECT_FALSE(reg.contains("42"));
    EXPECT_TRUE(fs::exists(workspace / "site.yml"));

    auto again = reg.deregister("42");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.code, ErrorCode::NotFound);
}

TEST_F(JobRegistryTest, DeregisterRefusesRealDirectory) {
    JobRegistry reg(jobs_root);
    ASSERT_TRUE(reg.ensure_root().is_ok());
    fs::create_directories(jobs_root / "manual");

    auto r = reg.deregister("manual");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Filesystem);
    EXPECT_TRUE(fs::is_directory(jobs_root / "manual"));
}

TEST_F(JobRegistryTest, ListSortedById) {
    JobRegistry reg(jobs_root);
    EXPECT_TRUE(reg.list().empty());

    ASSERT_TRUE(reg.register_job("b", workspace).is_ok());
    ASSERT_TRUE(reg.register_job("a", workspace).is_ok());

    auto entries = reg.list();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].job_id, "a");
    EXPECT_EQ(entries[1].job_id, "b");
    EXPECT_FALSE(entries[0].dangling);
}

TEST_F(JobRegistryTest, LookupUnknown) {
    JobRegistry reg(jobs_root);
    auto r = reg.lookup("missing");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}
