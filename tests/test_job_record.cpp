#include "test_support.hpp"
#include <managers/job_record.hpp>

class JobRecordTest : public ScratchTest {
protected:
    fs::path state_dir;

    void SetUp() override {
        ScratchTest::SetUp();
        state_dir = test_dir / "state";
    }
};

TEST_F(JobRecordTest, SaveAndLoad) {
    JobRecord rec;
    rec.job_id = "42";
    rec.source = "/src/42";
    rec.workspace = "/tmp/42";
    rec.workspace_created = true;
    rec.registry_path = "/tmp/isojob/jobs/42";
    rec.channel_path = "/tmp/isojob/jobs/42/env";
    rec.unit = "playbook@42.service";
    rec.status = JobRecord::RUNNING;
    rec.submit_time = "2026-10-19T10:00:00";

    ASSERT_TRUE(rec.save(state_dir).is_ok());
    EXPECT_TRUE(fs::exists(state_dir / "42.yaml"));

    auto loaded = JobRecord::load(state_dir, "42");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.workspace, "/tmp/42");
    EXPECT_TRUE(loaded.value.workspace_created);
    EXPECT_FALSE(loaded.value.temp_created);
    EXPECT_EQ(loaded.value.unit, "playbook@42.service");
    EXPECT_EQ(loaded.value.status, "running");
    EXPECT_EQ(loaded.value.submit_time, "2026-10-19T10:00:00");
}

TEST_F(JobRecordTest, SaveLeavesNoTempFiles) {
    JobRecord rec;
    rec.job_id = "7";
    ASSERT_TRUE(rec.save(state_dir).is_ok());
    rec.status = JobRecord::FAILED;
    ASSERT_TRUE(rec.save(state_dir).is_ok());

    size_t n = 0;
    for (const auto& e : fs::directory_iterator(state_dir)) {
        EXPECT_EQ(e.path().filename(), "7.yaml");
        n++;
    }
    EXPECT_EQ(n, 1u);
}

TEST_F(JobRecordTest, MissingIsNotFound) {
    auto r = JobRecord::load(state_dir, "nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}

TEST_F(JobRecordTest, CorruptRecordIsError) {
    write_file(state_dir / "bad.yaml", "job_id: [oops\n");
    auto r = JobRecord::load(state_dir, "bad");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Filesystem);
}

TEST_F(JobRecordTest, ListSkipsForeignAndCorruptFiles) {
    JobRecord a;
    a.job_id = "a";
    JobRecord b;
    b.job_id = "b";
    ASSERT_TRUE(b.save(state_dir).is_ok());
    ASSERT_TRUE(a.save(state_dir).is_ok());
    write_file(state_dir / "notes.txt", "x");
    write_file(state_dir / "bad.yaml", "job_id: [oops\n");

    auto all = JobRecord::list(state_dir);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].job_id, "a");
    EXPECT_EQ(all[1].job_id, "b");
}

TEST_F(JobRecordTest, Remove) {
    JobRecord rec;
    rec.job_id = "42";
    ASSERT_TRUE(rec.save(state_dir).is_ok());
    ASSERT_TRUE(JobRecord::remove(state_dir, "42").is_ok());
    EXPECT_FALSE(fs::exists(state_dir / "42.yaml"));

    // Removing again is fine
    EXPECT_TRUE(JobRecord::remove(state_dir, "42").is_ok());
}
