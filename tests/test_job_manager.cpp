#include "test_support.hpp"
#include "fake_service_manager.hpp"
#include <managers/job_manager.hpp>
#include <managers/launch_coordinator.hpp>
#include <managers/job_record.hpp>
#include <thread>
#include <sys/stat.h>

using namespace std::chrono_literals;

class JobManagerTest : public ScratchTest {
protected:
    Config config;
    fs::path work;
    fs::path dest;
    fs::path jobs_root;
    fs::path state_dir;

    void SetUp() override {
        ScratchTest::SetUp();
        config = make_config();
        work = test_dir / "work" / "42";
        dest = fs::path(config.paths().dest_root);
        jobs_root = fs::path(config.paths().jobs_root);
        state_dir = fs::path(config.paths().state_dir);
        write_file(work / "site.yml", "- hosts: all\n");
    }

    // Run a full launch against the fake worker
    void launch(JobRegistry& registry, WorkspaceStager& stager, FakeServiceManager& service,
                const std::string& job_id) {
        LaunchCoordinator coordinator(config, registry, stager, service);
        LaunchRequest req;
        req.job_id = job_id;
        req.source = work;
        req.secret = Secret(std::string("token-xyz"));
        auto r = coordinator.launch(req);
        service.join();
        ASSERT_TRUE(r.is_ok()) << r.error;
    }
};

TEST_F(JobManagerTest, ReapRefusesActiveWorker) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    launch(registry, stager, service, "42");

    JobManager jobs(config, registry, stager, service);
    auto r = jobs.reap("42", false, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Busy);
    EXPECT_TRUE(registry.contains("42"));
    EXPECT_TRUE(fs::exists(state_dir / "42.yaml"));
}

TEST_F(JobManagerTest, ForcedReapStopsAndKeepsWorkspace) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    launch(registry, stager, service, "42");

    JobManager jobs(config, registry, stager, service);
    auto r = jobs.reap("42", false, true);
    ASSERT_TRUE(r.is_ok()) << r.error;

    ASSERT_EQ(service.stops.size(), 1u);
    EXPECT_FALSE(registry.contains("42"));
    EXPECT_FALSE(fs::exists(state_dir / "42.yaml"));
    EXPECT_TRUE(fs::exists(dest / "42" / "site.yml"));
}

TEST_F(JobManagerTest, PurgeRemovesWorkspace) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    launch(registry, stager, service, "42");
    service.active.clear();

    JobManager jobs(config, registry, stager, service);
    auto r = jobs.reap("42", true, false);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_TRUE(service.stops.empty());
    EXPECT_FALSE(fs::exists(dest / "42"));
    EXPECT_FALSE(registry.contains("42"));
    EXPECT_TRUE(fs::exists(work / "site.yml"));
}

TEST_F(JobManagerTest, ReapUnknownIsNotFound) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    JobManager jobs(config, registry, stager, service);

    auto r = jobs.reap("ghost", false, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}

TEST_F(JobManagerTest, ReapFailedRecordWithoutEntry) {
    JobRecord rec;
    rec.job_id = "old";
    rec.status = JobRecord::FAILED;
    ASSERT_TRUE(rec.save(state_dir).is_ok());

    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    JobManager jobs(config, registry, stager, service);

    ASSERT_TRUE(jobs.reap("old", false, false).is_ok());
    EXPECT_FALSE(fs::exists(state_dir / "old.yaml"));
}

TEST_F(JobManagerTest, CancelRunningJob) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    launch(registry, stager, service, "42");

    JobManager jobs(config, registry, stager, service);
    auto r = jobs.cancel_job("42");
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(service.stops.size(), 1u);
    EXPECT_FALSE(registry.contains("42"));
    auto rec = JobRecord::load(state_dir, "42");
    ASSERT_TRUE(rec.is_ok());
    EXPECT_EQ(rec.value.status, "canceled");
    EXPECT_FALSE(rec.value.end_time.empty());
}

TEST_F(JobManagerTest, CancelUnregisteredIsNotFound) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    JobManager jobs(config, registry, stager, service);

    auto r = jobs.cancel_job("42");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}

TEST_F(JobManagerTest, CancelFromOutsideAbortsPendingLaunch) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config, FakeServiceManager::Mode::NeverAttach);
    LaunchCoordinator coordinator(config, registry, stager, service);

    LaunchRequest req;
    req.job_id = "42";
    req.source = work;
    req.secret = Secret(std::string("token-xyz"));

    // A second manager instance plays the other process
    FakeServiceManager other_service(config, FakeServiceManager::Mode::NeverAttach);
    JobManager jobs(config, registry, stager, other_service);
    Result<void> canceled = Result<void>::Err(ErrorCode::None, "not run");
    std::thread canceler([&] {
        // Wait until the worker has been started and the launcher is
        // waiting on the channel
        for (int i = 0; i < 250; ++i) {
            auto rec = JobRecord::load(state_dir, "42");
            if (rec.is_ok() && rec.value.status == JobRecord::LAUNCHED) break;
            std::this_thread::sleep_for(20ms);
        }
        canceled = jobs.cancel_job("42");
    });

    auto r = coordinator.launch(req);
    canceler.join();

    ASSERT_TRUE(canceled.is_ok()) << canceled.error;
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoReader);
    EXPECT_FALSE(registry.contains("42"));
    EXPECT_FALSE(fs::exists(dest / "42"));

    auto rec = JobRecord::load(state_dir, "42");
    ASSERT_TRUE(rec.is_ok());
    EXPECT_EQ(rec.value.status, "canceled");
}

TEST_F(JobManagerTest, ListJoinsRegistryAndRecords) {
    JobRegistry registry(jobs_root);
    WorkspaceStager stager;
    FakeServiceManager service(config);
    launch(registry, stager, service, "42");

    JobRecord old;
    old.job_id = "17";
    old.status = JobRecord::FAILED;
    ASSERT_TRUE(old.save(state_dir).is_ok());

    JobManager jobs(config, registry, stager, service);
    auto rows = jobs.list();
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].job_id, "17");
    EXPECT_FALSE(rows[0].registered);
    EXPECT_EQ(rows[0].status, "failed");

    EXPECT_EQ(rows[1].job_id, "42");
    EXPECT_TRUE(rows[1].registered);
    EXPECT_TRUE(rows[1].active);
    EXPECT_FALSE(rows[1].dangling);
    EXPECT_EQ(rows[1].status, "running");
    EXPECT_EQ(rows[1].workspace, (dest / "42").string());
}
