#pragma once

#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Fixture with a private scratch directory per test, removed afterwards.
// Logs are redirected into it.
class ScratchTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   fmt::format("isojob_{}_{}_{}", info->test_suite_name(), info->name(), getpid());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        set_log_dir(test_dir / "logs");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void write_file(const fs::path& path, const std::string& content = "") {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Config rooted entirely inside test_dir
    Config make_config(int channel_timeout_secs = 5) {
        std::string yaml = fmt::format(R"(
paths:
  jobs_root: "{0}/jobs"
  dest_root: "{0}/dest"
  temp_root: "{0}/tmp"
  state_dir: "{0}/state"
  log_dir: "{0}/logs"
channel:
  name: env
  mode: "0600"
  timeout_secs: {1}
service:
  unit_template: "playbook@{{}}.service"
)", test_dir.string(), channel_timeout_secs);
        auto r = Config::parse(yaml);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};
