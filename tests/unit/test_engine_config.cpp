#include <gtest/gtest.h>
#include "engine_config.h"
#include "file_utils.h"

#include <cstdlib>
#include <filesystem>

namespace malsand {
namespace {

const char* kFullConfig = R"({
    "vm": {
        "vmx_path": "/vms/kali/kali.vmx",
        "guest_user": "analyst",
        "guest_password": "s3cret",
        "base_snapshot": "Clean",
        "guest_work_dir": "/home/analyst/work/",
        "headless": false,
        "auto_start": false,
        "readiness_attempts": 5
    },
    "timeouts": { "command": 30, "execution": 10, "job": 120 },
    "trace": { "enabled": false, "tracer_path": "/usr/local/bin/strace" },
    "server": { "port": 9000, "host_work_dir": "/var/lib/malsand", "max_artifact_mb": 5 }
})";

EngineConfig valid_config() {
    EngineConfig config;
    config.vmx_path = "/vms/kali/kali.vmx";
    return config;
}

std::string validation_error(const EngineConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    return "";
}

// ============================================================================
// Loading
// ============================================================================

TEST(EngineConfigTest, DefaultsFromConstants) {
    EngineConfig config;
    EXPECT_EQ(config.guest_user, "kali");
    EXPECT_EQ(config.base_snapshot, "CleanSnapshot1");
    EXPECT_EQ(config.guest_work_dir, "/home/kali/SandboxAnalysis");
    EXPECT_EQ(config.command_timeout, 100);
    EXPECT_EQ(config.execution_timeout, 60);
    EXPECT_TRUE(config.enable_trace);
    EXPECT_EQ(config.port, 8443);
}

TEST(EngineConfigTest, ParsesAllSections) {
    EngineConfig config = EngineConfig::from_json(kFullConfig);

    EXPECT_EQ(config.vmx_path, "/vms/kali/kali.vmx");
    EXPECT_EQ(config.guest_user, "analyst");
    EXPECT_EQ(config.guest_password, "s3cret");
    EXPECT_EQ(config.base_snapshot, "Clean");
    EXPECT_FALSE(config.headless);
    EXPECT_FALSE(config.auto_start_vm);
    EXPECT_EQ(config.readiness_attempts, 5);
    EXPECT_EQ(config.command_timeout, 30);
    EXPECT_EQ(config.execution_timeout, 10);
    EXPECT_EQ(config.job_timeout, 120);
    EXPECT_EQ(config.compile_timeout, 120);   // Untouched default
    EXPECT_FALSE(config.enable_trace);
    EXPECT_EQ(config.tracer_path, "/usr/local/bin/strace");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.max_artifact_size, 5u * 1024 * 1024);
    EXPECT_NO_THROW(config.validate());
}

TEST(EngineConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(EngineConfig::from_json("{ not json"), std::invalid_argument);
    EXPECT_THROW(EngineConfig::from_json("[1, 2]"), std::invalid_argument);
    EXPECT_THROW(EngineConfig::from_json(R"({"vm": "kali"})"), std::invalid_argument);
}

TEST(EngineConfigTest, RejectsWrongTypes) {
    try {
        EngineConfig::from_json(R"({"vm": {"headless": "yes"}})");
        FAIL() << "String accepted for a boolean";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "vm.headless must be true or false");
    }
    EXPECT_THROW(EngineConfig::from_json(R"({"timeouts": {"job": "600"}})"), std::invalid_argument);
    EXPECT_THROW(EngineConfig::from_json(R"({"server": {"max_artifact_mb": 0}})"), std::invalid_argument);
}

TEST(EngineConfigTest, LoadFile) {
    char tmpl[] = "/tmp/malsand_config_XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    std::string path = std::string(dir) + "/malsand.json";
    FileUtils::write_file(path, kFullConfig);

    EngineConfig config = EngineConfig::load_file(path);
    EXPECT_EQ(config.port, 9000);

    EXPECT_THROW(EngineConfig::load_file(std::string(dir) + "/absent.json"), std::invalid_argument);
    std::filesystem::remove_all(dir);
}

TEST(EngineConfigTest, EnvironmentOverridesPassword) {
    EngineConfig config = valid_config();
    setenv("MALSAND_GUEST_PASSWORD", "from-env", 1);
    config.apply_environment();
    unsetenv("MALSAND_GUEST_PASSWORD");

    EXPECT_EQ(config.guest_password, "from-env");
}

// ============================================================================
// Validation
// ============================================================================

TEST(EngineConfigTest, VmxPathRequired) {
    EngineConfig config;
    EXPECT_EQ(validation_error(config), "vm.vmx_path is required (config file or --vmx)");
    EXPECT_EQ(validation_error(valid_config()), "");
}

TEST(EngineConfigTest, GuestPathsMustBeAbsolute) {
    EngineConfig config = valid_config();
    config.guest_work_dir = "SandboxAnalysis";
    EXPECT_NE(validation_error(config), "");

    config = valid_config();
    config.guest_work_dir = "/";
    EXPECT_EQ(validation_error(config), "vm.guest_work_dir must not be the guest root");

    config = valid_config();
    config.tracer_path = "strace";
    EXPECT_NE(validation_error(config), "");
}

TEST(EngineConfigTest, LimitsMustBePositive) {
    EngineConfig config = valid_config();
    config.execution_timeout = 0;
    EXPECT_EQ(validation_error(config), "timeouts.execution must be positive");

    config = valid_config();
    config.port = 70000;
    EXPECT_EQ(validation_error(config), "server.port must be between 1 and 65535");

    config = valid_config();
    config.base_snapshot.clear();
    EXPECT_EQ(validation_error(config), "vm.base_snapshot must not be empty");
}

// ============================================================================
// Derived Options
// ============================================================================

TEST(EngineConfigTest, ToJsonHidesPassword) {
    EngineConfig config = EngineConfig::from_json(kFullConfig);
    Json::Value json = config.to_json();

    EXPECT_EQ(json["vm"]["guest_password"].asString(), "<hidden>");
    EXPECT_EQ(json["vm"]["guest_user"].asString(), "analyst");
    EXPECT_EQ(json["server"]["max_artifact_mb"].asUInt64(), 5u);
}

TEST(EngineConfigTest, DerivedOptions) {
    EngineConfig config = EngineConfig::from_json(kFullConfig);

    VMHandle handle = config.vm_handle();
    EXPECT_EQ(handle.guest_work_dir, "/home/analyst/work");
    EXPECT_EQ(handle.credentials.user, "analyst");
    EXPECT_EQ(handle.credentials.password, "s3cret");
    EXPECT_EQ(handle.default_timeout, std::chrono::seconds(30));

    EXPECT_FALSE(config.lifecycle_options().headless);
    EXPECT_EQ(config.lifecycle_options().readiness_attempts, 5);

    PipelineOptions pipeline = config.pipeline_options();
    EXPECT_EQ(pipeline.execution_timeout, std::chrono::seconds(10));
    EXPECT_FALSE(pipeline.enable_trace);

    EXPECT_EQ(config.serializer_options().job_timeout, std::chrono::seconds(120));
    EXPECT_FALSE(config.serializer_options().auto_start_vm);

    VmrunOptions vmrun = config.vmrun_options();
    EXPECT_EQ(vmrun.capture_dir, "/var/lib/malsand/.capture");
    EXPECT_EQ(vmrun.command_timeout, std::chrono::seconds(30));
}

} // namespace
} // namespace malsand
