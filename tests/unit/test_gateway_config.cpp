#include <gtest/gtest.h>
#include "sandgate/core/errors.hpp"
#include "sandgate/core/gateway_config.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>

using sandgate::core::ErrorCode;
using sandgate::core::EnvLookup;
using sandgate::core::GatewayConfig;
using sandgate::core::SandboxError;

namespace {

EnvLookup FakeEnvironment(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

ErrorCode CodeOf(const std::string& text) {
    try {
        sandgate::core::ParseGatewayConfig(text);
    } catch (const SandboxError& e) {
        return e.GetErrorCode();
    }
    ADD_FAILURE() << "no error for: " << text;
    return ErrorCode::CONNECTION_ERROR;
}

} // anonymous namespace

class GatewayConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_file_ = std::filesystem::temp_directory_path() / "sandgate_config_test.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_file_, ec);
    }

    std::filesystem::path temp_file_;
};

TEST_F(GatewayConfigTest, DefaultsMatchSandboxContract)
{
    GatewayConfig config;
    EXPECT_EQ(config.engine.host, "unix:///var/run/docker.sock");
    EXPECT_TRUE(config.engine.api_version.empty());
    EXPECT_EQ(config.sandbox.default_image, "python:3.12-slim-bookworm");
    EXPECT_EQ(config.sandbox.working_dir, "/app");
    EXPECT_EQ(config.sandbox.command, (std::vector<std::string>{"sleep", "infinity"}));
    EXPECT_TRUE(config.sandbox.tty);
    EXPECT_TRUE(config.sandbox.open_stdin);
    EXPECT_FALSE(config.sandbox.remove_on_start_failure);
    EXPECT_EQ(config.teardown.stop_grace.count(), 10);
    EXPECT_EQ(config.server.operation_timeout.count(), 120);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(GatewayConfigTest, EmptyDocumentKeepsDefaults)
{
    auto config = sandgate::core::ParseGatewayConfig("{}");
    EXPECT_EQ(config.sandbox.default_image, "python:3.12-slim-bookworm");
    EXPECT_EQ(config.teardown.stop_grace.count(), 10);
}

TEST_F(GatewayConfigTest, ParsesAllSections)
{
    auto config = sandgate::core::ParseGatewayConfig(R"({
        "engine": {
            "host": "tcp://10.0.0.5:2376",
            "api_version": "1.43",
            "request_timeout_seconds": 30,
            "tls": { "enabled": true, "verify": false, "ca_file": "/certs/ca.pem" }
        },
        "sandbox": {
            "default_image": "alpine:3.20",
            "working_dir": "/work",
            "command": ["tail", "-f", "/dev/null"],
            "labels": { "owner": "agent" },
            "memory_limit_mb": 512,
            "cpu_limit": 1.5,
            "pids_limit": 128,
            "remove_on_start_failure": true
        },
        "teardown": { "stop_grace_seconds": 3 },
        "server": { "name": "sandbox-gw", "operation_timeout_seconds": 45 },
        "logging": { "level": "DEBUG", "file": "/tmp/sandgate.log" }
    })");

    EXPECT_EQ(config.engine.host, "tcp://10.0.0.5:2376");
    EXPECT_EQ(config.engine.api_version, "1.43");
    EXPECT_EQ(config.engine.request_timeout.count(), 30);
    EXPECT_TRUE(config.engine.tls.enabled);
    EXPECT_FALSE(config.engine.tls.verify);
    EXPECT_EQ(config.engine.tls.ca_file, "/certs/ca.pem");

    EXPECT_EQ(config.sandbox.default_image, "alpine:3.20");
    EXPECT_EQ(config.sandbox.working_dir, "/work");
    EXPECT_EQ(config.sandbox.command.size(), 3u);
    EXPECT_EQ(config.sandbox.labels.at("owner"), "agent");
    EXPECT_EQ(config.sandbox.memory_limit_mb, 512u);
    EXPECT_DOUBLE_EQ(config.sandbox.cpu_limit, 1.5);
    EXPECT_EQ(config.sandbox.pids_limit, 128);
    EXPECT_TRUE(config.sandbox.remove_on_start_failure);

    EXPECT_EQ(config.teardown.stop_grace.count(), 3);
    EXPECT_EQ(config.server.name, "sandbox-gw");
    EXPECT_EQ(config.server.operation_timeout.count(), 45);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "/tmp/sandgate.log");
}

TEST_F(GatewayConfigTest, RejectsInvalidDocuments)
{
    EXPECT_EQ(CodeOf("{not json"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf("[1, 2]"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"engine": "unix:///x"})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"engine": {"host": 42}})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"teardown": {"stop_grace_seconds": -1}})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"sandbox": {"cpu_limit": -0.5}})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"sandbox": {"default_image": "  "}})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"sandbox": {"command": []}})"), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(CodeOf(R"({"logging": {"level": "loud"}})"), ErrorCode::CONFIG_INVALID);
}

TEST_F(GatewayConfigTest, LoadsFromFile)
{
    {
        std::ofstream out(temp_file_);
        out << R"({"sandbox": {"default_image": "busybox:1.36"}})";
    }

    auto config = sandgate::core::LoadGatewayConfig(temp_file_);
    EXPECT_EQ(config.sandbox.default_image, "busybox:1.36");
}

TEST_F(GatewayConfigTest, MissingFileIsConfigError)
{
    try {
        sandgate::core::LoadGatewayConfig(temp_file_.string() + ".missing");
        FAIL() << "expected ConfigInvalid";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(GatewayConfigTest, EnvironmentOverridesEngineSettings)
{
    GatewayConfig config;
    config.engine.host = "unix:///from/file.sock";

    sandgate::core::ApplyEngineEnvironment(config, FakeEnvironment({
        {"DOCKER_HOST", "tcp://build-host:2376"},
        {"DOCKER_API_VERSION", "1.41"},
    }));

    EXPECT_EQ(config.engine.host, "tcp://build-host:2376");
    EXPECT_EQ(config.engine.api_version, "1.41");
    EXPECT_FALSE(config.engine.tls.enabled);
}

TEST_F(GatewayConfigTest, EmptyEnvironmentChangesNothing)
{
    GatewayConfig config;
    sandgate::core::ApplyEngineEnvironment(config, FakeEnvironment({{"DOCKER_HOST", ""}}));
    EXPECT_EQ(config.engine.host, "unix:///var/run/docker.sock");
}

TEST_F(GatewayConfigTest, CertPathEnablesTls)
{
    GatewayConfig config;
    sandgate::core::ApplyEngineEnvironment(config, FakeEnvironment({
        {"DOCKER_CERT_PATH", "/home/ci/.docker"},
        {"DOCKER_TLS_VERIFY", "1"},
    }));

    EXPECT_TRUE(config.engine.tls.enabled);
    EXPECT_TRUE(config.engine.tls.verify);
    EXPECT_EQ(config.engine.tls.ca_file, std::filesystem::path("/home/ci/.docker/ca.pem"));
    EXPECT_EQ(config.engine.tls.cert_file, std::filesystem::path("/home/ci/.docker/cert.pem"));
    EXPECT_EQ(config.engine.tls.key_file, std::filesystem::path("/home/ci/.docker/key.pem"));
}

TEST_F(GatewayConfigTest, CertPathWithoutVerifySkipsVerification)
{
    GatewayConfig config;
    sandgate::core::ApplyEngineEnvironment(config, FakeEnvironment({
        {"DOCKER_CERT_PATH", "/certs"},
    }));

    EXPECT_TRUE(config.engine.tls.enabled);
    EXPECT_FALSE(config.engine.tls.verify);
}
