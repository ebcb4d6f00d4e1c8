#include <gtest/gtest.h>
#include "sandgate/core/errors.hpp"
#include "sandgate/core/operation_context.hpp"
#include "sandgate/core/sandbox_creation.hpp"
#include "sandgate/core/sandbox_teardown.hpp"
#include "sandgate/engine/client_factory.hpp"
#include "sandgate/engine/docker_client.hpp"
#include "fakes/canned_http_server.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using sandgate::core::ErrorCode;
using sandgate::core::OperationContext;
using sandgate::core::SandboxError;
using sandgate::engine::ContainerSpec;
using sandgate::engine::DockerClientFactory;
using sandgate::engine::DockerEngineClient;
using sandgate::engine::EngineConfig;
using sandgate::engine::EngineEndpoint;
using sandgate::engine::EngineError;
using sandgate::engine::RemoveOptions;
using sandgate::fakes::CannedHttpServer;

TEST(DockerClientTest, CreateBodyCarriesSandboxShape)
{
    ContainerSpec spec;
    spec.image = "python:3.12-slim-bookworm";
    spec.working_dir = "/app";
    spec.tty = true;
    spec.open_stdin = true;
    spec.stdin_once = false;
    spec.command = {"sleep", "infinity"};

    auto body = DockerEngineClient::BuildCreateBody(spec);

    EXPECT_EQ(body["Image"], "python:3.12-slim-bookworm");
    EXPECT_EQ(body["WorkingDir"], "/app");
    EXPECT_EQ(body["Tty"], true);
    EXPECT_EQ(body["OpenStdin"], true);
    EXPECT_EQ(body["StdinOnce"], false);
    ASSERT_TRUE(body["Cmd"].is_array());
    EXPECT_EQ(body["Cmd"][0], "sleep");
    EXPECT_EQ(body["Cmd"][1], "infinity");
    EXPECT_FALSE(body.contains("Labels"));
    EXPECT_TRUE(body["HostConfig"].is_object());
    EXPECT_TRUE(body["HostConfig"].empty());
}

TEST(DockerClientTest, CreateBodyIncludesOnlyPositiveLimits)
{
    ContainerSpec spec;
    spec.image = "alpine:3.20";
    spec.labels = {{"managed-by", "sandgate"}};
    spec.limits.memory_bytes = 256LL * 1024 * 1024;
    spec.limits.nano_cpus = 0;
    spec.limits.pids_limit = 64;

    auto body = DockerEngineClient::BuildCreateBody(spec);

    EXPECT_FALSE(body.contains("WorkingDir"));
    EXPECT_FALSE(body.contains("Cmd"));
    EXPECT_EQ(body["Labels"]["managed-by"], "sandgate");
    EXPECT_EQ(body["HostConfig"]["Memory"], 268435456);
    EXPECT_EQ(body["HostConfig"]["PidsLimit"], 64);
    EXPECT_FALSE(body["HostConfig"].contains("NanoCpus"));
}

TEST(DockerClientTest, ErrorMessageFromJsonBody)
{
    EXPECT_EQ(DockerEngineClient::ExtractErrorMessage(
                  404, R"({"message":"No such image: ghost:latest"})"),
              "No such image: ghost:latest");
}

TEST(DockerClientTest, ErrorMessageFromPlainBody)
{
    EXPECT_EQ(DockerEngineClient::ExtractErrorMessage(500, "  page not found\n"),
              "page not found");
    EXPECT_EQ(DockerEngineClient::ExtractErrorMessage(502, ""), "engine returned HTTP 502");
    EXPECT_EQ(DockerEngineClient::ExtractErrorMessage(500, R"({"error":"x"})"), R"({"error":"x"})");

    std::string huge(2000, 'x');
    EXPECT_EQ(DockerEngineClient::ExtractErrorMessage(500, huge).size(), 512u);
}

TEST(DockerClientTest, UnreachableSocketIsConnectionError)
{
    EngineConfig config;
    config.host = "unix:///nonexistent/sandgate-test/docker.sock";
    config.connect_timeout = std::chrono::seconds(2);
    DockerClientFactory factory(config);

    try {
        factory.Connect(OperationContext::WithTimeout(std::chrono::seconds(5)));
        FAIL() << "expected ConnectionError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::CONNECTION_ERROR);
    }
}

TEST(DockerClientTest, MalformedHostIsConnectionError)
{
    EngineConfig config;
    config.host = "ftp://engine";
    DockerClientFactory factory(config);

    try {
        factory.Connect(OperationContext());
        FAIL() << "expected ConnectionError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::CONNECTION_ERROR);
        EXPECT_NE(std::string(e.what()).find("invalid container engine configuration"),
                  std::string::npos);
    }
}

TEST(DockerClientTest, InvalidPinnedVersionIsConnectionError)
{
    EngineConfig config;
    config.api_version = "latest";
    DockerClientFactory factory(config);

    EXPECT_THROW(factory.Connect(OperationContext()), SandboxError);
}

TEST(DockerClientTest, PinnedVersionSkipsNegotiation)
{
    EngineConfig config;
    config.host = "unix:///nonexistent/sandgate-test/docker.sock";
    config.api_version = "v1.41";
    DockerClientFactory factory(config);

    // No request is made, so the missing socket goes unnoticed here
    auto client = factory.Connect(OperationContext());
    EXPECT_EQ(client->ApiVersion(), "1.41");
}

TEST(DockerClientTest, CancelledContextStopsBeforeConnecting)
{
    DockerClientFactory factory(EngineConfig{});
    OperationContext ctx;
    ctx.Cancel();

    try {
        factory.Connect(ctx);
        FAIL() << "expected OperationCancelled";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::OPERATION_CANCELLED);
    }
}

// ============================================================================
// HTTP exchanges against a canned engine
// ============================================================================

class DockerClientHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<CannedHttpServer>();
        config_.host = server_->Host();
        config_.connect_timeout = std::chrono::seconds(5);
        config_.request_timeout = std::chrono::seconds(10);
    }

    std::unique_ptr<DockerEngineClient> MakeClient() {
        auto client = std::make_unique<DockerEngineClient>(
            EngineEndpoint::Parse(config_.host, false), config_);
        client->SetApiVersion("1.47");
        return client;
    }

    static OperationContext Context() {
        return OperationContext::WithTimeout(std::chrono::seconds(15));
    }

    std::unique_ptr<CannedHttpServer> server_;
    EngineConfig config_;
};

TEST_F(DockerClientHttpTest, PingReturnsApiVersionHeader)
{
    server_->Enqueue(200, "OK", {{"API-Version", "1.45"}, {"Docker-Experimental", "false"}});
    auto client = MakeClient();

    EXPECT_EQ(client->Ping(Context()), "1.45");
    EXPECT_EQ(server_->RequestLines(), std::vector<std::string>{"GET /_ping HTTP/1.1"});
}

TEST_F(DockerClientHttpTest, FactoryNegotiatesDownToServerVersion)
{
    server_->Enqueue(200, "OK", {{"API-Version", "1.43"}});
    server_->Enqueue(200, R"({"Id":"sha256:abc"})");
    DockerClientFactory factory(config_);

    auto client = factory.Connect(Context());
    EXPECT_EQ(client->ApiVersion(), "1.43");
    EXPECT_TRUE(client->ImageExists("alpine:3.20", Context()));

    std::vector<std::string> expected = {
        "GET /_ping HTTP/1.1",
        "GET /v1.43/images/alpine:3.20/json HTTP/1.1"
    };
    EXPECT_EQ(server_->RequestLines(), expected);
}

TEST_F(DockerClientHttpTest, FactoryReportsFailedPingAsConnectionError)
{
    server_->Enqueue(500, R"({"message":"daemon is shutting down"})");
    DockerClientFactory factory(config_);

    try {
        factory.Connect(Context());
        FAIL() << "expected ConnectionError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::CONNECTION_ERROR);
        EXPECT_NE(std::string(e.what()).find("daemon is shutting down"), std::string::npos);
    }
}

TEST_F(DockerClientHttpTest, ImageExistsMapsStatusCodes)
{
    server_->Enqueue(200, R"({"Id":"sha256:abc"})");
    server_->Enqueue(404, R"({"message":"No such image: ghost:latest"})");
    server_->Enqueue(500, R"({"message":"inspect exploded"})");
    auto client = MakeClient();

    EXPECT_TRUE(client->ImageExists("python:3.12-slim-bookworm", Context()));
    EXPECT_FALSE(client->ImageExists("ghost:latest", Context()));
    try {
        client->ImageExists("alpine:3.20", Context());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.StatusCode(), 500);
        EXPECT_STREQ(e.what(), "inspect exploded");
    }

    std::vector<std::string> expected = {
        "GET /v1.47/images/python:3.12-slim-bookworm/json HTTP/1.1",
        "GET /v1.47/images/ghost:latest/json HTTP/1.1",
        "GET /v1.47/images/alpine:3.20/json HTTP/1.1"
    };
    EXPECT_EQ(server_->RequestLines(), expected);
}

TEST_F(DockerClientHttpTest, CreatePostsJsonBodyAndReturnsId)
{
    server_->Enqueue(201, R"({"Id":"abc123","Warnings":["low memory"]})");
    auto client = MakeClient();

    ContainerSpec spec;
    spec.image = "python:3.12-slim-bookworm";
    spec.working_dir = "/app";
    spec.command = {"sleep", "infinity"};

    EXPECT_EQ(client->CreateContainer(spec, Context()), "abc123");

    auto requests = server_->Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].request_line, "POST /v1.47/containers/create HTTP/1.1");
    auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["Image"], "python:3.12-slim-bookworm");
    EXPECT_EQ(body["WorkingDir"], "/app");
}

TEST_F(DockerClientHttpTest, CreateWithoutIdIsEngineError)
{
    server_->Enqueue(201, R"({"Warnings":[]})");
    auto client = MakeClient();

    ContainerSpec spec;
    spec.image = "alpine:3.20";
    EXPECT_THROW(client->CreateContainer(spec, Context()), EngineError);
}

TEST_F(DockerClientHttpTest, StartAcceptsNoContentAndNotModified)
{
    server_->Enqueue(204);
    server_->Enqueue(304);
    server_->Enqueue(500, R"({"message":"OCI runtime create failed"})");
    auto client = MakeClient();

    EXPECT_NO_THROW(client->StartContainer("abc123", Context()));
    EXPECT_NO_THROW(client->StartContainer("abc123", Context()));
    try {
        client->StartContainer("abc123", Context());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.StatusCode(), 500);
        EXPECT_STREQ(e.what(), "OCI runtime create failed");
    }

    EXPECT_EQ(server_->RequestLines().at(0), "POST /v1.47/containers/abc123/start HTTP/1.1");
}

TEST_F(DockerClientHttpTest, StopSendsGracePeriod)
{
    server_->Enqueue(204);
    server_->Enqueue(304);
    server_->Enqueue(404, R"({"message":"No such container: abc123"})");
    auto client = MakeClient();

    EXPECT_NO_THROW(client->StopContainer("abc123", std::chrono::seconds(10), Context()));
    EXPECT_NO_THROW(client->StopContainer("abc123", std::chrono::seconds(3), Context()));
    try {
        client->StopContainer("abc123", std::chrono::seconds(10), Context());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_TRUE(e.IsNotFound());
    }

    std::vector<std::string> expected = {
        "POST /v1.47/containers/abc123/stop?t=10 HTTP/1.1",
        "POST /v1.47/containers/abc123/stop?t=3 HTTP/1.1",
        "POST /v1.47/containers/abc123/stop?t=10 HTTP/1.1"
    };
    EXPECT_EQ(server_->RequestLines(), expected);
}

TEST_F(DockerClientHttpTest, RemoveSendsForceAndVolumes)
{
    server_->Enqueue(204);
    server_->Enqueue(404, R"({"message":"No such container: abc123"})");
    server_->Enqueue(409, R"({"message":"removal of container abc123 is already in progress"})");
    auto client = MakeClient();

    RemoveOptions options;
    options.force = true;
    options.remove_volumes = true;

    EXPECT_NO_THROW(client->RemoveContainer("abc123", options, Context()));
    try {
        client->RemoveContainer("abc123", options, Context());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_TRUE(e.IsNotFound());
        EXPECT_STREQ(e.what(), "No such container: abc123");
    }
    try {
        client->RemoveContainer("abc123", options, Context());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_FALSE(e.IsNotFound());
        EXPECT_EQ(e.StatusCode(), 409);
    }

    EXPECT_EQ(server_->RequestLines().at(0),
              "DELETE /v1.47/containers/abc123?force=1&v=1 HTTP/1.1");
}

TEST_F(DockerClientHttpTest, TeardownTwiceThroughRealClientIsIdempotent)
{
    config_.api_version = "1.47";
    DockerClientFactory factory(config_);
    sandgate::core::SandboxTeardownService teardown(factory, sandgate::core::TeardownPolicy{});

    // First teardown: container exists
    server_->Enqueue(204);
    server_->Enqueue(204);
    auto first = teardown.TeardownSandbox("abc123", Context());
    EXPECT_TRUE(first.removed);
    EXPECT_FALSE(first.already_absent);
    EXPECT_FALSE(first.stop_error.has_value());

    // Second teardown: the engine no longer knows it
    server_->Enqueue(404, R"({"message":"No such container: abc123"})");
    server_->Enqueue(404, R"({"message":"No such container: abc123"})");
    auto second = teardown.TeardownSandbox("abc123", Context());
    EXPECT_TRUE(second.removed);
    EXPECT_TRUE(second.already_absent);
    ASSERT_TRUE(second.stop_error.has_value());
    EXPECT_NE(second.stop_error->find("No such container"), std::string::npos);

    std::vector<std::string> expected = {
        "POST /v1.47/containers/abc123/stop?t=10 HTTP/1.1",
        "DELETE /v1.47/containers/abc123?force=1&v=1 HTTP/1.1",
        "POST /v1.47/containers/abc123/stop?t=10 HTTP/1.1",
        "DELETE /v1.47/containers/abc123?force=1&v=1 HTTP/1.1"
    };
    EXPECT_EQ(server_->RequestLines(), expected);
}

TEST_F(DockerClientHttpTest, TeardownRemoveFailureIsRemovalFailed)
{
    config_.api_version = "1.47";
    DockerClientFactory factory(config_);
    sandgate::core::SandboxTeardownService teardown(factory, sandgate::core::TeardownPolicy{});

    server_->Enqueue(204);
    server_->Enqueue(500, R"({"message":"driver failed to remove root filesystem"})");

    try {
        teardown.TeardownSandbox("abc123", Context());
        FAIL() << "expected RemovalFailed";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::REMOVAL_FAILED);
        EXPECT_NE(std::string(e.what()).find("driver failed to remove root filesystem"),
                  std::string::npos);
    }
}

TEST(DockerClientTest, PinnedVersionUnreachableEngineIsConnectionErrorOnCreate)
{
    EngineConfig config;
    config.host = "unix:///nonexistent/sandgate-test/docker.sock";
    config.api_version = "1.47";
    config.connect_timeout = std::chrono::seconds(2);
    DockerClientFactory factory(config);
    sandgate::core::SandboxCreationService creation(factory, sandgate::core::SandboxPolicy{});

    try {
        creation.CreateSandbox(std::nullopt, OperationContext::WithTimeout(std::chrono::seconds(5)));
        FAIL() << "expected ConnectionError";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.GetErrorCode(), ErrorCode::CONNECTION_ERROR);
    }
}
