/**
 * HTTP API Integration Tests
 *
 * Drives the engine through real socket connections: submission, status
 * polling, results, downloads and VM administration. The guest is the
 * in-memory FakeHypervisor.
 */

#include <gtest/gtest.h>
#include "api_routes.h"
#include "fake_hypervisor.h"

#include <json/json.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <sstream>
#include <thread>

namespace malsand {
namespace {

using testing_support::FakeHypervisor;
using namespace std::chrono_literals;

struct Reply {
    int status = 0;
    std::string headers;
    std::string body;
    Json::Value json;
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/malsand_http_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        test_dir = dir;

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(18000, 19000);
        test_port = dis(gen);

        config.vmx_path = "/vms/kali/kali.vmx";
        config.readiness_attempts = 3;
        config.readiness_interval_ms = 1;
        config.command_timeout = 5;
        config.compile_timeout = 5;
        config.execution_timeout = 2;
        config.job_timeout = 30;
        config.max_artifact_size = 1024;
        config.host_work_dir = test_dir + "/work";
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        engine.reset();
        std::filesystem::remove_all(test_dir);
    }

    void start_service() {
        engine = std::make_unique<AnalysisEngine>(config, vm);
        engine->start();
        server = std::make_unique<HttpServer>(test_port);
        register_api_routes(*server, *engine);

        server_thread = std::thread([this]() {
            server_started = true;
            try {
                server->start();
            } catch (const std::runtime_error& e) {
                start_error = e.what();
            }
        });

        int attempts = 0;
        while (!server_started && attempts < 100) {
            std::this_thread::sleep_for(10ms);
            attempts++;
        }
        std::this_thread::sleep_for(50ms);
        ASSERT_TRUE(start_error.empty()) << start_error;
    }

    int connect_to_server() {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(test_port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        struct timeval tv;
        tv.tv_sec = 10;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }
        return sock;
    }

    // The server closes every connection after one response
    Reply send_request(const std::string& method, const std::string& path,
                       const std::string& body = "", const std::string& extra_headers = "") {
        Reply reply;
        int sock = connect_to_server();
        if (sock < 0) {
            ADD_FAILURE() << "Connection to port " << test_port << " failed";
            return reply;
        }

        std::string request = method + " " + path + " HTTP/1.1\r\n"
                              "Host: localhost\r\n" + extra_headers;
        if (!body.empty() || method == "POST") {
            request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        request += "\r\n" + body;

        size_t sent = 0;
        while (sent < request.size()) {
            ssize_t n = send(sock, request.data() + sent, request.size() - sent, 0);
            if (n <= 0) break;
            sent += static_cast<size_t>(n);
        }

        std::string raw;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            raw.append(buffer, static_cast<size_t>(n));
        }
        close(sock);

        size_t header_end = raw.find("\r\n\r\n");
        if (raw.compare(0, 9, "HTTP/1.1 ") != 0 || header_end == std::string::npos) {
            ADD_FAILURE() << "Malformed response: " << raw;
            return reply;
        }
        reply.status = std::stoi(raw.substr(9, 3));
        reply.headers = raw.substr(0, header_end);
        reply.body = raw.substr(header_end + 4);

        Json::CharReaderBuilder builder;
        std::istringstream stream(reply.body);
        std::string errors;
        if (!Json::parseFromStream(builder, stream, &reply.json, &errors)) {
            reply.json = Json::Value();
        }
        return reply;
    }

    Reply submit(const std::string& filename, const std::string& content) {
        return send_request("POST", "/submit", content, "X-Filename: " + filename + "\r\n");
    }

    // Polls /status until the job is done or failed
    Reply wait_for_job(const std::string& job_id) {
        Reply reply;
        auto deadline = std::chrono::steady_clock::now() + 15s;
        while (std::chrono::steady_clock::now() < deadline) {
            reply = send_request("GET", "/status/" + job_id);
            std::string status = reply.json["status"].asString();
            if (status == "done" || status == "error") return reply;
            std::this_thread::sleep_for(20ms);
        }
        ADD_FAILURE() << "Job " << job_id << " did not finish";
        return reply;
    }

    FakeHypervisor vm;
    EngineConfig config;
    std::string test_dir;
    int test_port = 0;
    std::unique_ptr<AnalysisEngine> engine;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    std::atomic<bool> server_started{false};
    std::string start_error;
};

// ============================================================================
// Service Description
// ============================================================================

TEST_F(HttpIntegrationTest, RootDescribesService) {
    start_service();

    Reply reply = send_request("GET", "/");

    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.json["service"].asString(), "malsand");
    EXPECT_EQ(reply.json["vm"]["state"].asString(), "stopped");
    bool has_python = false;
    for (const auto& ext : reply.json["supported_extensions"]) {
        if (ext.asString() == ".py") has_python = true;
    }
    EXPECT_TRUE(has_python);
}

TEST_F(HttpIntegrationTest, UnknownRouteIs404) {
    start_service();

    Reply reply = send_request("GET", "/nowhere");

    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(reply.json["error"].asString(), "Not found");
}

// ============================================================================
// Submission and Results
// ============================================================================

TEST_F(HttpIntegrationTest, SubmitPollAndFetchResult) {
    start_service();

    // Given: A python sample posted as the raw body
    Reply accepted = submit("hello.py", "print(\"Hello over HTTP\")\n");
    ASSERT_EQ(accepted.status, 202) << accepted.body;
    std::string job_id = accepted.json["job_id"].asString();
    ASSERT_FALSE(job_id.empty());
    EXPECT_EQ(accepted.json["filename"].asString(), "hello.py");
    EXPECT_EQ(accepted.json["language"].asString(), "python");

    // When: The client polls until the job is finished
    Reply status = wait_for_job(job_id);

    // Then: Status and result describe the run
    EXPECT_EQ(status.json["status"].asString(), "done");
    EXPECT_EQ(status.json["progress"].asInt(), 100);
    EXPECT_NE(status.json["output"].asString().find("Hello over HTTP"), std::string::npos);

    Reply result = send_request("GET", "/result/" + job_id);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.json["job_id"].asString(), job_id);
    EXPECT_EQ(result.json["classification"].asString(), "Safe");
    EXPECT_EQ(result.json["execution"]["stdout"].asString(), "Hello over HTTP\n");
    EXPECT_TRUE(result.json["network_connections"].isArray());
}

TEST_F(HttpIntegrationTest, SubmitRequiresFilename) {
    start_service();

    Reply reply = send_request("POST", "/submit", "print(\"x\")\n");

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.json["error"].asString(), "X-Filename header is required");
}

TEST_F(HttpIntegrationTest, SubmitRejectsEmptyAndOversizedBodies) {
    start_service();

    EXPECT_EQ(submit("empty.py", "").status, 400);
    EXPECT_EQ(submit("big.py", std::string(2048, '#')).status, 413);
}

TEST_F(HttpIntegrationTest, UnsupportedFileReportsError) {
    start_service();

    Reply accepted = submit("notes.pdf", "%PDF-1.4\n");
    ASSERT_EQ(accepted.status, 202);
    EXPECT_EQ(accepted.json["status"].asString(), "error");

    Reply result = send_request("GET", "/result/" + accepted.json["job_id"].asString());
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.json["error"]["kind"].asString(), "UnsupportedFileType");
}

TEST_F(HttpIntegrationTest, ResultOfRunningJobIsConflict) {
    start_service();

    std::string job_id = submit("spin.py", "while True:\n    pass\n").json["job_id"].asString();
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (engine->status(job_id)->status != JobStatus::RUNNING &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    Reply result = send_request("GET", "/result/" + job_id);

    EXPECT_EQ(result.status, 409);
    EXPECT_EQ(result.json["error"].asString(), "Job not finished");
    EXPECT_EQ(result.json["status"].asString(), "running");
}

TEST_F(HttpIntegrationTest, UnknownJobIs404) {
    start_service();

    EXPECT_EQ(send_request("GET", "/status/job_missing").status, 404);
    EXPECT_EQ(send_request("GET", "/result/job_missing").status, 404);
    EXPECT_EQ(send_request("GET", "/outputs/job_missing").status, 404);
    EXPECT_EQ(send_request("POST", "/cancel/job_missing").status, 404);
}

// ============================================================================
// Outputs and Downloads
// ============================================================================

TEST_F(HttpIntegrationTest, OutputsAndDownload) {
    start_service();

    std::string job_id = submit("dropper.py", "f = open(\"loot.txt\", \"w\")\n").json["job_id"].asString();
    wait_for_job(job_id);

    Reply outputs = send_request("GET", "/outputs/" + job_id);
    EXPECT_EQ(outputs.status, 200);
    ASSERT_EQ(outputs.json["outputs"].size(), 1u);
    EXPECT_EQ(outputs.json["outputs"][0]["filename"].asString(), "loot.txt");
    EXPECT_EQ(outputs.json["outputs"][0]["sha256"].asString(),
              FileUtils::sha256_string("written by sample\n"));

    Reply download = send_request("GET", "/download/" + job_id + "/loot.txt");
    EXPECT_EQ(download.status, 200);
    EXPECT_EQ(download.body, "written by sample\n");
    EXPECT_NE(download.headers.find("Content-Type: text/plain"), std::string::npos);
    EXPECT_NE(download.headers.find("Content-Disposition: attachment; filename=\"loot.txt\""),
              std::string::npos);
}

TEST_F(HttpIntegrationTest, DownloadRejectsBadPaths) {
    start_service();

    std::string job_id = submit("hello.py", "print(\"hi\")\n").json["job_id"].asString();
    wait_for_job(job_id);

    EXPECT_EQ(send_request("GET", "/download/" + job_id).status, 400);
    EXPECT_EQ(send_request("GET", "/download/" + job_id + "/../input/hello.py").status, 404);
    EXPECT_EQ(send_request("GET", "/download/" + job_id + "/absent.txt").status, 404);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(HttpIntegrationTest, CancelActiveJob) {
    config.execution_timeout = 10;
    start_service();

    std::string job_id = submit("spin.py", "while True:\n    pass\n").json["job_id"].asString();
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (engine->status(job_id)->status != JobStatus::RUNNING &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    Reply cancelled = send_request("POST", "/cancel/" + job_id);
    EXPECT_EQ(cancelled.status, 200);
    EXPECT_TRUE(cancelled.json["cancelled"].asBool());

    Reply status = wait_for_job(job_id);
    EXPECT_EQ(status.json["error"]["kind"].asString(), "Cancelled");

    Reply again = send_request("POST", "/cancel/" + job_id);
    EXPECT_FALSE(again.json["cancelled"].asBool());
}

// ============================================================================
// VM Administration
// ============================================================================

TEST_F(HttpIntegrationTest, VmStartStopCycle) {
    start_service();

    EXPECT_EQ(send_request("GET", "/vm/status").json["state"].asString(), "stopped");

    Reply started = send_request("POST", "/vm/start");
    EXPECT_EQ(started.status, 200);
    EXPECT_EQ(started.json["state"].asString(), "ready");
    EXPECT_TRUE(started.json["available"].asBool());

    Reply stopped = send_request("POST", "/vm/stop");
    EXPECT_EQ(stopped.status, 200);
    EXPECT_EQ(stopped.json["state"].asString(), "stopped");

    Reply restarted = send_request("POST", "/vm/restart");
    EXPECT_EQ(restarted.json["state"].asString(), "ready");
}

TEST_F(HttpIntegrationTest, VmStartFailureIs503) {
    vm.fail_start = true;
    start_service();

    Reply reply = send_request("POST", "/vm/start");

    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(reply.json["kind"].asString(), "VMStartFailed");
    EXPECT_EQ(reply.json["state"].asString(), "faulted");
    EXPECT_FALSE(reply.json["last_error"].asString().empty());
}

} // namespace
} // namespace malsand
