#define CPPHTTPLIB_NO_EXCEPTIONS
#include "httplib.h"

#include <doctest/doctest.h>

#include <viewstream/serve/ServeOptions.hpp>
#include <viewstream/serve/StreamingServer.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <random>
#include <string>
#include <string_view>
#include <thread>

using namespace VS;
using namespace VS::Serve;

namespace {

auto random_port() -> int {
    std::random_device                 rd;
    std::mt19937                       gen{rd()};
    std::uniform_int_distribution<int> dist(20000, 60000);
    return dist(gen);
}

// Runs RunStreamingServer on a background thread until stop() is called.
struct RunningServer {
    ServeOptions options;
    std::thread  thread;
    int          exit_code = -1;

    auto start() -> bool {
        for (int attempt = 0; attempt < 5; ++attempt) {
            ResetServeStopFlag();
            options.port = random_port();

            std::promise<VS::Expected<void>> listening;
            auto                             listened = listening.get_future();
            ServeLogHooks                    quiet{[](std::string_view) {}, [](std::string_view) {}};
            this->thread = std::thread([this, quiet, &listening]() {
                this->exit_code = RunStreamingServer(this->options, quiet, [&listening](VS::Expected<void> status) {
                    listening.set_value(std::move(status));
                });
            });

            if (listened.wait_for(std::chrono::seconds(5)) == std::future_status::ready && listened.get()) {
                return true;
            }
            RequestServeStop();
            this->thread.join();
        }
        return false;
    }

    void stop() {
        RequestServeStop();
        if (this->thread.joinable()) {
            this->thread.join();
        }
    }

    ~RunningServer() { this->stop(); }
};

auto get(httplib::Client& client, char const* path) -> httplib::Result {
    httplib::Result response;
    for (int attempt = 0; attempt < 5 && !response; ++attempt) {
        response = client.Get(path);
        if (!response) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return response;
}

} // namespace

TEST_SUITE("serve.server") {
TEST_CASE("Streaming server serves the page, health and metrics routes") {
    RunningServer server;
    server.options.host       = "127.0.0.1";
    server.options.page_size  = 4;
    server.options.fragments  = 10;
    server.options.batch_size = 3;
    server.options.title      = "Route <check>";
    REQUIRE(server.start());

    httplib::Client client(server.options.host, server.options.port);
    client.set_connection_timeout(1, 0);
    client.set_read_timeout(5, 0);

    auto health = get(client, "/healthz");
    REQUIRE(health);
    CHECK(health->status == 200);
    CHECK(health->body == "ok");

    auto streamed = get(client, "/");
    REQUIRE(streamed);
    CHECK(streamed->status == 200);

    auto buffered = get(client, "/?mode=buffered");
    REQUIRE(buffered);
    CHECK(buffered->status == 200);
    CHECK(buffered->body == streamed->body);
    CHECK(buffered->body.find("<title>Route &lt;check&gt;</title>") != std::string::npos);
    CHECK(buffered->body.find("<li id=\"fragment-9\">Fragment 10 of 10</li>") != std::string::npos);

    auto prometheus = get(client, "/metrics");
    REQUIRE(prometheus);
    CHECK(prometheus->status == 200);
    CHECK(prometheus->body.find("viewstream_flushes_total{outcome=\"completed\"}") != std::string::npos);

    auto metrics = get(client, "/metrics.json");
    REQUIRE(metrics);
    CHECK(metrics->status == 200);
    auto json = nlohmann::json::parse(metrics->body);
    CHECK(json["flushes"]["completed"].get<std::uint64_t>() > 0);
    CHECK(json["flushes"]["skipped"].get<std::uint64_t>() > 0);
    CHECK(json["bytes_flushed"].get<std::uint64_t>() == streamed->body.size());

    server.stop();
    CHECK(server.exit_code == EXIT_SUCCESS);
}

TEST_CASE("Invalid options are reported through the listen callback") {
    ServeOptions options;
    options.port = 0;

    std::atomic<bool>   should_stop{false};
    VS::Expected<void>  reported;
    ServeLogHooks       quiet{[](std::string_view) {}, [](std::string_view) {}};
    auto code = RunStreamingServerWithStopFlag(options, should_stop, quiet, [&](VS::Expected<void> status) {
        reported = std::move(status);
    });

    CHECK(code == EXIT_FAILURE);
    REQUIRE_FALSE(reported.has_value());
    CHECK(reported.error().code == VS::Error::Code::InvalidArgument);
}
}
