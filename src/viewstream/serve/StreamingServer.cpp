#define CPPHTTPLIB_NO_EXCEPTIONS
#include "httplib.h"

#include <viewstream/serve/StreamingServer.hpp>

#include <viewstream/buffer/FlushMetrics.hpp>
#include <viewstream/serve/StreamingRenderSession.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace VS::Serve {

static std::atomic<bool> g_should_stop{false};

void RequestServeStop() {
    g_should_stop.store(true);
}

void ResetServeStopFlag() {
    g_should_stop.store(false);
}

int RunStreamingServerWithStopFlag(ServeOptions const&                     options,
                                   std::atomic<bool>&                      should_stop,
                                   ServeLogHooks const&                    log_hooks,
                                   std::function<void(VS::Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](VS::Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    if (auto error = ValidateServeOptions(options)) {
        log_error("[viewstream] " + *error);
        report_listen_status(std::unexpected(VS::Error{VS::Error::Code::InvalidArgument, *error}));
        return EXIT_FAILURE;
    }

    FlushMetrics metrics;
    auto const   page_size      = static_cast<std::size_t>(options.page_size);
    auto const   flush_interval = std::chrono::milliseconds{options.flush_interval_ms};

    httplib::Server server;

    server.Get("/", [&](httplib::Request const& req, httplib::Response& res) {
        res.set_header("Cache-Control", "no-store");
        if (req.get_param_value("mode") == "buffered") {
            auto page = RenderBuffered(MakeDemoPageSource(options), page_size, &metrics);
            if (!page) {
                vs_log("Buffered render failed: " + describeError(page.error()), "Serve", "ERROR");
                res.status = 500;
                res.set_content(describeError(page.error()), "text/plain; charset=utf-8");
                return;
            }
            res.set_content(*page, "text/html; charset=utf-8");
            return;
        }

        auto session = std::make_shared<StreamingRenderSession>(MakeDemoPageSource(options),
                                                                page_size,
                                                                &metrics,
                                                                should_stop,
                                                                flush_interval);
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/html; charset=utf-8",
            [session](size_t, httplib::DataSink& sink) {
                return session->pump(sink);
            },
            [session](bool done) {
                session->cancel();
                vs_log("Stream closed after " + std::to_string(session->batches()) + " batches"
                           + (done ? "" : " (incomplete)"),
                       "Serve");
            });
    });

    server.Get("/healthz", [&](httplib::Request const&, httplib::Response& res) {
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [&](httplib::Request const&, httplib::Response& res) {
        auto snapshot = metrics.capture_snapshot();
        auto body     = metrics.render_prometheus(snapshot);
        res.set_header("Cache-Control", "no-store");
        res.set_content(body, "text/plain; version=0.0.4");
    });

    server.Get("/metrics.json", [&](httplib::Request const&, httplib::Response& res) {
        res.set_header("Cache-Control", "no-store");
        res.set_content(metrics.snapshot_json().dump(2), "application/json");
    });

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[viewstream] Failed to bind "} + options.host + ":"
                          + std::to_string(options.port));
            }
        }
    });

    log_info(std::string{"[viewstream] Listening on http://"} + options.host + ":"
             + std::to_string(options.port));

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(VS::Error{VS::Error::Code::InvalidState,
                                                           "failed to bind streaming listener"}));
        } else if (should_stop.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(VS::Error{VS::Error::Code::Cancelled,
                                                           "streaming server stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunStreamingServer(ServeOptions const&                     options,
                       ServeLogHooks const&                    log_hooks,
                       std::function<void(VS::Expected<void>)> on_listen) {
    return RunStreamingServerWithStopFlag(options, g_should_stop, log_hooks, std::move(on_listen));
}

} // namespace VS::Serve
