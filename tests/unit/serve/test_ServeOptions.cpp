#include <doctest/doctest.h>

#include <viewstream/serve/ServeOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

TEST_SUITE("serve.options") {

TEST_CASE("ServeOptions validation helpers guard ranges") {
    CHECK(VS::Serve::IsValidServePort(80));
    CHECK(VS::Serve::IsValidServePort(65535));
    CHECK_FALSE(VS::Serve::IsValidServePort(0));
    CHECK_FALSE(VS::Serve::IsValidServePort(65536));
}

TEST_CASE("ServeOptions Validate detects invalid values") {
    VS::Serve::ServeOptions options{};
    CHECK_FALSE(VS::Serve::ValidateServeOptions(options).has_value());

    options.port = 70000;
    auto error   = VS::Serve::ValidateServeOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port       = 8080;
    options.batch_size = 0;
    error              = VS::Serve::ValidateServeOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--batch-size") != std::string::npos);

    options.batch_size = 4;
    options.page_size  = 0;
    error              = VS::Serve::ValidateServeOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--page-size") != std::string::npos);
}

TEST_CASE("Command line flags are parsed") {
    EnvGuard host{"VIEWSTREAM_SERVE_HOST", nullptr};
    EnvGuard port{"VIEWSTREAM_SERVE_PORT", nullptr};

    ArgvBuilder argv{"viewstream_serve",
                     "--host", "0.0.0.0",
                     "--port", "9000",
                     "--page-size", "16",
                     "--fragments", "10",
                     "--batch-size", "3",
                     "--flush-interval-ms", "25",
                     "--title", "Streaming <demo>"};
    auto parsed = VS::Serve::ParseServeArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9000);
    CHECK(parsed->page_size == 16);
    CHECK(parsed->fragments == 10);
    CHECK(parsed->batch_size == 3);
    CHECK(parsed->flush_interval_ms == 25);
    CHECK(parsed->title == "Streaming <demo>");
    CHECK_FALSE(parsed->show_help);
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    EnvGuard host{"VIEWSTREAM_SERVE_HOST", "0.0.0.0"};
    EnvGuard port{"VIEWSTREAM_SERVE_PORT", "9090"};
    EnvGuard batch{"VIEWSTREAM_SERVE_BATCH_SIZE", "5"};

    ArgvBuilder argv{"viewstream_serve"};
    auto        parsed = VS::Serve::ParseServeArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9090);
    CHECK(parsed->batch_size == 5);
}

TEST_CASE("Command line wins over environment") {
    EnvGuard port{"VIEWSTREAM_SERVE_PORT", "9090"};

    ArgvBuilder argv{"viewstream_serve", "--port", "9191"};
    auto        parsed = VS::Serve::ParseServeArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->port == 9191);
}

TEST_CASE("Invalid input fails early") {
    SUBCASE("environment") {
        EnvGuard port{"VIEWSTREAM_SERVE_PORT", "70000"};
        ArgvBuilder argv{"viewstream_serve"};
        CHECK_FALSE(VS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
    }
    SUBCASE("missing value") {
        ArgvBuilder argv{"viewstream_serve", "--fragments"};
        CHECK_FALSE(VS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
    }
    SUBCASE("non numeric value") {
        ArgvBuilder argv{"viewstream_serve", "--batch-size", "8x"};
        CHECK_FALSE(VS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
    }
    SUBCASE("unknown flag") {
        ArgvBuilder argv{"viewstream_serve", "--bogus"};
        CHECK_FALSE(VS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
    }
}

TEST_CASE("Help flag is reported") {
    ArgvBuilder argv{"viewstream_serve", "--help"};
    auto        parsed = VS::Serve::ParseServeArguments(argv.argc(), argv.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}

} // TEST_SUITE
