#include <doctest/doctest.h>

#include <viewstream/buffer/HtmlContent.hpp>
#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/io/TextSink.hpp>

#include <string>

using namespace VS;

namespace {

struct RejectingSink final : TextSink {
    using TextSink::write;
    auto write(std::string_view) -> Expected<void> override {
        return std::unexpected(Error{Error::Code::WriteFailed, "rejected"});
    }
    auto flush() -> Expected<void> override { return {}; }
};

} // namespace

TEST_SUITE("buffer.html_encoder") {

TEST_CASE("Default encoder escapes markup characters") {
    auto encoded = HtmlEncoder::Default().encodeToString("a<b>&\"c'");
    REQUIRE(encoded.has_value());
    CHECK(*encoded == "a&lt;b&gt;&amp;&quot;c&#x27;");
}

TEST_CASE("Safe text passes through untouched") {
    auto encoded = HtmlEncoder::Default().encodeToString("plain text 123 åäö");
    REQUIRE(encoded.has_value());
    CHECK(*encoded == "plain text 123 åäö");

    auto empty = HtmlEncoder::Default().encodeToString("");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("entityFor maps only escaped characters") {
    CHECK(DefaultHtmlEncoder::entityFor('<') == "&lt;");
    CHECK(DefaultHtmlEncoder::entityFor('\'') == "&#x27;");
    CHECK(DefaultHtmlEncoder::entityFor('a').empty());
}

TEST_CASE("Sink errors propagate out of encode") {
    RejectingSink sink;
    auto          status = HtmlEncoder::Default().encode("<", sink);
    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().code == Error::Code::WriteFailed);
}

TEST_CASE("HtmlString is verbatim and EncodedText is escaped") {
    StringTextSink sink;
    HtmlString     markup{"<em>"};
    EncodedText    text{"<em>"};
    REQUIRE(markup.writeTo(sink, HtmlEncoder::Default()).has_value());
    REQUIRE(text.writeTo(sink, HtmlEncoder::Default()).has_value());
    CHECK(sink.str() == "<em>&lt;em&gt;");
    CHECK(markup.asContainer() == nullptr);
}

} // TEST_SUITE
