#include <doctest/doctest.h>

#include <viewstream/buffer/HtmlContent.hpp>
#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/buffer/ViewBuffer.hpp>
#include <viewstream/io/TextSink.hpp>
#include <viewstream/task/TaskPool.hpp>

#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>

using namespace VS;

namespace {

auto text(char const* value) -> TextChunk {
    return TextChunk{std::string{value}};
}

auto contentsOf(ViewBuffer const& buffer) -> std::string {
    auto contents = buffer.contents(HtmlEncoder::Default());
    REQUIRE(contents.has_value());
    return *contents;
}

} // namespace

TEST_SUITE("buffer.view_buffer") {

TEST_CASE("Values are drained in append order across pages") {
    ViewBuffer buffer{"paged", 2};
    buffer.appendHtml(text("a"));
    buffer.appendHtml(TextChunk{7});
    buffer.appendHtml(TextChunk{'b'});
    buffer.appendHtml(text("cd"));
    buffer.appendHtml(TextChunk{-1});

    CHECK(buffer.count() == 5);
    CHECK(buffer.pageCount() == 3);
    CHECK(buffer.pageSize() == 2);
    CHECK(buffer.name() == "paged");
    CHECK(contentsOf(buffer) == "a7bcd-1");
}

TEST_CASE("Zero page size is a usage error") {
    CHECK_THROWS_AS(ViewBuffer("bad", 0), std::invalid_argument);
}

TEST_CASE("append encodes while appendHtml keeps markup") {
    ViewBuffer buffer;
    buffer.appendHtml(text("<p>"));
    buffer.append(text("1 < 2"));
    buffer.appendHtml(text("</p>"));
    CHECK(contentsOf(buffer) == "<p>1 &lt; 2</p>");

    std::size_t encoded = 0;
    buffer.forEachValue([&encoded](ViewBufferValue const& value) {
        if (value.encoding() == ViewBufferValue::Encoding::Encode) {
            ++encoded;
        }
    });
    CHECK(encoded == 1);
}

TEST_CASE("Empty strings and null content are not stored") {
    ViewBuffer buffer;
    buffer.append(text(""));
    buffer.appendHtml(text(""));
    buffer.appendHtml(std::shared_ptr<HtmlContent const>{});
    CHECK(buffer.empty());
    CHECK(buffer.count() == 0);
    CHECK(contentsOf(buffer).empty());
}

TEST_CASE("Content values render themselves") {
    ViewBuffer buffer;
    buffer.appendHtml(std::make_shared<HtmlString>("<b>"));
    buffer.appendHtml(std::make_shared<EncodedText>("x&y"));

    auto nested = std::make_shared<ViewBuffer>("nested");
    nested->appendHtml(text("</b>"));
    buffer.appendHtml(nested);

    CHECK(buffer.count() == 3);
    CHECK(contentsOf(buffer) == "<b>x&amp;y</b>");
}

TEST_CASE("clear drops all pages") {
    ViewBuffer buffer{"clear", 1};
    buffer.appendHtml(text("a"));
    buffer.appendHtml(text("b"));
    buffer.clear();
    CHECK(buffer.empty());
    CHECK(buffer.pageCount() == 0);
}

TEST_CASE("copyTo keeps the source and moveTo empties it") {
    ViewBuffer source{"source"};
    source.appendHtml(text("<i>"));
    source.append(text("&"));

    ViewBuffer copy{"copy"};
    copy.appendHtml(text("["));
    source.copyTo(copy);
    CHECK(source.count() == 2);
    CHECK(contentsOf(copy) == "[<i>&amp;");

    ViewBuffer moved{"moved"};
    source.moveTo(moved);
    CHECK(source.empty());
    CHECK(contentsOf(moved) == "<i>&amp;");

    moved.moveTo(moved);
    CHECK(moved.count() == 2);
}

TEST_CASE("A requested stop ends the drain with Cancelled") {
    ViewBuffer buffer;
    buffer.appendHtml(text("a"));

    std::stop_source stop;
    stop.request_stop();

    StringTextSink sink;
    auto           status = buffer.writeTo(sink, HtmlEncoder::Default(), stop.get_token());
    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().code == Error::Code::Cancelled);
    CHECK(sink.str().empty());
    CHECK(buffer.count() == 1);
}

TEST_CASE("writeToAsync drains on an executor") {
    TaskPool   pool{2};
    ViewBuffer buffer;
    buffer.appendHtml(text("async"));
    buffer.appendHtml(TextChunk{42});

    StringTextSink sink;
    auto           future = buffer.writeToAsync(sink, HtmlEncoder::Default(), pool);
    auto           status = future.get();
    CHECK(status.has_value());
    CHECK(sink.str() == "async42");
    CHECK(buffer.count() == 2);

    SUBCASE("refused submissions surface the executor error") {
        pool.shutdown();
        StringTextSink other;
        auto           refused = buffer.writeToAsync(other, HtmlEncoder::Default(), pool).get();
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::ExecutorShutdown);
        CHECK(other.str().empty());
    }
}

} // TEST_SUITE
