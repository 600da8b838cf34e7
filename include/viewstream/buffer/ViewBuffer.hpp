#pragma once

#include <viewstream/buffer/HtmlContent.hpp>
#include <viewstream/buffer/TextChunk.hpp>
#include <viewstream/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace VS {

class HtmlEncoder;
class TextSink;
struct Executor;

// One buffered entry: a chunk with its encoding provenance, or a content object.
class ViewBufferValue {
public:
    enum class Encoding : std::uint8_t {
        Encode,
        Markup,
    };

    ViewBufferValue(TextChunk chunk, Encoding encoding);
    explicit ViewBufferValue(std::shared_ptr<HtmlContent const> content);

    auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void>;

    [[nodiscard]] auto isContent() const -> bool;
    [[nodiscard]] auto encoding() const -> Encoding { return this->encoding_; }

private:
    std::variant<TextChunk, std::shared_ptr<HtmlContent const>> value_;
    Encoding                                                    encoding_;
};

/**
 * ViewBuffer: append-only, paged store of pending render output.
 *
 * Values are written out in insertion order. Chunks added with append() are
 * HTML-encoded at write-out; chunks added with appendHtml() are markup and
 * written verbatim. Empty strings and null content are never stored.
 *
 * writeTo() does not clear the buffer. After a failed or cancelled drain the
 * values already written stay written and the buffer keeps its contents;
 * callers must not clear() in that case.
 */
class ViewBuffer final : public HtmlContentContainer {
public:
    static constexpr std::size_t kViewPageSize        = 256;
    static constexpr std::size_t kPartialViewPageSize = 32;

    explicit ViewBuffer(std::string name = "view", std::size_t pageSize = kViewPageSize);

    ViewBuffer(ViewBuffer&&) noexcept            = default;
    ViewBuffer& operator=(ViewBuffer&&) noexcept = default;
    ViewBuffer(ViewBuffer const&)                = delete;
    ViewBuffer& operator=(ViewBuffer const&)     = delete;

    void append(TextChunk chunk);
    void appendHtml(TextChunk chunk);
    void appendHtml(std::shared_ptr<HtmlContent const> content);

    auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> override;
    auto writeTo(TextSink& sink, HtmlEncoder const& encoder, std::stop_token const& stop) const -> Expected<void>;

    // Runs writeTo on the executor; sink and encoder must outlive the future.
    auto writeToAsync(TextSink&          sink,
                      HtmlEncoder const& encoder,
                      Executor&          executor,
                      std::stop_token    stop = {}) const -> std::future<Expected<void>>;

    void clear();

    void copyTo(ViewBuffer& destination) const override;
    void moveTo(ViewBuffer& destination) override;

    [[nodiscard]] auto contents(HtmlEncoder const& encoder) const -> Expected<std::string>;

    [[nodiscard]] auto name() const -> std::string const& { return this->name_; }
    [[nodiscard]] auto pageSize() const -> std::size_t { return this->pageSize_; }
    [[nodiscard]] auto pageCount() const -> std::size_t { return this->pages_.size(); }
    [[nodiscard]] auto count() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool { return this->pages_.empty(); }

    template <typename Fn>
    void forEachValue(Fn&& fn) const {
        for (auto const& page : this->pages_) {
            for (auto const& entry : page) {
                fn(entry);
            }
        }
    }

private:
    using Page = std::vector<ViewBufferValue>;

    void push(ViewBufferValue value);

    std::string       name_;
    std::size_t       pageSize_;
    std::vector<Page> pages_;
};

} // namespace VS
