#pragma once

#include <viewstream/core/Error.hpp>

#include <string>

namespace VS {

class HtmlContentContainer;
class HtmlEncoder;
class TextSink;
class ViewBuffer;

// A value that renders itself as markup.
class HtmlContent {
public:
    virtual ~HtmlContent() = default;

    virtual auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> = 0;

    // Capability query used by ViewBufferTextWriter::writeValue.
    virtual auto asContainer() -> HtmlContentContainer* { return nullptr; }
};

// A value holding renderable markup that can be transferred into a buffer.
class HtmlContentContainer : public HtmlContent {
public:
    virtual void copyTo(ViewBuffer& destination) const = 0;
    virtual void moveTo(ViewBuffer& destination)       = 0;

    auto asContainer() -> HtmlContentContainer* override { return this; }
};

// Markup that is already encoded and is written verbatim.
class HtmlString final : public HtmlContent {
public:
    explicit HtmlString(std::string markup);

    auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> override;

    [[nodiscard]] auto value() const -> std::string const& { return this->markup; }

private:
    std::string markup;
};

// Plain text that is HTML-encoded when written.
class EncodedText final : public HtmlContent {
public:
    explicit EncodedText(std::string text);

    auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> override;

    [[nodiscard]] auto value() const -> std::string const& { return this->text; }

private:
    std::string text;
};

} // namespace VS
