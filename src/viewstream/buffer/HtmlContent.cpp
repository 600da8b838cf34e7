#include <viewstream/buffer/HtmlContent.hpp>

#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/io/TextSink.hpp>

#include <utility>

namespace VS {

HtmlString::HtmlString(std::string markup) : markup(std::move(markup)) {}

auto HtmlString::writeTo(TextSink& sink, HtmlEncoder const&) const -> Expected<void> {
    if (this->markup.empty()) {
        return {};
    }
    return sink.write(std::string_view{this->markup});
}

EncodedText::EncodedText(std::string text) : text(std::move(text)) {}

auto EncodedText::writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> {
    if (this->text.empty()) {
        return {};
    }
    return encoder.encode(this->text, sink);
}

} // namespace VS
