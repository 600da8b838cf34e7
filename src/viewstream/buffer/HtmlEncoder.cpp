#include <viewstream/buffer/HtmlEncoder.hpp>

#include <viewstream/io/TextSink.hpp>

namespace VS {

auto HtmlEncoder::encodeToString(std::string_view text) const -> Expected<std::string> {
    StringTextSink sink;
    if (auto status = this->encode(text, sink); !status) {
        return std::unexpected(status.error());
    }
    return sink.take();
}

auto HtmlEncoder::Default() -> HtmlEncoder const& {
    static DefaultHtmlEncoder const instance;
    return instance;
}

auto DefaultHtmlEncoder::entityFor(char ch) -> std::string_view {
    switch (ch) {
    case '&':
        return "&amp;";
    case '<':
        return "&lt;";
    case '>':
        return "&gt;";
    case '"':
        return "&quot;";
    case '\'':
        return "&#x27;";
    default:
        return {};
    }
}

auto DefaultHtmlEncoder::encode(std::string_view text, TextSink& sink) const -> Expected<void> {
    std::size_t runStart = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto entity = entityFor(text[i]);
        if (entity.empty()) {
            continue;
        }
        if (i > runStart) {
            if (auto status = sink.write(text.substr(runStart, i - runStart)); !status) {
                return status;
            }
        }
        if (auto status = sink.write(entity); !status) {
            return status;
        }
        runStart = i + 1;
    }
    if (runStart < text.size()) {
        return sink.write(text.substr(runStart));
    }
    return {};
}

} // namespace VS
