#pragma once

#include <viewstream/core/Error.hpp>

#include <string>
#include <string_view>

namespace VS {

class TextSink;

// Maps raw text to text that is safe to embed in HTML markup.
class HtmlEncoder {
public:
    virtual ~HtmlEncoder() = default;

    virtual auto encode(std::string_view text, TextSink& sink) const -> Expected<void> = 0;

    [[nodiscard]] auto encodeToString(std::string_view text) const -> Expected<std::string>;

    static auto Default() -> HtmlEncoder const&;
};

// Escapes '&', '<', '>', '"' and '\''; everything else passes through untouched.
class DefaultHtmlEncoder final : public HtmlEncoder {
public:
    auto encode(std::string_view text, TextSink& sink) const -> Expected<void> override;

    [[nodiscard]] static auto entityFor(char ch) -> std::string_view;
};

} // namespace VS
