#include <viewstream/buffer/TextChunk.hpp>

#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/io/TextSink.hpp>

#include <array>
#include <charconv>
#include <stdexcept>
#include <type_traits>

namespace VS {

namespace {

auto checked_slice(std::span<char const> source, std::size_t offset, std::size_t length)
    -> std::span<char const> {
    if (offset > source.size()) {
        throw std::invalid_argument("TextChunk slice offset exceeds source length");
    }
    if (length > source.size() - offset) {
        throw std::invalid_argument("TextChunk slice length exceeds source length");
    }
    return source.subspan(offset, length);
}

} // namespace

TextChunk::TextChunk(std::string value) : value(std::move(value)) {}

TextChunk::TextChunk(char value) : value(value) {}

TextChunk::TextChunk(int value) : value(static_cast<std::int64_t>(value)) {}

TextChunk::TextChunk(std::int64_t value) : value(value) {}

TextChunk::TextChunk(std::span<char const> source, std::size_t offset, std::size_t length)
    : value(checked_slice(source, offset, length)) {}

auto TextChunk::kind() const -> Kind {
    return static_cast<Kind>(this->value.index());
}

auto TextChunk::empty() const -> bool {
    switch (this->kind()) {
    case Kind::Text:
        return std::get<std::string>(this->value).empty();
    case Kind::CharSlice:
        return std::get<std::span<char const>>(this->value).empty();
    case Kind::Char:
    case Kind::Int:
        return false;
    }
    return true;
}

// Presents the held value as a string_view without allocating and hands it to fn.
template <typename Fn>
auto TextChunk::withText(Fn&& fn) const -> Expected<void> {
    return std::visit(
        [&fn](auto const& held) -> Expected<void> {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, std::string>) {
                return fn(std::string_view{held});
            } else if constexpr (std::is_same_v<Held, char>) {
                return fn(std::string_view{&held, 1});
            } else if constexpr (std::is_same_v<Held, std::span<char const>>) {
                return fn(std::string_view{held.data(), held.size()});
            } else {
                std::array<char, kIntegerCapacity> digits{};
                auto [end, ec] = std::to_chars(digits.data(), digits.data() + digits.size(), held);
                if (ec != std::errc{}) {
                    return std::unexpected(Error{Error::Code::InvalidState, "integer chunk failed to format"});
                }
                return fn(std::string_view{digits.data(), static_cast<std::size_t>(end - digits.data())});
            }
        },
        this->value);
}

auto TextChunk::writeTo(TextSink& sink) const -> Expected<void> {
    if (auto const* ch = std::get_if<char>(&this->value)) {
        return sink.write(*ch);
    }
    return this->withText([&sink](std::string_view text) { return sink.write(text); });
}

auto TextChunk::writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> {
    return this->withText([&sink, &encoder](std::string_view text) { return encoder.encode(text, sink); });
}

auto TextChunk::toString() const -> std::string {
    std::string out;
    auto        status = this->withText([&out](std::string_view text) -> Expected<void> {
        out.assign(text.data(), text.size());
        return {};
    });
    if (!status) {
        out.clear();
    }
    return out;
}

auto TextChunk::toOwned() const -> TextChunk {
    if (auto const* slice = std::get_if<std::span<char const>>(&this->value)) {
        return TextChunk{std::string{slice->data(), slice->size()}};
    }
    return *this;
}

} // namespace VS
