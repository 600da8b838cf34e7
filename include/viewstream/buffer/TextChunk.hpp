#pragma once

#include <viewstream/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace VS {

class HtmlEncoder;
class TextSink;

/**
 * TextChunk: one unit of pending output.
 *
 * Holds exactly one of: a string, a single character, a slice of a caller
 * owned character array, or an integer. Conversion to text is deferred until
 * writeTo(); integers are formatted into a stack buffer at that point.
 *
 * A slice does not own its characters. The source array must outlive the
 * chunk, or the chunk must be converted with toOwned() first.
 */
class TextChunk {
public:
    enum class Kind : std::uint8_t {
        Text,
        Char,
        CharSlice,
        Int,
    };

    explicit TextChunk(std::string value);
    explicit TextChunk(char value);
    explicit TextChunk(int value);
    explicit TextChunk(std::int64_t value);

    // Throws std::invalid_argument when [offset, offset + length) leaves source.
    TextChunk(std::span<char const> source, std::size_t offset, std::size_t length);

    [[nodiscard]] auto kind() const -> Kind;
    [[nodiscard]] auto empty() const -> bool;

    auto writeTo(TextSink& sink) const -> Expected<void>;
    auto writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void>;

    [[nodiscard]] auto toString() const -> std::string;
    [[nodiscard]] auto toOwned() const -> TextChunk;

private:
    static constexpr std::size_t kIntegerCapacity = 24;

    template <typename Fn>
    auto withText(Fn&& fn) const -> Expected<void>;

    std::variant<std::string, char, std::span<char const>, std::int64_t> value;
};

} // namespace VS
