#pragma once

#include <viewstream/core/Error.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace VS {

/**
 * TextSink: destination for rendered text.
 *
 * Contract
 * --------
 * - write(...) accepts arbitrary text; an I/O failure is reported as an Error
 *   and is never retried by callers in this library.
 * - flush() pushes anything the sink holds to its own destination. A sink may
 *   block inside flush() for as long as its transport needs.
 * - Sinks are not required to be thread-safe; a single writer drives them.
 */
class TextSink {
public:
    virtual ~TextSink() = default;

    virtual auto write(std::string_view text) -> Expected<void> = 0;
    virtual auto write(char ch) -> Expected<void> {
        return this->write(std::string_view{&ch, 1});
    }
    virtual auto flush() -> Expected<void> = 0;
};

// In-memory sink; the accumulated text is the full response.
class StringTextSink final : public TextSink {
public:
    using TextSink::write;

    auto write(std::string_view text) -> Expected<void> override;
    auto write(char ch) -> Expected<void> override;
    auto flush() -> Expected<void> override;

    [[nodiscard]] auto str() const -> std::string const& { return this->text; }
    [[nodiscard]] auto flushCount() const -> std::size_t { return this->flushes; }
    auto take() -> std::string;

private:
    std::string text;
    std::size_t flushes = 0;
};

class OstreamTextSink final : public TextSink {
public:
    explicit OstreamTextSink(std::ostream& out);

    using TextSink::write;

    auto write(std::string_view text) -> Expected<void> override;
    auto flush() -> Expected<void> override;

private:
    std::ostream& out;
};

// Forwards to another sink while counting the bytes that were accepted.
class CountingTextSink final : public TextSink {
public:
    explicit CountingTextSink(TextSink& inner);

    using TextSink::write;

    auto write(std::string_view text) -> Expected<void> override;
    auto write(char ch) -> Expected<void> override;
    auto flush() -> Expected<void> override;

    [[nodiscard]] auto bytesWritten() const -> std::size_t { return this->bytes; }

private:
    TextSink&   inner;
    std::size_t bytes = 0;
};

} // namespace VS
