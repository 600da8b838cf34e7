#pragma once

#include <viewstream/buffer/HtmlContent.hpp>
#include <viewstream/buffer/ViewBuffer.hpp>
#include <viewstream/core/Error.hpp>

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <ostream>
#include <span>
#include <sstream>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace VS {

class FlushMetrics;
class HtmlEncoder;
class TextSink;
class ViewBufferTextWriter;
struct Executor;

struct NoSink {};
struct TerminalSink {
    TextSink* sink = nullptr;
};
struct NestedSink {
    ViewBufferTextWriter* writer = nullptr;
};

// Where a flush sends buffered output. Only a terminal sink is ever written by flush().
using ExternalSink = std::variant<NoSink, TerminalSink, NestedSink>;

namespace detail {

template <typename T>
struct IsSharedPtr : std::false_type {};
template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
concept TextRepresentable = requires(std::ostream& os, T const& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

// Character types other than char have no single-byte text form.
template <typename T>
concept WideCharacter = std::same_as<T, wchar_t> || std::same_as<T, char8_t> || std::same_as<T, char16_t>
                        || std::same_as<T, char32_t>;

template <typename>
inline constexpr bool kAlwaysFalse = false;

} // namespace detail

/**
 * ViewBufferTextWriter: accumulates render output in a ViewBuffer and
 * forwards it to an external sink on flush().
 *
 * Writes never touch the external sink; they append to the buffer. Written
 * strings are treated as markup and are not HTML-encoded again.
 *
 * One logical writer per instance. The render loop and the flush caller are
 * serialized by the caller; the writer only detects overlap. A write, or a
 * second flush, issued while a flush is in flight throws std::logic_error.
 *
 * flush() is a no-op when there is no sink, or when the sink is another
 * writer. In those cases the content stays in the buffer.
 */
class ViewBufferTextWriter {
public:
    enum class State : std::uint8_t {
        Idle,
        Draining,
    };

    explicit ViewBufferTextWriter(ViewBuffer buffer);
    ViewBufferTextWriter(ViewBuffer buffer, TextSink& inner, HtmlEncoder const* encoder = nullptr);
    ViewBufferTextWriter(ViewBuffer buffer, ViewBufferTextWriter& nested, HtmlEncoder const* encoder = nullptr);

    // Waits for an in-flight flushAsync() to finish.
    ~ViewBufferTextWriter();

    ViewBufferTextWriter(ViewBufferTextWriter const&)            = delete;
    ViewBufferTextWriter& operator=(ViewBufferTextWriter const&) = delete;
    ViewBufferTextWriter(ViewBufferTextWriter&&)                 = delete;
    ViewBufferTextWriter& operator=(ViewBufferTextWriter&&)      = delete;

    void write(char value);
    void write(std::string_view value);
    void write(char const* value);
    void write(std::span<char const> buffer, std::size_t index, std::size_t count);
    void write(int value);
    void write(std::int64_t value);

    // Remaining integer types (unsigned, long long, bool) go through writeValue.
    template <std::integral I>
        requires(!std::same_as<I, char> && !detail::WideCharacter<I>)
    void write(I value) {
        this->writeValue(value);
    }
    template <detail::WideCharacter C>
    void write(C value) = delete;
    void write(std::shared_ptr<HtmlContent const> content);
    void write(HtmlContentContainer& container);

    void writeLine();
    void writeLine(char value);
    void writeLine(std::string_view value);
    void writeLine(std::span<char const> buffer, std::size_t index, std::size_t count);

    // Containers move their markup into the buffer, content renders itself,
    // anything else is written as text.
    template <typename T>
        requires(!detail::WideCharacter<std::remove_cvref_t<T>>)
    void writeValue(T&& value);

    // A null shared pointer writes nothing, not even the line ending.
    template <typename T>
        requires(!detail::WideCharacter<std::remove_cvref_t<T>>)
    void writeLineValue(T&& value) {
        if constexpr (detail::IsSharedPtr<std::remove_cvref_t<T>>::value) {
            if (!value) {
                this->ensureIdle();
                return;
            }
        }
        this->writeValue(std::forward<T>(value));
        this->writeLine();
    }

    auto flush() -> Expected<void>;
    auto flushAsync(Executor& executor) -> std::future<Expected<void>>;

    // Stops an in-flight flush at the next value boundary; it ends with Cancelled.
    void cancelFlush();

    void setMetrics(FlushMetrics* metrics) { this->metrics = metrics; }

    [[nodiscard]] auto state() const -> State;
    [[nodiscard]] auto isFlushing() const -> bool { return this->state() == State::Draining; }
    [[nodiscard]] auto buffer() -> ViewBuffer& { return this->viewBuffer; }
    [[nodiscard]] auto buffer() const -> ViewBuffer const& { return this->viewBuffer; }
    [[nodiscard]] auto externalSink() const -> ExternalSink const& { return this->sink; }
    [[nodiscard]] auto encoder() const -> HtmlEncoder const& { return *this->htmlEncoder; }
    [[nodiscard]] auto newLine() const -> std::string const& { return this->lineEnding; }
    void setNewLine(std::string value) { this->lineEnding = std::move(value); }

private:
    class InUseScope;

    void ensureIdle();
    auto acquire() -> std::stop_token;
    void release();
    auto terminalSink() const -> TextSink*;
    auto drainAndFlush(TextSink& target, std::stop_token const& stop) -> Expected<void>;

    ViewBuffer              viewBuffer;
    ExternalSink            sink;
    HtmlEncoder const*      htmlEncoder;
    FlushMetrics*           metrics = nullptr;
    std::string             lineEnding{"\n"};
    std::atomic<bool>       inUse{false};
    std::mutex              idleMutex;
    std::condition_variable idleCV;
    std::mutex              stopMutex;
    std::stop_source        stopSource;
};

template <typename T>
    requires(!detail::WideCharacter<std::remove_cvref_t<T>>)
void ViewBufferTextWriter::writeValue(T&& value) {
    using U = std::remove_cvref_t<T>;
    using D = std::decay_t<T>;

    if constexpr (detail::IsSharedPtr<U>::value) {
        using Element = typename U::element_type;
        this->ensureIdle();
        if (!value) {
            return;
        }
        if constexpr (std::is_base_of_v<HtmlContent, std::remove_const_t<Element>>) {
            if constexpr (!std::is_const_v<Element>) {
                if (auto* container = value->asContainer()) {
                    this->write(*container);
                    return;
                }
            }
            this->write(std::shared_ptr<HtmlContent const>(value));
        } else {
            this->writeValue(*value);
        }
    } else if constexpr (std::is_base_of_v<HtmlContentContainer, U>) {
        if constexpr (std::is_const_v<std::remove_reference_t<T>>) {
            this->ensureIdle();
            value.copyTo(this->viewBuffer);
        } else {
            this->write(static_cast<HtmlContentContainer&>(value));
        }
    } else if constexpr (std::is_base_of_v<HtmlContent, U>) {
        this->write(std::shared_ptr<HtmlContent const>(std::make_shared<U const>(std::forward<T>(value))));
    } else if constexpr (std::is_pointer_v<D> && std::is_same_v<std::remove_cv_t<std::remove_pointer_t<D>>, char>) {
        this->write(static_cast<char const*>(value));
    } else if constexpr (std::is_same_v<U, char>) {
        this->write(value);
    } else if constexpr (std::is_same_v<U, bool>) {
        this->write(std::string_view{value ? "true" : "false"});
    } else if constexpr (std::is_integral_v<U>) {
        if constexpr (std::is_signed_v<U>) {
            this->write(static_cast<std::int64_t>(value));
        } else {
            if (value <= static_cast<std::make_unsigned_t<std::int64_t>>(std::numeric_limits<std::int64_t>::max())) {
                this->write(static_cast<std::int64_t>(value));
            } else {
                this->write(std::string_view{std::to_string(value)});
            }
        }
    } else if constexpr (std::is_convertible_v<T const&, std::string_view>) {
        this->write(std::string_view{value});
    } else if constexpr (detail::TextRepresentable<U>) {
        std::ostringstream out;
        out << value;
        this->write(std::string_view{out.str()});
    } else {
        static_assert(detail::kAlwaysFalse<U>, "writeValue: type has no text representation");
    }
}

} // namespace VS
