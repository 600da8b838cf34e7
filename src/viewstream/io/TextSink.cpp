#include <viewstream/io/TextSink.hpp>

#include <ostream>
#include <utility>

namespace VS {

auto StringTextSink::write(std::string_view text) -> Expected<void> {
    this->text.append(text.data(), text.size());
    return {};
}

auto StringTextSink::write(char ch) -> Expected<void> {
    this->text.push_back(ch);
    return {};
}

auto StringTextSink::flush() -> Expected<void> {
    ++this->flushes;
    return {};
}

auto StringTextSink::take() -> std::string {
    return std::exchange(this->text, std::string{});
}

OstreamTextSink::OstreamTextSink(std::ostream& out) : out(out) {}

auto OstreamTextSink::write(std::string_view text) -> Expected<void> {
    this->out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!this->out) {
        return std::unexpected(Error{Error::Code::WriteFailed, "output stream rejected write"});
    }
    return {};
}

auto OstreamTextSink::flush() -> Expected<void> {
    this->out.flush();
    if (!this->out) {
        return std::unexpected(Error{Error::Code::FlushFailed, "output stream rejected flush"});
    }
    return {};
}

CountingTextSink::CountingTextSink(TextSink& inner) : inner(inner) {}

auto CountingTextSink::write(std::string_view text) -> Expected<void> {
    auto status = this->inner.write(text);
    if (status) {
        this->bytes += text.size();
    }
    return status;
}

auto CountingTextSink::write(char ch) -> Expected<void> {
    auto status = this->inner.write(ch);
    if (status) {
        ++this->bytes;
    }
    return status;
}

auto CountingTextSink::flush() -> Expected<void> {
    return this->inner.flush();
}

} // namespace VS
