#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <istream>
#include <streambuf>
#include <string>
#include <string_view>

namespace JsonDescent {

/// Blocking pull interface used by StreamSource to refill its buffer.
/// read_some() stores up to `n` bytes and their count in `got`; it returns
/// false only on a read failure. `got == 0` with `true` means end of input.
template <class R>
concept ByteReaderLike = requires(R& r, const R& cr, char* buf, std::size_t n, std::size_t& got) {
    { r.read_some(buf, n, got) } -> std::same_as<bool>;
    { cr.error_message() } -> std::convertible_to<std::string_view>;
};

/// Reads from a std::istream through its stream buffer. Never asks for more
/// than is already buffered, so a value can be handed out before the producer
/// closes the stream.
class IstreamReader {
public:
    explicit IstreamReader(std::istream& in) : m_in(&in) {}

    bool read_some(char* buf, std::size_t n, std::size_t& got) {
        got = 0;
        std::streambuf* sb = m_in->rdbuf();
        if (sb == nullptr) {
            m_message = "stream has no buffer";
            return false;
        }
        try {
            std::streamsize want = 1;
            const std::streamsize avail = sb->in_avail();
            if (avail > 1) {
                want = avail < static_cast<std::streamsize>(n) ? avail : static_cast<std::streamsize>(n);
            }
            got = static_cast<std::size_t>(sb->sgetn(buf, want));
        } catch (const std::exception& e) {
            m_in->setstate(std::ios_base::badbit);
            m_message = e.what();
            return false;
        }
        if (got == 0) {
            m_in->setstate(std::ios_base::eofbit);
        }
        return true;
    }

    std::string_view error_message() const {
        return m_message;
    }

private:
    std::istream* m_in;
    std::string m_message;
};

static_assert(ByteReaderLike<IstreamReader>);

} // namespace JsonDescent
