#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace JsonFork {

// 1) Iterator you can:
//    - read as *it   (convertible to char)
//    - advance as ++it
template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class It, class Sent>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;


enum class SourceStatus {
    ok,
    end,
    failed
};

struct SourceChunk {
    std::size_t size = 0;
    SourceStatus status = SourceStatus::ok;
};

// Pull-style byte source: fills up to n bytes, reports end of data or failure.
// A read returning zero bytes with status ok is retried.
template<class S>
concept ByteSourceLike = requires(S & s, char * buf, std::size_t n) {
    { s.read(buf, n) } -> std::same_as<SourceChunk>;
};


// Buffers a ByteSourceLike and exposes it one char at a time.
// Single pass: consumed bytes are gone.
template<ByteSourceLike Source, std::size_t BufSize = 512>
class SourceCursor {
    Source * m_source;
    std::array<char, BufSize> m_buf{};
    std::size_t m_pos = 0;
    std::size_t m_len = 0;
    SourceStatus m_status = SourceStatus::ok;

    bool fill() {
        while (m_pos == m_len && m_status == SourceStatus::ok) {
            SourceChunk chunk = m_source->read(m_buf.data(), m_buf.size());
            m_pos = 0;
            m_len = chunk.size;
            if (chunk.status != SourceStatus::ok) {
                m_status = chunk.status;
            }
        }
        return m_pos < m_len;
    }
public:
    explicit SourceCursor(Source & s): m_source(&s) {}
    SourceCursor(const SourceCursor&) = delete;
    SourceCursor& operator=(const SourceCursor&) = delete;

    bool at_end() {
        return !fill();
    }
    char peek() {
        return m_buf[m_pos];
    }
    void bump() {
        ++m_pos;
    }
    bool failed() const {
        return m_status == SourceStatus::failed;
    }
};

template<class Cursor>
class SourceIterator {
    Cursor * m_cursor = nullptr;
public:
    using iterator_concept = std::input_iterator_tag;
    using value_type = char;
    using difference_type = std::ptrdiff_t;

    SourceIterator() = default;
    explicit SourceIterator(Cursor & c): m_cursor(&c) {}

    char operator*() const {
        return m_cursor->peek();
    }
    SourceIterator & operator++() {
        m_cursor->bump();
        return *this;
    }
    void operator++(int) {
        m_cursor->bump();
    }
    friend bool operator==(const SourceIterator & it, std::default_sentinel_t) {
        return it.m_cursor->at_end();
    }
};


// ByteSourceLike over a borrowed buffer, handing out at most `step` bytes per read.
class StringSource {
    std::string_view m_data;
    std::size_t m_step;
public:
    explicit StringSource(std::string_view data, std::size_t step = 4096):
        m_data(data), m_step(step == 0 ? 1 : step) {}

    SourceChunk read(char * buf, std::size_t n) {
        if (m_data.empty()) {
            return {0, SourceStatus::end};
        }
        std::size_t cnt = std::min({n, m_step, m_data.size()});
        m_data.copy(buf, cnt);
        m_data.remove_prefix(cnt);
        return {cnt, SourceStatus::ok};
    }
};

static_assert(ByteSourceLike<StringSource>);
static_assert(CharSentinelFor<SourceIterator<SourceCursor<StringSource>>, std::default_sentinel_t>);

} // namespace JsonFork
