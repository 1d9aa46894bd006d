#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

namespace JsonFork {

enum class CloseCause {
    none,           // clean end of data
    stopped,        // consumer finished successfully and stopped early
    failed_early,   // consumer gave up on its own decode
    closed,         // consumer closed the stream without stopping
    source_error,   // the duplicated source failed to produce a token
    crashed         // an exception escaped while advancing the source
};

constexpr std::string_view close_cause_to_string(CloseCause c) {
    switch(c) {
    case CloseCause::none: return "none"; break;
    case CloseCause::stopped: return "stopped"; break;
    case CloseCause::failed_early: return "failed early"; break;
    case CloseCause::closed: return "closed"; break;
    case CloseCause::source_error: return "source error"; break;
    case CloseCause::crashed: return "crashed"; break;
    }
    return "N/A";
}

struct StreamFault {
    CloseCause cause = CloseCause::none;
    ReaderError reader_error = ReaderError::NO_ERROR;
    std::size_t offset = 0;
    std::string pointer;
    std::exception_ptr crash;

    // Expected shutdown: a consumer stopping on its own is not a fault of the copy.
    bool is_deliberate() const {
        return cause == CloseCause::stopped || cause == CloseCause::failed_early;
    }
    bool is_fault() const {
        return cause == CloseCause::source_error || cause == CloseCause::crashed || cause == CloseCause::closed;
    }
};

// Bounded single-producer/single-consumer byte channel. write blocks while full,
// read blocks while empty; either end can close with a cause the other end sees.
class Pipe {
    std::mutex m_mutex;
    std::condition_variable m_readable;
    std::condition_variable m_writable;
    std::vector<char> m_buf;
    std::size_t m_head = 0;
    std::size_t m_size = 0;
    bool m_writerClosed = false;
    bool m_readerClosed = false;
    StreamFault m_writerCause;
    StreamFault m_readerCause;

public:
    explicit Pipe(std::size_t capacity = 4096): m_buf(capacity == 0 ? 1 : capacity) {}
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // Returns the reader's close cause when the reader went away, none otherwise.
    StreamFault write(const char * data, std::size_t n) {
        std::unique_lock lock(m_mutex);
        while (n > 0) {
            m_writable.wait(lock, [&] { return m_readerClosed || m_writerClosed || m_size < m_buf.size(); });
            if (m_readerClosed) {
                return m_readerCause;
            }
            if (m_writerClosed) {
                return StreamFault{CloseCause::closed};
            }
            while (n > 0 && m_size < m_buf.size()) {
                m_buf[(m_head + m_size) % m_buf.size()] = *data++;
                ++m_size;
                --n;
            }
            m_readable.notify_one();
        }
        return {};
    }

    void close_write(StreamFault cause) {
        std::lock_guard lock(m_mutex);
        if (m_writerClosed) {
            return;
        }
        m_writerClosed = true;
        m_writerCause = std::move(cause);
        m_readable.notify_all();
        m_writable.notify_all();
    }

    // Blocks until data or closure. Returns 0 at the end; cause then tells why.
    std::size_t read(char * out, std::size_t cap, StreamFault & cause) {
        std::unique_lock lock(m_mutex);
        m_readable.wait(lock, [&] { return m_readerClosed || m_writerClosed || m_size > 0; });
        if (m_readerClosed) {
            cause = StreamFault{};
            return 0;
        }
        if (m_size == 0) {
            cause = m_writerCause;
            return 0;
        }
        std::size_t n = 0;
        while (n < cap && m_size > 0) {
            out[n++] = m_buf[m_head];
            m_head = (m_head + 1) % m_buf.size();
            --m_size;
        }
        m_writable.notify_one();
        return n;
    }

    // First close wins; later calls are no-ops.
    bool close_read(StreamFault cause) {
        std::lock_guard lock(m_mutex);
        if (m_readerClosed) {
            return false;
        }
        m_readerClosed = true;
        m_readerCause = std::move(cause);
        m_readable.notify_all();
        m_writable.notify_all();
        return true;
    }
};

} // namespace JsonFork
