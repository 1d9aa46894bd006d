#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "io.hpp"
#include "pipe.hpp"
#include "reader_concept.hpp"
#include "token.hpp"
#include "writer.hpp"

namespace JsonFork {

// One branch of a duplicated value. A consumer reads it as a ByteSourceLike
// and must stop() it on every exit path so the copy never blocks on it.
class StreamView {
public:
    virtual ~StreamView() = default;

    virtual SourceChunk read(char * buf, std::size_t n) = 0;

    // Abnormal close, seen by the copy task as a fault.
    virtual void close() = 0;

    // Early close that the copy task ignores. Idempotent, safe from any thread.
    virtual void stop(bool successful) = 0;

    // Why the data ended when read() reported failure; cause none otherwise.
    virtual StreamFault fault() const = 0;
};

static_assert(ByteSourceLike<StreamView>);


// Holds a scalar already taken from the source.
class BufferView final : public StreamView {
    mutable std::mutex m_mutex;
    std::string m_data;
    std::size_t m_pos = 0;
    bool m_closed = false;
    StreamFault m_fault;

public:
    explicit BufferView(std::string data, StreamFault fault = {}):
        m_data(std::move(data)), m_fault(std::move(fault)) {}

    SourceChunk read(char * buf, std::size_t n) override {
        std::lock_guard lock(m_mutex);
        if (m_closed) {
            return {0, SourceStatus::end};
        }
        const std::size_t cnt = std::min(n, m_data.size() - m_pos);
        m_data.copy(buf, cnt, m_pos);
        m_pos += cnt;
        if (cnt > 0) {
            return {cnt, SourceStatus::ok};
        }
        return {0, m_fault.is_fault() ? SourceStatus::failed : SourceStatus::end};
    }

    void close() override {
        std::lock_guard lock(m_mutex);
        m_closed = true;
    }

    void stop(bool) override {
        close();
    }

    StreamFault fault() const override {
        std::lock_guard lock(m_mutex);
        return m_fault;
    }
};


// Read end of a Pipe fed by the copy task.
class PipeView final : public StreamView {
    mutable std::mutex m_mutex;
    Pipe & m_pipe;
    bool m_closed = false;
    StreamFault m_fault;

    void close_with(CloseCause cause) {
        std::lock_guard lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_pipe.close_read(StreamFault{cause});
    }

public:
    explicit PipeView(Pipe & pipe): m_pipe(pipe) {}

    SourceChunk read(char * buf, std::size_t n) override {
        {
            std::lock_guard lock(m_mutex);
            if (m_closed) {
                return {0, SourceStatus::end};
            }
        }
        StreamFault cause;
        const std::size_t got = m_pipe.read(buf, n, cause);
        if (got > 0) {
            return {got, SourceStatus::ok};
        }
        switch (cause.cause) {
        case CloseCause::none:
            return {0, SourceStatus::end};
        case CloseCause::crashed:
            std::rethrow_exception(cause.crash);
        default: {
            std::lock_guard lock(m_mutex);
            m_fault = std::move(cause);
            return {0, SourceStatus::failed};
        }
        }
    }

    void close() override {
        close_with(CloseCause::closed);
    }

    void stop(bool successful) override {
        close_with(successful ? CloseCause::stopped : CloseCause::failed_early);
    }

    StreamFault fault() const override {
        std::lock_guard lock(m_mutex);
        return m_fault;
    }
};


// Fans every byte out to two pipes. A branch whose consumer stopped on purpose
// drops out silently; once both dropped out writes are discarded, so the copy
// still drains the source up to the end of the value.
class MultiPipeSink {
    struct Branch {
        Pipe * pipe;
        bool open = true;
    };
    std::array<Branch, 2> m_branches;
    StreamFault m_failure;

public:
    MultiPipeSink(Pipe & left, Pipe & right): m_branches{Branch{&left}, Branch{&right}} {}

    bool write(const char * data, std::size_t n) {
        for (Branch & b : m_branches) {
            if (!b.open) {
                continue;
            }
            StreamFault res = b.pipe->write(data, n);
            if (res.cause == CloseCause::none) {
                continue;
            }
            b.open = false;
            if (!res.is_deliberate()) {
                m_failure = std::move(res);
                return false;
            }
        }
        return true;
    }

    const StreamFault & failure() const {
        return m_failure;
    }
};

static_assert(ByteSinkLike<MultiPipeSink>);


struct TeeStatus {
    StreamFault fault;

    operator bool() const {
        return !fault.is_fault();
    }
};


// Splits the next value of a reader into two independent byte streams.
// Scalars are read eagerly into two buffers; containers are copied token by
// token by a background task into two bounded pipes. After join() the reader
// sits right past the value, or at the fault that stopped the copy.
template<reader::TokenReaderLike Reader>
class Tee {
    Pipe m_leftPipe;
    Pipe m_rightPipe;
    std::unique_ptr<StreamView> m_left;
    std::unique_ptr<StreamView> m_right;
    TeeStatus m_status;
    bool m_buffered = false;
    std::thread m_copy;

    static StreamFault source_fault(Reader & source) {
        ReaderError rerr = source.getError();
        std::size_t offset = source.errorOffset();
        if (rerr == ReaderError::NO_ERROR) {
            rerr = ReaderError::UNEXPECTED_END_OF_DATA;
            offset = source.offset();
        }
        return StreamFault{CloseCause::source_error, rerr, offset, source.stack_pointer()};
    }

    void start_buffered(Reader & source) {
        m_buffered = true;
        std::string raw;
        if (!source.read_value(raw)) {
            m_status.fault = source_fault(source);
        }
        m_left = std::make_unique<BufferView>(raw, m_status.fault);
        m_right = std::make_unique<BufferView>(std::move(raw), m_status.fault);
    }

    void copy(Reader & source) {
        MultiPipeSink sink(m_leftPipe, m_rightPipe);
        TokenWriter<MultiPipeSink> writer(sink);
        StreamFault fault;
        try {
            const std::size_t depth = source.stack_depth();
            Token tok;
            do {
                if (source.read_token(tok) != reader::TryParseStatus::ok) {
                    fault = source_fault(source);
                    break;
                }
                if (!writer.write_token(tok)) {
                    fault = sink.failure().is_fault() ? sink.failure() : StreamFault{CloseCause::closed};
                    break;
                }
            } while (source.stack_depth() > depth);
        } catch (...) {
            fault = StreamFault{CloseCause::crashed};
            fault.crash = std::current_exception();
        }
        m_leftPipe.close_write(fault);
        m_rightPipe.close_write(fault);
        m_status.fault = std::move(fault);
    }

public:
    Tee(Reader & source, std::size_t capacity):
        m_leftPipe(capacity), m_rightPipe(capacity)
    {
        const Kind k = source.peek_kind();
        if (k == Kind::BeginObject || k == Kind::BeginArray) {
            m_left = std::make_unique<PipeView>(m_leftPipe);
            m_right = std::make_unique<PipeView>(m_rightPipe);
            m_copy = std::thread([this, &source] { copy(source); });
        } else {
            start_buffered(source);
        }
    }

    Tee(const Tee&) = delete;
    Tee& operator=(const Tee&) = delete;

    ~Tee() {
        m_left->stop(false);
        m_right->stop(false);
        join();
    }

    StreamView & left() {
        return *m_left;
    }
    StreamView & right() {
        return *m_right;
    }

    // True when the value was a scalar and no copy task runs.
    bool buffered() const {
        return m_buffered;
    }

    // Waits for the copy task. Idempotent.
    TeeStatus join() {
        if (m_copy.joinable()) {
            m_copy.join();
        }
        return m_status;
    }
};

template<reader::TokenReaderLike Reader>
Tee<Reader> Duplicate(Reader & source, std::size_t capacity = 4096) {
    return Tee<Reader>(source, capacity);
}

} // namespace JsonFork
