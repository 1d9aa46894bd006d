#pragma once

#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "decode_result.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "options.hpp"
#include "reader_concept.hpp"
#include "tee.hpp"

namespace JsonFork {

enum class EitherSide {
    None,
    Left,
    Right
};

template<class L, class R>
struct EitherResolution {
    EitherSide side = EitherSide::None;
    L left{};
    R right{};
    DecodeResult error;
};

// Write-once cell for an exception escaping a worker. The first capture wins.
class FirstFault {
    std::once_flag m_once;
    std::exception_ptr m_fault;
public:
    void capture(std::exception_ptr e) {
        std::call_once(m_once, [&] { m_fault = std::move(e); });
    }
    bool has_fault() const {
        return m_fault != nullptr;
    }
    void rethrow_if_any() const {
        if (m_fault) {
            std::rethrow_exception(m_fault);
        }
    }
};

// Stops both views and joins the worker and the copy task when the round ends,
// however it ends.
template<class TeeT>
class RoundGuard {
    TeeT & m_tee;
    std::thread m_worker;
public:
    explicit RoundGuard(TeeT & tee): m_tee(tee) {}
    RoundGuard(const RoundGuard&) = delete;
    RoundGuard& operator=(const RoundGuard&) = delete;

    ~RoundGuard() {
        m_tee.left().stop(false);
        m_tee.right().stop(false);
        finish();
    }

    template<class F>
    void spawn(F && f) {
        m_worker = std::thread(std::forward<F>(f));
    }

    TeeStatus finish() {
        if (m_worker.joinable()) {
            m_worker.join();
        }
        return m_tee.join();
    }
};

namespace either_detail {

// A view that ran dry because the source failed reports the source's own error.
template<class T>
DecodeResult DecodeBranch(T & dst, StreamView & view, const DecodeOptions & opts) {
    DecodeResult r = UnmarshalRead(dst, view, opts);
    if (!r && r.is_source_fault()) {
        const StreamFault f = view.fault();
        if (f.cause == CloseCause::source_error) {
            return DecodeResult(DecodeError::SOURCE_FAULT, f.reader_error, Kind::Invalid, f.offset, f.pointer);
        }
    }
    return r;
}

template<class Reader>
DecodeResult ReaderFailure(Reader & reader) {
    ReaderError rerr = reader.getError();
    std::size_t offset = reader.errorOffset();
    if (rerr == ReaderError::NO_ERROR) {
        rerr = ReaderError::UNEXPECTED_END_OF_DATA;
        offset = reader.offset();
    }
    return DecodeResult(DecodeError::READER_ERROR, rerr, Kind::Invalid, offset, reader.stack_pointer());
}

} // namespace either_detail


// Decodes the value under the cursor as L, or failing that as R.
// Scalars are read once and decoded twice in turn. Containers are duplicated:
// R decodes on a worker thread while L decodes here, each from its own view.
// Left wins when both succeed. An exception thrown by either side or by the
// source is rethrown once the round has been fully joined.
template<class L, class R, reader::TokenReaderLike Reader>
EitherResolution<L, R> ResolveEither(Reader & reader, const DecodeOptions & opts = {}) {
    EitherResolution<L, R> res;
    const Kind k = reader.peek_kind();
    const std::size_t offset = reader.offset();

    if (k != Kind::BeginObject && k != Kind::BeginArray) {
        std::string raw;
        if (!reader.read_value(raw)) {
            res.error = either_detail::ReaderFailure(reader);
            return res;
        }
        L l{};
        DecodeResult errL = Unmarshal(l, raw, opts);
        if (errL) {
            res.side = EitherSide::Left;
            res.left = std::move(l);
            return res;
        }
        R r{};
        DecodeResult errR = Unmarshal(r, raw, opts);
        if (errR) {
            res.side = EitherSide::Right;
            res.right = std::move(r);
            return res;
        }
        res.error = DecodeResult::BothFailed(std::move(errL), std::move(errR), k, offset, reader.stack_pointer());
        return res;
    }

    FirstFault fault;
    L l{};
    R r{};
    DecodeResult errL;
    DecodeResult errR;
    bool okL = false;
    bool okR = false;

    auto run_side = [&fault, &opts](auto & dst, StreamView & view, DecodeResult & err) {
        bool ok = false;
        try {
            err = either_detail::DecodeBranch(dst, view, opts);
            ok = static_cast<bool>(err);
        } catch (...) {
            fault.capture(std::current_exception());
        }
        view.stop(ok);
        return ok;
    };

    auto tee = Duplicate(reader, opts.tee_capacity);
    TeeStatus status;
    {
        RoundGuard<decltype(tee)> guard(tee);
        guard.spawn([&] { okR = run_side(r, tee.right(), errR); });
        okL = run_side(l, tee.left(), errL);
        status = guard.finish();
    }
    if (status.fault.cause == CloseCause::crashed) {
        fault.capture(status.fault.crash);
    }
    fault.rethrow_if_any();

    if (okL) {
        res.side = EitherSide::Left;
        res.left = std::move(l);
    } else if (okR) {
        res.side = EitherSide::Right;
        res.right = std::move(r);
    } else {
        res.error = DecodeResult::BothFailed(std::move(errL), std::move(errR), k, offset, reader.stack_pointer());
    }
    return res;
}


// Holds exactly one of L or R. The side not held stays at its zero value.
// A default constructed Either holds a zero L.
template<class L, class R>
class Either {
    bool m_isRight = false;
    L m_left{};
    R m_right{};

public:
    using left_type = L;
    using right_type = R;

    Either() = default;

    static Either Left(L l) {
        Either e;
        e.m_left = std::move(l);
        return e;
    }

    static Either Right(R r) {
        Either e;
        e.m_isRight = true;
        e.m_right = std::move(r);
        return e;
    }

    bool is_left() const {
        return !m_isRight;
    }
    bool is_right() const {
        return m_isRight;
    }
    const L & left() const {
        return m_left;
    }
    const R & right() const {
        return m_right;
    }

    template<class F>
    auto MapLeft(F && f) const -> Either<std::remove_cvref_t<std::invoke_result_t<F, const L&>>, R> {
        using Out = Either<std::remove_cvref_t<std::invoke_result_t<F, const L&>>, R>;
        if (!m_isRight) {
            return Out::Left(std::forward<F>(f)(m_left));
        }
        return Out::Right(m_right);
    }

    template<class F>
    auto MapRight(F && f) const -> Either<L, std::remove_cvref_t<std::invoke_result_t<F, const R&>>> {
        using Out = Either<L, std::remove_cvref_t<std::invoke_result_t<F, const R&>>>;
        if (!m_isRight) {
            return Out::Left(m_left);
        }
        return Out::Right(std::forward<F>(f)(m_right));
    }

    friend bool operator==(const Either&, const Either&) = default;

    // The held value is replaced only when one side decoded completely.
    template<reader::TokenReaderLike Reader>
    DecodeResult json_unmarshal_from(Reader & reader, const DecodeOptions & opts) {
        EitherResolution<L, R> res = ResolveEither<L, R>(reader, opts);
        switch (res.side) {
        case EitherSide::Left:
            *this = Left(std::move(res.left));
            return {};
        case EitherSide::Right:
            *this = Right(std::move(res.right));
            return {};
        default:
            return res.error;
        }
    }

    template<TokenWriterLike Writer>
    EncodeResult json_marshal_to(Writer & writer, const EncodeOptions & opts) const {
        if (!m_isRight) {
            return MarshalEncode(m_left, writer, opts);
        }
        return MarshalEncode(m_right, writer, opts);
    }
};

} // namespace JsonFork
