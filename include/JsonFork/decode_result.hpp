#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "errors.hpp"
#include "token.hpp"

namespace JsonFork {

struct AlternativeCauses;

class DecodeResult {
    DecodeError m_error = DecodeError::NO_ERROR;
    ReaderError m_readerError = ReaderError::NO_ERROR;
    Kind m_kind = Kind::Invalid;
    std::size_t m_offset = 0;
    std::string m_pointer;
    std::string m_member;
    std::shared_ptr<const AlternativeCauses> m_causes;

public:
    DecodeResult() = default;
    DecodeResult(DecodeError err, ReaderError rerr, Kind kind, std::size_t offset, std::string pointer):
        m_error(err), m_readerError(rerr), m_kind(kind), m_offset(offset), m_pointer(std::move(pointer))
    {}

    static DecodeResult BothFailed(DecodeResult left, DecodeResult right, Kind kind, std::size_t offset, std::string pointer);

    operator bool() const {
        return m_error == DecodeError::NO_ERROR;
    }

    DecodeError error() const {
        return m_error;
    }
    ReaderError readerError() const {
        return m_readerError;
    }
    // JSON kind that was met where the error happened.
    Kind kind() const {
        return m_kind;
    }
    std::size_t offset() const {
        return m_offset;
    }
    // JSON Pointer relative to the start of the failing decode.
    const std::string & pointer() const {
        return m_pointer;
    }
    // Offending member name for UNKNOWN_MEMBER and DUPLICATE_KEY.
    const std::string & member() const {
        return m_member;
    }
    void set_member(std::string name) {
        m_member = std::move(name);
    }

    bool is_source_fault() const {
        return m_error == DecodeError::SOURCE_FAULT;
    }

    bool has_causes() const {
        return m_causes != nullptr;
    }
    const DecodeResult & left_cause() const;
    const DecodeResult & right_cause() const;
};

struct AlternativeCauses {
    DecodeResult left;
    DecodeResult right;
};

inline DecodeResult DecodeResult::BothFailed(DecodeResult left, DecodeResult right, Kind kind, std::size_t offset, std::string pointer) {
    DecodeResult res(DecodeError::BOTH_ALTERNATIVES_FAILED, ReaderError::NO_ERROR, kind, offset, std::move(pointer));
    res.m_causes = std::make_shared<const AlternativeCauses>(AlternativeCauses{std::move(left), std::move(right)});
    return res;
}

inline const DecodeResult & DecodeResult::left_cause() const {
    static const DecodeResult none;
    return m_causes ? m_causes->left : none;
}

inline const DecodeResult & DecodeResult::right_cause() const {
    static const DecodeResult none;
    return m_causes ? m_causes->right : none;
}


class EncodeResult {
    EncodeError m_error = EncodeError::NO_ERROR;
    WriterError m_writerError = WriterError::NO_ERROR;
    std::string m_pointer;

public:
    EncodeResult() = default;
    EncodeResult(EncodeError err, WriterError werr, std::string pointer = {}):
        m_error(err), m_writerError(werr), m_pointer(std::move(pointer))
    {}
    operator bool() const {
        return m_error == EncodeError::NO_ERROR;
    }
    EncodeError error() const {
        return m_error;
    }
    WriterError writerError() const {
        return m_writerError;
    }
    const std::string & pointer() const {
        return m_pointer;
    }
};

} // namespace JsonFork
