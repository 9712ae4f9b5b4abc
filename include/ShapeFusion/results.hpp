#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "shape.hpp"
#include "errors.hpp"

namespace ShapeFusion {

/// Offending key or variant name. Copied, since the input it came from may be
/// transient.
class InlineName {
public:
    static constexpr std::size_t Capacity = 64;

    constexpr InlineName() = default;
    constexpr InlineName(std::string_view s) {
        assign(s);
    }
    constexpr void assign(std::string_view s) {
        m_len = s.size() < Capacity ? s.size() : Capacity;
        for(std::size_t i = 0; i < m_len; i ++) {
            m_buf[i] = s[i];
        }
    }
    constexpr std::string_view view() const {
        return std::string_view(m_buf, m_len);
    }
    constexpr bool empty() const {
        return m_len == 0;
    }
private:
    char        m_buf[Capacity] = {};
    std::size_t m_len = 0;
};

struct ErrorDetail {
    std::optional<Shape> got;        // shape found in the input
    ShapeSet             expected;   // shapes the visitor declared it can build from
    std::string_view     expecting;  // visitor's own description, static storage
    InlineName           name;       // unknown/missing/duplicate field or variant
    std::size_t          length = 0; // element count for INVALID_LENGTH
};


class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    std::size_t m_pos = 0;
public:
    constexpr SerializeResult(SerializeError err, std::size_t pos):
        m_error(err), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    /// Bytes (or tokens, or nodes) produced before the result was taken.
    constexpr std::size_t pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
};


class DeserializeResult {
    DeserializeError m_error = DeserializeError::NO_ERROR;
    ErrorDetail m_detail;
    std::size_t m_pos = 0;
public:
    constexpr DeserializeResult(DeserializeError err, const ErrorDetail & detail, std::size_t pos):
        m_error(err), m_detail(detail), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == DeserializeError::NO_ERROR;
    }
    /// Offset of the offending input unit; its unit (byte, token, node) is format-defined.
    constexpr std::size_t pos() const {
        return m_pos;
    }
    constexpr DeserializeError error() const {
        return m_error;
    }
    constexpr ErrorClass errorClass() const {
        return error_class(m_error);
    }
    constexpr const ErrorDetail & detail() const {
        return m_detail;
    }
    constexpr std::optional<Shape> got() const {
        return m_detail.got;
    }
    constexpr ShapeSet expected() const {
        return m_detail.expected;
    }
    constexpr std::string_view expecting() const {
        return m_detail.expecting;
    }
    constexpr std::string_view name() const {
        return m_detail.name.view();
    }
};

} // namespace ShapeFusion
