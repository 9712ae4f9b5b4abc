#pragma once

#include <cstddef>
#include <string_view>

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"

#ifndef SHAPEFUSION_MAX_NESTING_DEPTH
#define SHAPEFUSION_MAX_NESTING_DEPTH 128
#endif

namespace ShapeFusion {

constexpr std::size_t default_max_nesting_depth() {
    return SHAPEFUSION_MAX_NESTING_DEPTH;
}

/// Error state of one decode session. Owned by the deserializer and handed to
/// every visitor call, so format and visitor report through the same channel.
/// The first recorded error wins.
class DeserializationContext {
    DeserializeError m_error = DeserializeError::NO_ERROR;
    ErrorDetail m_detail{};
    std::size_t m_pos = 0;
    bool m_posStamped = false;
    std::size_t m_depth = 0;
    std::size_t m_maxDepth = default_max_nesting_depth();

public:
    constexpr DeserializationContext() = default;
    constexpr explicit DeserializationContext(std::size_t maxDepth): m_maxDepth(maxDepth) {}

    class DepthGuard {
        DeserializationContext * ctx;
    public:
        constexpr explicit DepthGuard(DeserializationContext * c): ctx(c) {}
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        constexpr ~DepthGuard() {
            if(ctx) ctx->m_depth --;
        }
        constexpr explicit operator bool() const {
            return ctx != nullptr;
        }
    };

    /// Enter one nesting level; the guard is false when the limit is hit.
    [[nodiscard]] constexpr DepthGuard enter() {
        if(m_depth >= m_maxDepth) {
            withError(DeserializeError::NESTING_TOO_DEEP);
            return DepthGuard(nullptr);
        }
        m_depth ++;
        return DepthGuard(this);
    }

    constexpr std::size_t depth() const {
        return m_depth;
    }

    constexpr bool withError(DeserializeError err) {
        if(m_error == DeserializeError::NO_ERROR) {
            m_error = err == DeserializeError::NO_ERROR ? DeserializeError::CUSTOM : err;
        }
        return false;
    }

    constexpr bool invalidType(Shape got, ShapeSet expected, std::string_view expecting) {
        if(failed()) return false;
        m_detail.got = got;
        m_detail.expected = expected;
        m_detail.expecting = expecting;
        return withError(DeserializeError::INVALID_TYPE);
    }

    constexpr bool invalidValue(Shape got, std::string_view expecting) {
        if(failed()) return false;
        m_detail.got = got;
        m_detail.expecting = expecting;
        return withError(DeserializeError::INVALID_VALUE);
    }

    constexpr bool invalidLength(std::size_t len, std::string_view expecting) {
        if(failed()) return false;
        m_detail.length = len;
        m_detail.expecting = expecting;
        return withError(DeserializeError::INVALID_LENGTH);
    }

    constexpr bool borrowUnavailable(Shape got, std::string_view expecting) {
        if(failed()) return false;
        m_detail.got = got;
        m_detail.expecting = expecting;
        return withError(DeserializeError::BORROW_UNAVAILABLE);
    }

    constexpr bool unknownField(std::string_view name) {
        return withName(DeserializeError::UNKNOWN_FIELD, name);
    }
    constexpr bool unknownVariant(std::string_view name) {
        return withName(DeserializeError::UNKNOWN_VARIANT, name);
    }
    constexpr bool missingField(std::string_view name) {
        return withName(DeserializeError::MISSING_FIELD, name);
    }
    constexpr bool duplicateField(std::string_view name) {
        return withName(DeserializeError::DUPLICATE_FIELD, name);
    }
    constexpr bool custom(std::string_view what) {
        if(failed()) return false;
        m_detail.expecting = what;
        return withError(DeserializeError::CUSTOM);
    }

    /// Called by deserializers after a failed step; keeps the innermost position.
    constexpr void stampPosition(std::size_t pos) {
        if(failed() && !m_posStamped) {
            m_pos = pos;
            m_posStamped = true;
        }
    }

    constexpr bool failed() const {
        return m_error != DeserializeError::NO_ERROR;
    }
    constexpr DeserializeError currentError() const {
        return m_error;
    }
    constexpr DeserializeResult result() const {
        return DeserializeResult(m_error, m_detail, m_pos);
    }

private:
    constexpr bool withName(DeserializeError err, std::string_view name) {
        if(failed()) return false;
        m_detail.name.assign(name);
        return withError(err);
    }
};

} // namespace ShapeFusion
