#pragma once
/**
 * @file types.h
 * @brief Core type definitions for Tessera
 *
 * This file defines fundamental types used throughout the conflict engine,
 * including numeric types, identifiers, clocks and canvas geometry.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>

namespace tessera {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for canvas coordinates
 */
using Real = double;

using Float32 = float;
using Float64 = double;

// Integer types
using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Identifiers
// ============================================================================

using WhiteboardId = std::string;
using UserId = std::string;
using ElementId = std::string;
using OperationId = std::string;
using ConflictId = std::string;

/**
 * @brief Scalar Lamport counter used to break ties between concurrent clocks
 */
using LamportTime = UInt64;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Wall-clock time point
 *
 * Wall-clock timestamps are advisory. Causal order is decided by vector
 * clocks; wall time only feeds recency windows, temporal proximity and
 * analytics bucketing.
 */
using Timestamp = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Signed distance between two timestamps in milliseconds
 */
inline Int64 millis_between(Timestamp from, Timestamp to) noexcept {
    return std::chrono::duration_cast<Milliseconds>(to - from).count();
}

// ============================================================================
// Canvas Geometry
// ============================================================================

/**
 * @brief 2D canvas point (cursor, element origin)
 */
struct Point {
    Real x{0.0};
    Real y{0.0};

    constexpr Point() noexcept = default;
    constexpr Point(Real x_, Real y_) noexcept : x(x_), y(y_) {}

    Real distance_to(const Point& other) const noexcept {
        const Real dx = x - other.x;
        const Real dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    constexpr bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const Point& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Axis-aligned bounding box of a canvas element
 */
struct Bounds {
    Real x{0.0};
    Real y{0.0};
    Real width{0.0};
    Real height{0.0};

    constexpr Bounds() noexcept = default;
    constexpr Bounds(Real x_, Real y_, Real w, Real h) noexcept
        : x(x_), y(y_), width(w), height(h) {}

    constexpr Real area() const noexcept { return width * height; }
    constexpr Real right() const noexcept { return x + width; }
    constexpr Real bottom() const noexcept { return y + height; }

    constexpr bool contains(const Point& p) const noexcept {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    /**
     * @brief Intersection rectangle (zero-sized when disjoint)
     */
    Bounds intersection(const Bounds& other) const noexcept {
        const Real left = std::max(x, other.x);
        const Real top = std::max(y, other.y);
        const Real r = std::min(right(), other.right());
        const Real b = std::min(bottom(), other.bottom());
        if (r <= left || b <= top) {
            return Bounds{left, top, 0.0, 0.0};
        }
        return Bounds{left, top, r - left, b - top};
    }

    /**
     * @brief Intersection over union, in [0, 1]
     */
    Real overlap_ratio(const Bounds& other) const noexcept {
        const Real inter = intersection(other).area();
        const Real uni = area() + other.area() - inter;
        return uni > 0.0 ? inter / uni : 0.0;
    }

    constexpr bool operator==(const Bounds& other) const noexcept {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
    constexpr bool operator!=(const Bounds& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace tessera
