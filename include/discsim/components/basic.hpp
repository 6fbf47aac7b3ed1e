#ifndef DISCSIM_COMPONENTS_BASIC_HPP
#define DISCSIM_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "discsim/math/vector_math.hpp"

namespace Components {

    // Distinct component types sharing the Vector2D arithmetic.
    struct Position : Vector2D {
        using Vector2D::Vector2D;
        Position() = default;
        Position(const Vector2D& v) : Vector2D(v) {}
    };

    struct Velocity : Vector2D {
        using Vector2D::Vector2D;
        Velocity() = default;
        Velocity(const Vector2D& v) : Vector2D(v) {}
    };

    struct Acceleration : Vector2D {
        using Vector2D::Vector2D;
        Acceleration() = default;
        Acceleration(const Vector2D& v) : Vector2D(v) {}
    };

    struct Mass {
        double value;
    };

    struct Radius {
        double value;
    };

    // Cosmetic only; the physics systems never read it.
    struct Color {
        uint8_t r, g, b, a;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255, uint8_t a = 255)
            : r(r), g(g), b(b), a(a) {}

        bool operator==(const Color& o) const {
            return r == o.r && g == o.g && b == o.b && a == o.a;
        }
        bool operator!=(const Color& o) const { return !(*this == o); }
    };

    /**
     * @brief Stable body identifier. Zero is never assigned.
     */
    struct BodyId {
        std::uint64_t value = 0;

        bool valid() const { return value != 0; }
        bool operator==(const BodyId& o) const { return value == o.value; }
        bool operator!=(const BodyId& o) const { return value != o.value; }
        bool operator<(const BodyId& o) const { return value < o.value; }
    };

} // namespace Components

#endif
