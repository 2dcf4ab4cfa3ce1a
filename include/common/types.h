#ifndef ENCGEN_TYPES_H
#define ENCGEN_TYPES_H

#include <ostream>

namespace encgen {

// Used for positions, sizes, per-axis scales and envelope corners alike
struct Vector3 {
    double x;
    double y;
    double z;

    Vector3 operator+(const Vector3& other) const {
        return Vector3{x + other.x, y + other.y, z + other.z};
    }

    Vector3 operator-(const Vector3& other) const {
        return Vector3{x - other.x, y - other.y, z - other.z};
    }

    Vector3 operator*(double f) const {
        return Vector3{x * f, y * f, z * f};
    }

    Vector3 operator/(double f) const {
        return Vector3{x / f, y / f, z / f};
    }

    double operator[](int axis) const {
        return axis == 0 ? x : (axis == 1 ? y : z);
    }

    bool operator==(const Vector3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const Vector3& other) const {
        return !(*this == other);
    }

    bool allPositive() const {
        return x > 0 && y > 0 && z > 0;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Vector3& v) {
    return os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

// Rectangular, axis-aligned operational intent volume
struct OperationalIntent {
    Vector3 lower;
    Vector3 upper;

    bool isValid() const {
        return lower.x <= upper.x && lower.y <= upper.y && lower.z <= upper.z;
    }

    Vector3 size() const {
        return upper - lower;
    }
};

enum class Axis {
    X = 0,
    Y = 1,
    Z = 2
};

} // namespace encgen

#endif // ENCGEN_TYPES_H
