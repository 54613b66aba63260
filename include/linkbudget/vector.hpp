/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_VECTOR_HPP
#define __LINKBUDGET_VECTOR_HPP

#include <cmath>

namespace linkbudget {

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }
};

/**
 * Row-major 3x3 matrix, used for frame rotations.
 */
struct Mat3 {
    Vec3 row0, row1, row2;

    Vec3 operator*(const Vec3& v) const {
        return {row0.dot(v), row1.dot(v), row2.dot(v)};
    }

    Mat3 transpose() const {
        return {
            {row0.x, row1.x, row2.x},
            {row0.y, row1.y, row2.y},
            {row0.z, row1.z, row2.z}
        };
    }
};

}

#endif
