/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Look angle computations based on:
 *   Soler, T. and Eisemann, D. "Determination of Look Angles to
 *   Geostationary Communication Satellites", J. Surv. Eng. 120(3), 1994.
 */

#ifndef __LINKBUDGET_POINTING_HPP
#define __LINKBUDGET_POINTING_HPP

#include <linkbudget/vector.hpp>

#include <numbers>
#include <string>

namespace linkbudget {

// ============================================================================
// Earth Model Constants
// ============================================================================

// GRS80 ellipsoid
constexpr double GRS80_A = 6378.137e3;                    // Equatorial radius (m)
constexpr double GRS80_F = 1.0 / 298.257222100882711;     // Flattening
constexpr double GRS80_E2 = 2.0 * GRS80_F - GRS80_F * GRS80_F;  // Eccentricity squared

constexpr double EARTH_MEAN_RADIUS = 6371e3;              // Mean radius (m)
constexpr double GEOSTATIONARY_ALTITUDE = 35786e3;        // Above the equator (m)

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Types
// ============================================================================

/**
 * Earth model used by the look angle solver.
 */
enum class EarthModel {
    Ellipsoidal,    ///< GRS80 ellipsoid (rigorous)
    Spherical       ///< Mean-radius sphere (approximation)
};

std::string toString(EarthModel model);

/**
 * Geodetic coordinates of a ground station.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double heightInMeters;    ///< Height above the ellipsoid

    Vec3 toECEF() const;
};

/**
 * Look angles from a ground station to a reflector (satellite or radar object).
 */
struct LookAngles {
    double elevationInDegrees;    ///< Angle above horizon (90 = overhead)
    double azimuthInDegrees;      ///< Compass direction in [0, 360), 0 = North, 90 = East
    double slantRangeInMeters;    ///< Straight-line distance to the reflector
};

// ============================================================================
// Coordinate Transformations
// ============================================================================

/**
 * Converts geodetic coordinates to Earth-Centered Earth-Fixed coordinates
 * on the GRS80 ellipsoid, in meters.
 *
 * X = (N + h) cos φ cos λ
 * Y = (N + h) cos φ sin λ
 * Z = (N (1 - e²) + h) sin φ
 *
 * where N = a / sqrt(1 - e² sin² φ) is the radius of curvature in the prime
 * vertical.
 */
Vec3 geodeticToECEF(const Geodetic& location);

/**
 * Rotation matrix taking ECEF vectors into the local East-North-Up frame
 * of an observer at the given latitude and longitude.
 */
Mat3 enuRotation(double latInRadians, double lonInRadians);

/**
 * Transforms a position from ECEF to ENU (East-North-Up) coordinates
 * relative to the observer.
 */
Vec3 ecefToENU(const Vec3& targetECEF, const Geodetic& observer);

// ============================================================================
// Look Angle Functions
// ============================================================================

/**
 * Computes look angles to a reflector above the equator using the GRS80
 * ellipsoid.
 *
 * @param subLongitudeInDegrees Longitude of the subsatellite point
 * @param rxLongitudeInDegrees Receiver longitude
 * @param rxLatitudeInDegrees Receiver geodetic latitude
 * @param rxHeightInMeters Receiver height above the ellipsoid
 * @param altitudeInMeters Reflector altitude above the equator
 */
LookAngles lookAnglesEllipsoidal(double subLongitudeInDegrees,
                                 double rxLongitudeInDegrees,
                                 double rxLatitudeInDegrees,
                                 double rxHeightInMeters = 0.0,
                                 double altitudeInMeters = GEOSTATIONARY_ALTITUDE);

/**
 * Computes look angles to a reflector above the equator using the
 * spherical approximation. The receiver is assumed to be at sea level.
 *
 * The azimuth is undefined when the receiver lies directly below the
 * reflector or at a pole.
 */
LookAngles lookAnglesSpherical(double subLongitudeInDegrees,
                               double rxLongitudeInDegrees,
                               double rxLatitudeInDegrees,
                               double altitudeInMeters = GEOSTATIONARY_ALTITUDE);

/**
 * Computes look angles (elevation, azimuth) and slant range to a reflector,
 * either active (satellite) or passive (radar object), located above the
 * equator.
 *
 * Positive longitudes are east, positive latitudes are north.
 */
LookAngles lookAngles(double subLongitudeInDegrees,
                      double rxLongitudeInDegrees,
                      double rxLatitudeInDegrees,
                      double altitudeInMeters = GEOSTATIONARY_ALTITUDE,
                      EarthModel model = EarthModel::Ellipsoidal,
                      double rxHeightInMeters = 0.0);

}

#endif
