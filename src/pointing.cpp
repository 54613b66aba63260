/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget/errors.hpp>
#include <linkbudget/pointing.hpp>

#include <cmath>
#include <numbers>
#include <string>

namespace linkbudget {

std::string toString(EarthModel model) {
    switch (model) {
        case EarthModel::Ellipsoidal:
            return "ellipsoidal";
        case EarthModel::Spherical:
            return "spherical";
    }
    return "unknown";
}

Vec3 Geodetic::toECEF() const {
    return geodeticToECEF(*this);
}

// See documentation in pointing.hpp for the equations
Vec3 geodeticToECEF(const Geodetic& location) {
    double sinLat = std::sin(location.latInRadians);
    double cosLat = std::cos(location.latInRadians);
    double sinLon = std::sin(location.lonInRadians);
    double cosLon = std::cos(location.lonInRadians);

    // Radius of curvature in the prime vertical
    double N = GRS80_A / std::sqrt(1.0 - GRS80_E2 * sinLat * sinLat);

    // The geoid undulation is ignored, so the orthometric height is used
    // as the ellipsoidal height.
    double h = location.heightInMeters;

    return {
        (N + h) * cosLat * cosLon,
        (N + h) * cosLat * sinLon,
        (N * (1.0 - GRS80_E2) + h) * sinLat
    };
}

Mat3 enuRotation(double latInRadians, double lonInRadians) {
    double sinLat = std::sin(latInRadians);
    double cosLat = std::cos(latInRadians);
    double sinLon = std::sin(lonInRadians);
    double cosLon = std::cos(lonInRadians);

    //   - East points along the local latitude circle (toward increasing longitude)
    //   - North points along the local meridian (toward the pole)
    //   - Up points along the ellipsoid normal
    return {
        {-sinLon, cosLon, 0.0},
        {-sinLat * cosLon, -sinLat * sinLon, cosLat},
        {cosLat * cosLon, cosLat * sinLon, sinLat}
    };
}

Vec3 ecefToENU(const Vec3& targetECEF, const Geodetic& observer) {
    Vec3 diff = targetECEF - observer.toECEF();
    return enuRotation(observer.latInRadians, observer.lonInRadians) * diff;
}

LookAngles lookAnglesEllipsoidal(double subLongitudeInDegrees,
                                 double rxLongitudeInDegrees,
                                 double rxLatitudeInDegrees,
                                 double rxHeightInMeters,
                                 double altitudeInMeters) {
    // Step 1: Receiver and satellite in ECEF
    Geodetic observer{
        rxLatitudeInDegrees * DEGREES_TO_RADIANS,
        rxLongitudeInDegrees * DEGREES_TO_RADIANS,
        rxHeightInMeters
    };

    // The reflector lies in the equatorial plane
    double satLon = subLongitudeInDegrees * DEGREES_TO_RADIANS;
    double r = GRS80_A + altitudeInMeters;
    Vec3 satECEF{r * std::cos(satLon), r * std::sin(satLon), 0.0};

    // Step 2: Topocentric vector in the local frame. The rotation preserves
    // length, so the slant range is the norm of either vector.
    Vec3 enu = ecefToENU(satECEF, observer);
    double range = enu.magnitude();

    // Step 3: Geodetic azimuth and vertical angle
    double horizontal = std::sqrt(enu.x * enu.x + enu.y * enu.y);
    double elevation = std::atan2(enu.z, horizontal);
    double azimuth = std::atan2(enu.x, enu.y);

    double azimuthInDegrees = std::fmod(azimuth * RADIANS_TO_DEGREES, 360.0);
    if (azimuthInDegrees < 0) {
        azimuthInDegrees += 360.0;
    }

    return {elevation * RADIANS_TO_DEGREES, azimuthInDegrees, range};
}

LookAngles lookAnglesSpherical(double subLongitudeInDegrees,
                               double rxLongitudeInDegrees,
                               double rxLatitudeInDegrees,
                               double altitudeInMeters) {
    double satLon = subLongitudeInDegrees * DEGREES_TO_RADIANS;
    double rxLon = rxLongitudeInDegrees * DEGREES_TO_RADIANS;
    double rxLat = rxLatitudeInDegrees * DEGREES_TO_RADIANS;

    constexpr double R = EARTH_MEAN_RADIUS;
    double r = GRS80_A + altitudeInMeters;   // Earth's center to the reflector

    // Central angle between the receiver and the subsatellite point
    double cosGamma = std::cos(rxLat) * std::cos(satLon - rxLon);
    double gamma = std::acos(cosGamma);

    // Slant range (law of cosines)
    double ratio = R / r;
    double d = r * std::sqrt(1.0 + ratio * ratio - 2.0 * ratio * cosGamma);

    // Zenith angle (law of sines)
    double z = std::asin((r / d) * std::sin(gamma));
    double elevation = 90.0 - z * RADIANS_TO_DEGREES;

    // Angle between the meridian and the great circle through the
    // subsatellite point, measured from the pole nearest the receiver
    double beta = std::acos(std::tan(std::fabs(rxLat)) / std::tan(gamma)) * RADIANS_TO_DEGREES;

    // Relative longitude wrapped to [-pi, pi]
    double deltaLon = std::remainder(satLon - rxLon, 2.0 * std::numbers::pi);

    double azimuth;
    bool satelliteToWest = deltaLon < 0;
    if (rxLat > 0) {
        // Receiver north of the reflector
        azimuth = satelliteToWest ? 180.0 + beta   // SW
                                  : 180.0 - beta;  // SE
    } else {
        // Receiver south of the reflector
        azimuth = satelliteToWest ? 360.0 - beta   // NW
                                  : beta;          // NE
    }

    return {elevation, azimuth, d};
}

LookAngles lookAngles(double subLongitudeInDegrees,
                      double rxLongitudeInDegrees,
                      double rxLatitudeInDegrees,
                      double altitudeInMeters,
                      EarthModel model,
                      double rxHeightInMeters) {
    switch (model) {
        case EarthModel::Spherical:
            return lookAnglesSpherical(subLongitudeInDegrees, rxLongitudeInDegrees,
                                       rxLatitudeInDegrees, altitudeInMeters);
        case EarthModel::Ellipsoidal:
            return lookAnglesEllipsoidal(subLongitudeInDegrees, rxLongitudeInDegrees,
                                         rxLatitudeInDegrees, rxHeightInMeters,
                                         altitudeInMeters);
    }
    throw InvalidInputException("Unknown earth model");
}

}
