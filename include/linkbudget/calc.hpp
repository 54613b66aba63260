/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Link budget and other RF calculations.
 *
 * References:
 *   [1] Couch, L. W. Digital & Analog Communication Systems.
 *   [2] Lindgren, M. (2015). A 1296 MHz Earth-Moon-Earth Communication
 *       System (Master's thesis).
 */

#ifndef __LINKBUDGET_CALC_HPP
#define __LINKBUDGET_CALC_HPP

#include <optional>
#include <vector>

namespace linkbudget {

// ============================================================================
// Physical Constants
// ============================================================================

constexpr double SPEED_OF_LIGHT = 299792458.0;      // m/s
constexpr double T0 = 290.0;                        // Standard noise temperature (K)
constexpr double BOLTZMANN_DB = -228.6;             // Boltzmann's constant (dBW/Hz/K)
constexpr double COAX_LOSS_DB_PER_FT = 8.0 / 100.0; // RG6 coaxial line

// ============================================================================
// Unit Conversions
// ============================================================================

/** Converts a power ratio in dB to linear units. */
double dbToAbs(double valueInDb);

/** Converts a linear power ratio to dB. */
double absToDb(double value);

/** Carrier wavelength in meters. */
double wavelength(double freqInHz);

// ============================================================================
// Data Types
// ============================================================================

/**
 * Loss and noise figure of a passive transmission line.
 */
struct LineLoss {
    double lossInDb;
    double noiseFigureInDb;
};

/**
 * A radar object illuminated by the transmitter.
 */
struct RadarTarget {
    double crossSectionInSquareMeters;
    bool bistatic = false;
    /// Object to receiver distance; bistatic mode only
    std::optional<double> rxDistanceInMeters;
};

// ============================================================================
// Antenna & Power
// ============================================================================

/**
 * Gain of a parabolic dish.
 *
 * Gain = 4π Ae / λ², with the effective aperture Ae = η A and the physical
 * aperture A of a circle. Assumes a 56% aperture efficiency (Table 8-4 in
 * [1]).
 *
 * @param diameterInMeters Dish diameter
 * @param freqInHz Frequency of interest
 * @return Gain in dB
 */
double dishGain(double diameterInMeters, double freqInHz);

/**
 * Effective isotropically radiated power.
 *
 * @param txPowerInDbw Power feeding the antenna
 * @param txGainInDb Transmit antenna gain
 * @return EIRP in dBW
 */
double eirp(double txPowerInDbw, double txGainInDb);

// ============================================================================
// Path Loss
// ============================================================================

/**
 * One-way free-space path loss 20 log10(4π d / λ), Eq. 8-11 in [1].
 */
double freeSpacePathLoss(double distanceInMeters, double freqInHz);

/**
 * Gain of a radar object, 10 log10(4π σ / λ²), Eq. 3.23 in [2].
 *
 * The RCS of a radar object is the hypothetical area intercepting the amount
 * of power which, when scattered isotropically, produces at the receiver the
 * same power density as the actual object.
 */
double radarObjectGain(double crossSectionInSquareMeters, double freqInHz);

/**
 * Free-space path loss (transmission loss), optionally for a radar link.
 *
 * In radar mode the loss covers the forward and reverse paths (to and from
 * the radar object) as well as the scattering at the object. Monostatic mode
 * uses Eq. 3.26 in [2], bistatic mode Eq. 3.24 in [2].
 *
 * @param distanceInMeters Transmitter to receiver distance, or transmitter to
 *        radar object distance in radar mode
 * @param freqInHz Carrier frequency
 * @param radar Radar object, if any
 * @return Path loss in dB
 * @throws InvalidInputException if the frequency or distance is not positive
 *         or a bistatic target has no receiver distance
 */
double pathLoss(double distanceInMeters, double freqInHz,
                const std::optional<RadarTarget>& radar = std::nullopt);

/**
 * Path loss with the radar parameters given separately.
 *
 * @throws InvalidInputException in radar mode without a cross section, or in
 *         bistatic mode without a receiver distance
 */
double pathLoss(double distanceInMeters, double freqInHz, bool radar,
                std::optional<double> crossSectionInSquareMeters,
                bool bistatic = false,
                std::optional<double> rxDistanceInMeters = std::nullopt);

// ============================================================================
// Noise
// ============================================================================

/**
 * Loss and noise figure of an RG6 coaxial line.
 *
 * Noise factor F = 1 + (Tl / T0)(L - 1). At Tl = T0 the noise figure equals
 * the loss in dB, as for any passive two-port at room temperature (Eq. 8.32a
 * in [1], Eq. 4.22 in [2]).
 *
 * @param lengthInFeet Line length
 * @param lineTempInKelvin Physical temperature of the line
 */
LineLoss coaxLossAndNoiseFigure(double lengthInFeet, double lineTempInKelvin = T0);

/**
 * Overall noise figure of cascaded linear devices (Friis, Eq. 8-34 in [1]).
 *
 * The gain of the last device is irrelevant and must be omitted, so exactly
 * one gain fewer than noise figures is expected.
 *
 * @param noiseFiguresInDb Noise figure of each stage, in chain order
 * @param gainsInDb Gain of each stage except the last
 * @return Noise figure in dB
 * @throws InvalidInputException if the lists are empty or mismatched
 */
double totalNoiseFigure(const std::vector<double>& noiseFiguresInDb,
                        const std::vector<double>& gainsInDb);

/**
 * Effective input-noise temperature, Te = T0 (F - 1), Eq. 8-30b in [1].
 */
double noiseFigureToNoiseTemp(double noiseFigureInDb);

/**
 * Noise figure of an effective input-noise temperature, F = 1 + Te / T0.
 */
double noiseTempToNoiseFigure(double noiseTempInKelvin);

/**
 * Receiver system noise temperature, Eq. 8-41 in [1].
 *
 * The antenna is not treated as another cascaded device: the sky and ground
 * noise it collects adds to the noise of the receiver seen as a single
 * equivalent two-port.
 *
 * @param antennaNoiseTempInKelvin Antenna noise temperature
 * @param inputNoiseTempInKelvin Receiver effective input-noise temperature
 */
double systemNoiseTemp(double antennaNoiseTempInKelvin, double inputNoiseTempInKelvin);

// ============================================================================
// Carrier-to-Noise & Capacity
// ============================================================================

/** Received power at the antenna terminals, in dBW. */
double rxPower(double eirpInDbw, double pathLossInDb, double rxGainInDb);

/** Receiver figure of merit G/T, in dB/K. */
double gainOverTemp(double rxGainInDb, double systemNoiseTempInDbK);

/**
 * Carrier-to-noise ratio, Eq. 8-43 in [1].
 *
 * @param eirpInDbw EIRP
 * @param pathLossInDb Free-space path loss
 * @param rxGainInDb Receive antenna gain
 * @param systemNoiseTempInDbK System noise temperature in dBK
 * @param bandwidthInHz IF equivalent bandwidth
 * @return C/N in dB
 */
double cnr(double eirpInDbw, double pathLossInDb, double rxGainInDb,
           double systemNoiseTempInDbK, double bandwidthInHz);

/**
 * Shannon channel capacity.
 *
 * @return Capacity in bits per second
 */
double capacity(double snrInDb, double bandwidthInHz);

}

#endif
