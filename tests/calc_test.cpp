/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <linkbudget/calc.hpp>
#include <linkbudget/errors.hpp>

#include <cmath>
#include <optional>
#include <vector>

namespace linkbudget {
namespace {

// EME-style radar scenario
constexpr double RADAR_FREQ = 1.296e9;
constexpr double RADAR_DISTANCE = 1000e3;
constexpr double RADAR_RCS = 10.0;

// ============================================================================
// Unit Conversion Tests
// ============================================================================

TEST(UnitConversionTest, DbToAbs) {
    EXPECT_DOUBLE_EQ(dbToAbs(0.0), 1.0);
    EXPECT_NEAR(dbToAbs(10.0), 10.0, 1e-12);
    EXPECT_NEAR(dbToAbs(-30.0), 1e-3, 1e-15);
}

TEST(UnitConversionTest, AbsToDb) {
    EXPECT_DOUBLE_EQ(absToDb(1.0), 0.0);
    EXPECT_NEAR(absToDb(100.0), 20.0, 1e-12);
}

TEST(UnitConversionTest, Wavelength) {
    EXPECT_NEAR(wavelength(12e9), 0.0249827, 1e-7);
}

TEST(UnitConversionTest, WavelengthRejectsZeroFrequency) {
    EXPECT_THROW(wavelength(0.0), InvalidInputException);
}

// ============================================================================
// Antenna & Power Tests
// ============================================================================

TEST(DishGainTest, KuBandDish) {
    // 1.2 m dish at 12 GHz
    EXPECT_NEAR(dishGain(1.2, 12e9), 41.0327150, 1e-6);
}

TEST(DishGainTest, LBandDish) {
    EXPECT_NEAR(dishGain(3.0, RADAR_FREQ), 29.6599903, 1e-6);
}

TEST(DishGainTest, DoublingDiameterAddsSixDb) {
    double g1 = dishGain(1.0, 10e9);
    double g2 = dishGain(2.0, 10e9);
    EXPECT_NEAR(g2 - g1, 20.0 * std::log10(2.0), 1e-9);
}

TEST(DishGainTest, RejectsNonPositiveDiameter) {
    EXPECT_THROW(dishGain(0.0, 12e9), InvalidInputException);
    EXPECT_THROW(dishGain(-1.0, 12e9), InvalidInputException);
}

TEST(EIRPTest, IsSum) {
    EXPECT_DOUBLE_EQ(eirp(20.0, 30.0), 50.0);
    EXPECT_DOUBLE_EQ(eirp(-3.0, 0.0), -3.0);
}

// ============================================================================
// Path Loss Tests
// ============================================================================

TEST(PathLossTest, FreeSpaceGeostationaryKuBand) {
    double loss = pathLoss(36975074.36930162, 12e9);
    EXPECT_NEAR(loss, 205.389589, 1e-5);
}

TEST(PathLossTest, NonRadarIsOneWayLoss) {
    EXPECT_DOUBLE_EQ(pathLoss(1e6, 1e9), freeSpacePathLoss(1e6, 1e9));
    EXPECT_DOUBLE_EQ(pathLoss(1e6, 1e9, false, std::nullopt), freeSpacePathLoss(1e6, 1e9));
}

TEST(PathLossTest, DoublingDistanceAddsSixDb) {
    double l1 = freeSpacePathLoss(1e6, 1e9);
    double l2 = freeSpacePathLoss(2e6, 1e9);
    EXPECT_NEAR(l2 - l1, 20.0 * std::log10(2.0), 1e-9);
}

TEST(PathLossTest, RadarObjectGain) {
    EXPECT_NEAR(radarObjectGain(RADAR_RCS, RADAR_FREQ), 33.7077846, 1e-6);
}

TEST(PathLossTest, MonostaticRadar) {
    double loss = pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, RADAR_RCS);
    EXPECT_NEAR(loss, 275.6919819, 1e-6);
}

TEST(PathLossTest, MonostaticEqualsTwiceOneWayMinusObjectGain) {
    double expected = 2.0 * freeSpacePathLoss(RADAR_DISTANCE, RADAR_FREQ)
                    - radarObjectGain(RADAR_RCS, RADAR_FREQ);
    RadarTarget target{RADAR_RCS};
    EXPECT_NEAR(pathLoss(RADAR_DISTANCE, RADAR_FREQ, target), expected, 1e-9);
}

TEST(PathLossTest, BistaticRadar) {
    double loss = pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, RADAR_RCS, true, 2000e3);
    EXPECT_NEAR(loss, 281.7125818, 1e-6);
}

TEST(PathLossTest, BistaticWithEqualDistancesMatchesMonostatic) {
    double mono = pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, RADAR_RCS);
    double bi = pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, RADAR_RCS, true, RADAR_DISTANCE);
    EXPECT_NEAR(bi, mono, 1e-9);
}

TEST(PathLossTest, RadarWithoutCrossSectionThrows) {
    EXPECT_THROW(pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, std::nullopt), InvalidInputException);
}

TEST(PathLossTest, BistaticWithoutRxDistanceThrows) {
    EXPECT_THROW(pathLoss(RADAR_DISTANCE, RADAR_FREQ, true, RADAR_RCS, true), InvalidInputException);

    RadarTarget target{RADAR_RCS, true, std::nullopt};
    EXPECT_THROW(pathLoss(RADAR_DISTANCE, RADAR_FREQ, target), InvalidInputException);
}

TEST(PathLossTest, BistaticCheckedBeforeDistance) {
    // The missing rx distance is reported even when the distance is invalid
    try {
        pathLoss(-1.0, RADAR_FREQ, true, RADAR_RCS, true);
        FAIL() << "Expected InvalidInputException";
    } catch (const InvalidInputException& e) {
        EXPECT_STREQ(e.what(), "Rx distance required in bistatic radar mode");
    }
}

TEST(PathLossTest, RejectsNonPositiveDistance) {
    EXPECT_THROW(pathLoss(0.0, 1e9), InvalidInputException);
}

// ============================================================================
// Noise Tests
// ============================================================================

TEST(CoaxTest, LossIsLinearInLength) {
    auto coax = coaxLossAndNoiseFigure(10.0);
    EXPECT_NEAR(coax.lossInDb, 0.8, 1e-12);
    auto longer = coaxLossAndNoiseFigure(100.0);
    EXPECT_NEAR(longer.lossInDb, 8.0, 1e-12);
}

TEST(CoaxTest, NoiseFigureEqualsLossAtT0) {
    for (double length : {0.0, 1.0, 10.0, 55.5, 200.0}) {
        auto coax = coaxLossAndNoiseFigure(length, T0);
        EXPECT_NEAR(coax.noiseFigureInDb, coax.lossInDb, 1e-9) << "length " << length;
    }
}

TEST(CoaxTest, HotLineIsNoisier) {
    auto coax = coaxLossAndNoiseFigure(100.0, 350.0);
    EXPECT_NEAR(coax.noiseFigureInDb, 8.6970718, 1e-6);
    EXPECT_GT(coax.noiseFigureInDb, coax.lossInDb);
}

TEST(CoaxTest, ColdLineIsQuieter) {
    auto coax = coaxLossAndNoiseFigure(100.0, 77.0);
    EXPECT_LT(coax.noiseFigureInDb, coax.lossInDb);
}

TEST(TotalNoiseFigureTest, SingleStageIsIdentity) {
    EXPECT_DOUBLE_EQ(totalNoiseFigure({3.5}, {}), 3.5);
    EXPECT_DOUBLE_EQ(totalNoiseFigure({0.0}, {}), 0.0);
}

TEST(TotalNoiseFigureTest, TwoStages) {
    EXPECT_NEAR(totalNoiseFigure({2.0, 10.0}, {20.0}), 2.2398712, 1e-6);
}

TEST(TotalNoiseFigureTest, ReceiveChain) {
    // LNB -> 10 ft coax -> receiver
    EXPECT_NEAR(totalNoiseFigure({1.0, 0.8, 8.0}, {55.0, -0.8}), 1.0000718, 1e-6);
}

TEST(TotalNoiseFigureTest, HighGainFirstStageDominates) {
    double nf = totalNoiseFigure({1.5, 20.0}, {60.0});
    EXPECT_NEAR(nf, 1.5, 1e-3);
}

TEST(TotalNoiseFigureTest, EmptyNoiseFiguresThrows) {
    EXPECT_THROW(totalNoiseFigure({}, {}), InvalidInputException);
}

TEST(TotalNoiseFigureTest, GainCountMismatchThrows) {
    EXPECT_THROW(totalNoiseFigure({1.0, 2.0}, {}), InvalidInputException);
    EXPECT_THROW(totalNoiseFigure({1.0, 2.0}, {10.0, 20.0}), InvalidInputException);
    EXPECT_THROW(totalNoiseFigure({1.0}, {10.0}), InvalidInputException);
}

TEST(NoiseConversionTest, OneDbNoiseFigure) {
    EXPECT_NEAR(noiseFigureToNoiseTemp(1.0), 75.0883694, 1e-6);
}

TEST(NoiseConversionTest, ZeroNoiseFigureIsZeroKelvin) {
    EXPECT_NEAR(noiseFigureToNoiseTemp(0.0), 0.0, 1e-12);
    EXPECT_NEAR(noiseTempToNoiseFigure(0.0), 0.0, 1e-12);
}

TEST(NoiseConversionTest, T0IsThreeDb) {
    EXPECT_NEAR(noiseTempToNoiseFigure(T0), 10.0 * std::log10(2.0), 1e-12);
}

TEST(NoiseConversionTest, ConversionsAreInverses) {
    for (double nf : {0.1, 0.5, 1.0, 2.7, 6.0, 10.0, 25.0}) {
        EXPECT_NEAR(noiseTempToNoiseFigure(noiseFigureToNoiseTemp(nf)), nf, 1e-9) << "nf " << nf;
    }
    for (double temp : {10.0, 75.0, 290.0, 1000.0}) {
        EXPECT_NEAR(noiseFigureToNoiseTemp(noiseTempToNoiseFigure(temp)), temp, 1e-9) << "temp " << temp;
    }
}

TEST(SystemNoiseTempTest, IsSum) {
    EXPECT_DOUBLE_EQ(systemNoiseTemp(30.0, 75.0), 105.0);
}

// ============================================================================
// Carrier-to-Noise & Capacity Tests
// ============================================================================

TEST(CNRTest, Equation) {
    double sysTempDbK = absToDb(105.09440897525221);
    double value = cnr(50.0, 205.38958926647538, 35.0, sysTempDbK, 1e6);
    EXPECT_NEAR(value, 27.9946146, 1e-6);
}

TEST(CNRTest, ComposedOfRxPowerAndGainOverTemp) {
    double sysTempDbK = 20.0;
    double bw = 2e6;
    double expected = rxPower(50.0, 200.0, 35.0) - sysTempDbK - BOLTZMANN_DB - absToDb(bw);
    EXPECT_NEAR(cnr(50.0, 200.0, 35.0, sysTempDbK, bw), expected, 1e-9);
    EXPECT_DOUBLE_EQ(gainOverTemp(35.0, sysTempDbK), 15.0);
}

TEST(CNRTest, TenfoldBandwidthCostsTenDb) {
    double narrow = cnr(50.0, 200.0, 35.0, 20.0, 1e6);
    double wide = cnr(50.0, 200.0, 35.0, 20.0, 1e7);
    EXPECT_NEAR(narrow - wide, 10.0, 1e-9);
}

TEST(CNRTest, RejectsNonPositiveBandwidth) {
    EXPECT_THROW(cnr(50.0, 200.0, 35.0, 20.0, 0.0), InvalidInputException);
}

TEST(CapacityTest, ZeroDbSnrEqualsBandwidth) {
    EXPECT_NEAR(capacity(0.0, 1e6), 1e6, 1e-6);
    EXPECT_NEAR(capacity(0.0, 36e6), 36e6, 1e-6);
}

TEST(CapacityTest, KnownValue) {
    EXPECT_NEAR(capacity(27.99461461185149, 1e6), 9301897.2186, 1e-3);
}

TEST(CapacityTest, IncreasesWithSnr) {
    double previous = capacity(-20.0, 1e6);
    for (double snr = -19.0; snr <= 40.0; snr += 1.0) {
        double current = capacity(snr, 1e6);
        EXPECT_GT(current, previous) << "snr " << snr;
        previous = current;
    }
}

TEST(CapacityTest, IncreasesWithBandwidth) {
    EXPECT_GT(capacity(10.0, 2e6), capacity(10.0, 1e6));
    EXPECT_GT(capacity(10.0, 1e9), capacity(10.0, 2e6));
}

}
}
