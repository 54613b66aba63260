/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget/calc.hpp>
#include <linkbudget/errors.hpp>

#include <cmath>
#include <numbers>
#include <string>

namespace linkbudget {

using std::numbers::pi;

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw InvalidInputException(std::string(name) + " must be positive");
    }
}

}

double dbToAbs(double valueInDb) {
    return std::pow(10.0, valueInDb / 10.0);
}

double absToDb(double value) {
    return 10.0 * std::log10(value);
}

double wavelength(double freqInHz) {
    requirePositive(freqInHz, "Frequency");
    return SPEED_OF_LIGHT / freqInHz;
}

double dishGain(double diameterInMeters, double freqInHz) {
    requirePositive(diameterInMeters, "Dish diameter");
    double radius = diameterInMeters / 2.0;
    double faceArea = pi * radius * radius;
    double lambda = wavelength(freqInHz);

    // 4π η / λ² with η = 0.56 rounds to 7 / λ²
    double gain = 7.0 * faceArea / (lambda * lambda);
    return absToDb(gain);
}

double eirp(double txPowerInDbw, double txGainInDb) {
    return txPowerInDbw + txGainInDb;
}

double freeSpacePathLoss(double distanceInMeters, double freqInHz) {
    requirePositive(distanceInMeters, "Distance");
    double lambda = wavelength(freqInHz);
    return 20.0 * std::log10(4.0 * pi * distanceInMeters / lambda);
}

double radarObjectGain(double crossSectionInSquareMeters, double freqInHz) {
    requirePositive(crossSectionInSquareMeters, "Radar cross section");
    double lambda = wavelength(freqInHz);
    return absToDb(4.0 * pi * crossSectionInSquareMeters / (lambda * lambda));
}

double pathLoss(double distanceInMeters, double freqInHz,
                const std::optional<RadarTarget>& radar) {
    if (!radar.has_value()) {
        return freeSpacePathLoss(distanceInMeters, freqInHz);
    }

    if (radar->bistatic && !radar->rxDistanceInMeters.has_value()) {
        throw InvalidInputException("Rx distance required in bistatic radar mode");
    }

    double objectGain = radarObjectGain(radar->crossSectionInSquareMeters, freqInHz);
    double txLoss = freeSpacePathLoss(distanceInMeters, freqInHz);

    if (radar->bistatic) {
        double rxLoss = freeSpacePathLoss(*radar->rxDistanceInMeters, freqInHz);
        return txLoss + rxLoss - objectGain;
    }

    return 2.0 * txLoss - objectGain;
}

double pathLoss(double distanceInMeters, double freqInHz, bool radar,
                std::optional<double> crossSectionInSquareMeters,
                bool bistatic,
                std::optional<double> rxDistanceInMeters) {
    if (!radar) {
        return pathLoss(distanceInMeters, freqInHz);
    }
    if (!crossSectionInSquareMeters.has_value()) {
        throw InvalidInputException("Radar cross section required in radar mode");
    }
    return pathLoss(distanceInMeters, freqInHz,
        RadarTarget{*crossSectionInSquareMeters, bistatic, rxDistanceInMeters});
}

LineLoss coaxLossAndNoiseFigure(double lengthInFeet, double lineTempInKelvin) {
    double lossInDb = lengthInFeet * COAX_LOSS_DB_PER_FT;
    double loss = dbToAbs(lossInDb);
    double noiseFactor = 1.0 + (lineTempInKelvin / T0) * (loss - 1.0);
    return {lossInDb, absToDb(noiseFactor)};
}

double totalNoiseFigure(const std::vector<double>& noiseFiguresInDb,
                        const std::vector<double>& gainsInDb) {
    if (noiseFiguresInDb.empty()) {
        throw InvalidInputException("At least one noise figure is required");
    }
    if (gainsInDb.size() != noiseFiguresInDb.size() - 1) {
        throw InvalidInputException("Expected " + std::to_string(noiseFiguresInDb.size() - 1) +
            " gain(s) for " + std::to_string(noiseFiguresInDb.size()) +
            " noise figure(s), got " + std::to_string(gainsInDb.size()));
    }

    if (noiseFiguresInDb.size() == 1) {
        return noiseFiguresInDb.front();
    }

    double F = dbToAbs(noiseFiguresInDb[0]);
    double gainProduct = 1.0;
    for (size_t i = 1; i < noiseFiguresInDb.size(); ++i) {
        gainProduct *= dbToAbs(gainsInDb[i - 1]);
        F += (dbToAbs(noiseFiguresInDb[i]) - 1.0) / gainProduct;
    }

    return absToDb(F);
}

double noiseFigureToNoiseTemp(double noiseFigureInDb) {
    return T0 * (dbToAbs(noiseFigureInDb) - 1.0);
}

double noiseTempToNoiseFigure(double noiseTempInKelvin) {
    return absToDb(1.0 + noiseTempInKelvin / T0);
}

double systemNoiseTemp(double antennaNoiseTempInKelvin, double inputNoiseTempInKelvin) {
    return antennaNoiseTempInKelvin + inputNoiseTempInKelvin;
}

double rxPower(double eirpInDbw, double pathLossInDb, double rxGainInDb) {
    return eirpInDbw - pathLossInDb + rxGainInDb;
}

double gainOverTemp(double rxGainInDb, double systemNoiseTempInDbK) {
    return rxGainInDb - systemNoiseTempInDbK;
}

double cnr(double eirpInDbw, double pathLossInDb, double rxGainInDb,
           double systemNoiseTempInDbK, double bandwidthInHz) {
    requirePositive(bandwidthInHz, "Bandwidth");

    // N = k Tsys B, so each term is subtracted in dB
    double bandwidthInDb = absToDb(bandwidthInHz);
    double gOverT = gainOverTemp(rxGainInDb, systemNoiseTempInDbK);
    return eirpInDbw - pathLossInDb + gOverT - BOLTZMANN_DB - bandwidthInDb;
}

double capacity(double snrInDb, double bandwidthInHz) {
    requirePositive(bandwidthInHz, "Bandwidth");
    return bandwidthInHz * std::log2(1.0 + dbToAbs(snrInDb));
}

}
