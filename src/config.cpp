/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget/config.hpp>
#include <linkbudget/errors.hpp>

namespace linkbudget {

std::optional<double> Config::getEIRP() const {
    return eirp;
}

void Config::setEIRP(const double dbw) {
    eirp = dbw;
}

std::optional<double> Config::getTxPower() const {
    return txPower;
}

void Config::setTxPower(const double dbw) {
    txPower = dbw;
}

std::optional<double> Config::getTxDishSize() const {
    return txDishSize;
}

void Config::setTxDishSize(const double meters) {
    txDishSize = meters;
}

std::optional<double> Config::getTxDishGain() const {
    return txDishGain;
}

void Config::setTxDishGain(const double db) {
    txDishGain = db;
}

double Config::getFrequency() const {
    return frequency;
}

void Config::setFrequency(const double hz) {
    frequency = hz;
}

double Config::getBandwidth() const {
    return bandwidth;
}

void Config::setBandwidth(const double hz) {
    bandwidth = hz;
}

std::optional<double> Config::getRxDishSize() const {
    return rxDishSize;
}

void Config::setRxDishSize(const double meters) {
    rxDishSize = meters;
}

std::optional<double> Config::getRxDishGain() const {
    return rxDishGain;
}

void Config::setRxDishGain(const double db) {
    rxDishGain = db;
}

double Config::getAntennaNoiseTemp() const {
    return antennaNoiseTemp;
}

void Config::setAntennaNoiseTemp(const double kelvin) {
    antennaNoiseTemp = kelvin;
}

std::optional<double> Config::getLNBNoiseFigure() const {
    return lnbNoiseFigure;
}

void Config::setLNBNoiseFigure(const double db) {
    lnbNoiseFigure = db;
}

std::optional<double> Config::getLNBNoiseTemp() const {
    return lnbNoiseTemp;
}

void Config::setLNBNoiseTemp(const double kelvin) {
    lnbNoiseTemp = kelvin;
}

double Config::getLNBGain() const {
    return lnbGain;
}

void Config::setLNBGain(const double db) {
    lnbGain = db;
}

double Config::getCoaxLength() const {
    return coaxLength;
}

void Config::setCoaxLength(const double feet) {
    coaxLength = feet;
}

double Config::getRxNoiseFigure() const {
    return rxNoiseFigure;
}

void Config::setRxNoiseFigure(const double db) {
    rxNoiseFigure = db;
}

double Config::getSatelliteLongitude() const {
    return satelliteLongitude;
}

void Config::setSatelliteLongitude(const double l) {
    satelliteLongitude = l;
}

double Config::getLongitude() const {
    return longitude;
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getLatitude() const {
    return latitude;
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getHeight() const {
    return height;
}

void Config::setHeight(const double h) {
    height = h;
}

EarthModel Config::getEarthModel() const {
    return earthModel;
}

void Config::setEarthModel(const EarthModel model) {
    earthModel = model;
}

bool Config::getRadar() const {
    return radar;
}

void Config::setRadar(bool r) {
    radar = r;
}

std::optional<double> Config::getRadarAltitude() const {
    return radarAltitude;
}

void Config::setRadarAltitude(const double meters) {
    radarAltitude = meters;
}

std::optional<double> Config::getRadarCrossSection() const {
    return radarCrossSection;
}

void Config::setRadarCrossSection(const double squareMeters) {
    radarCrossSection = squareMeters;
}

bool Config::getRadarBistatic() const {
    return radarBistatic;
}

void Config::setRadarBistatic(bool b) {
    radarBistatic = b;
}

double Config::getReflectorAltitude() const {
    if (radar && radarAltitude.has_value()) {
        return *radarAltitude;
    }
    return GEOSTATIONARY_ALTITUDE;
}

void Config::validate() const {
    if (eirp.has_value() == txPower.has_value()) {
        throw InvalidInputException("Define either --eirp or --tx-power");
    }
    if (txDishSize.has_value() && txDishGain.has_value()) {
        throw InvalidInputException("Options --tx-dish-size and --tx-dish-gain are mutually exclusive");
    }
    if (txPower.has_value() && !txDishSize.has_value() && !txDishGain.has_value()) {
        throw InvalidInputException("Define either --tx-dish-size or --tx-dish-gain when using option --tx-power");
    }
    if (rxDishSize.has_value() == rxDishGain.has_value()) {
        throw InvalidInputException("Define either --rx-dish-size or --rx-dish-gain");
    }
    if (lnbNoiseFigure.has_value() == lnbNoiseTemp.has_value()) {
        throw InvalidInputException("Define either --lnb-noise-fig or --lnb-noise-temp");
    }
    if (frequency <= 0.0) {
        throw InvalidInputException("Argument --freq must be positive");
    }
    if (bandwidth <= 0.0) {
        throw InvalidInputException("Argument --if-bw must be positive");
    }

    if (radar) {
        if (!radarAltitude.has_value()) {
            throw InvalidInputException("Argument --radar-alt is required in radar mode (--radar)");
        }
        if (!radarCrossSection.has_value()) {
            throw InvalidInputException("Argument --radar-cross-section is required in radar mode (--radar)");
        }
        if (radarBistatic) {
            // TODO thread the radar object to rx station distance through so
            // that bistatic mode can be analyzed
            throw InvalidInputException("Bistatic radar mode (--radar-bistatic) requires the distance "
                "between the radar object and the receiver, which is not supported yet");
        }
    }
}

}
