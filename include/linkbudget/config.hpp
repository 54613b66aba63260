/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_CONFIG_HPP
#define __LINKBUDGET_CONFIG_HPP

#include <linkbudget/pointing.hpp>

#include <optional>

namespace linkbudget {

/**
 * Inputs of a link budget analysis.
 *
 * Several inputs come in mutually exclusive groups (EIRP or transmit power,
 * dish size or dish gain, noise figure or noise temperature). Exactly one
 * member of each group must be set before calling validate().
 */
class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    // Transmitter
    std::optional<double> getEIRP() const;
    void setEIRP(const double dbw);

    std::optional<double> getTxPower() const;
    void setTxPower(const double dbw);

    std::optional<double> getTxDishSize() const;
    void setTxDishSize(const double meters);

    std::optional<double> getTxDishGain() const;
    void setTxDishGain(const double db);

    double getFrequency() const;
    void setFrequency(const double hz);

    double getBandwidth() const;
    void setBandwidth(const double hz);

    // Receive antenna
    std::optional<double> getRxDishSize() const;
    void setRxDishSize(const double meters);

    std::optional<double> getRxDishGain() const;
    void setRxDishGain(const double db);

    double getAntennaNoiseTemp() const;
    void setAntennaNoiseTemp(const double kelvin);

    // Receive chain
    std::optional<double> getLNBNoiseFigure() const;
    void setLNBNoiseFigure(const double db);

    std::optional<double> getLNBNoiseTemp() const;
    void setLNBNoiseTemp(const double kelvin);

    double getLNBGain() const;
    void setLNBGain(const double db);

    double getCoaxLength() const;
    void setCoaxLength(const double feet);

    double getRxNoiseFigure() const;
    void setRxNoiseFigure(const double db);

    // Geometry
    double getSatelliteLongitude() const;
    void setSatelliteLongitude(const double l);

    double getLongitude() const;
    void setLongitude(const double l);

    double getLatitude() const;
    void setLatitude(const double l);

    double getHeight() const;
    void setHeight(const double h);

    EarthModel getEarthModel() const;
    void setEarthModel(const EarthModel model);

    // Radar
    bool getRadar() const;
    void setRadar(bool);

    std::optional<double> getRadarAltitude() const;
    void setRadarAltitude(const double meters);

    std::optional<double> getRadarCrossSection() const;
    void setRadarCrossSection(const double squareMeters);

    bool getRadarBistatic() const;
    void setRadarBistatic(bool);

    /**
     * Altitude of the reflector: the radar altitude in radar mode, the
     * geostationary altitude otherwise.
     */
    double getReflectorAltitude() const;

    /**
     * Check that each mutually exclusive group is resolved and that the
     * values required by the selected mode are present.
     * @throws InvalidInputException naming the offending option
     */
    void validate() const;

private:
    std::optional<double> eirp;
    std::optional<double> txPower;
    std::optional<double> txDishSize;
    std::optional<double> txDishGain;
    double frequency = 0.0;
    double bandwidth = 0.0;
    std::optional<double> rxDishSize;
    std::optional<double> rxDishGain;
    double antennaNoiseTemp = 0.0;
    std::optional<double> lnbNoiseFigure;
    std::optional<double> lnbNoiseTemp;
    double lnbGain = 0.0;
    double coaxLength = 0.0;
    double rxNoiseFigure = 0.0;
    double satelliteLongitude = 0.0;
    double longitude = 0.0;
    double latitude = 0.0;
    double height = 0.0;
    EarthModel earthModel = EarthModel::Ellipsoidal;
    bool radar = false;
    std::optional<double> radarAltitude;
    std::optional<double> radarCrossSection;
    bool radarBistatic = false;
};

}

#endif
