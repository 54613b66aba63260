/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget/analysis.hpp>
#include <linkbudget/calc.hpp>

#include <spdlog/spdlog.h>

#include <optional>

namespace linkbudget {

using spdlog::debug;

LinkBudgetResult analyze(const Config& config, const StageObserver& observer) {
    config.validate();

    auto report = [&observer](std::string_view label, double value, std::string_view unit) {
        if (observer) {
            observer(StageReport{label, value, unit});
        }
    };

    double altitude = config.getReflectorAltitude();
    debug("Reflector altitude {:.1f} km, {} earth model",
          altitude / 1e3, toString(config.getEarthModel()));

    auto pointing = lookAngles(config.getSatelliteLongitude(), config.getLongitude(),
                               config.getLatitude(), altitude, config.getEarthModel(),
                               config.getHeight());
    report("Elevation", pointing.elevationInDegrees, "degrees");
    report("Azimuth", pointing.azimuthInDegrees, "degrees");
    report("Distance", pointing.slantRangeInMeters / 1e3, "km");

    // Transmit power
    double eirpInDbw;
    if (config.getEIRP().has_value()) {
        eirpInDbw = *config.getEIRP();
    } else {
        double txGain;
        if (config.getTxDishGain().has_value()) {
            txGain = *config.getTxDishGain();
        } else {
            txGain = dishGain(*config.getTxDishSize(), config.getFrequency());
            report("Tx dish gain", txGain, "dB");
        }
        eirpInDbw = eirp(*config.getTxPower(), txGain);
        report("Tx Power", dbToAbs(*config.getTxPower()) / 1e3, "kW");
    }
    report("EIRP", eirpInDbw, "dBW");

    // The object to rx station distance of bistatic mode is not available
    // here, so a bistatic target is rejected by the path loss computation.
    std::optional<RadarTarget> target;
    if (config.getRadar()) {
        target = RadarTarget{
            config.getRadarCrossSection().value_or(0.0),
            config.getRadarBistatic(),
            std::nullopt
        };
    }
    double pathLossInDb = pathLoss(pointing.slantRangeInMeters, config.getFrequency(), target);
    report("Path loss", pathLossInDb, "dB");

    // Receive antenna
    double rxDishGainInDb;
    if (config.getRxDishGain().has_value()) {
        rxDishGainInDb = *config.getRxDishGain();
    } else {
        rxDishGainInDb = dishGain(*config.getRxDishSize(), config.getFrequency());
        report("Rx dish gain", rxDishGainInDb, "dB");
    }

    // Receive chain: LNB -> coax line -> receiver
    auto coax = coaxLossAndNoiseFigure(config.getCoaxLength());
    report("Coax loss", coax.lossInDb, "dB");
    report("Coax noise figure", coax.noiseFigureInDb, "dB");

    double lnbNoiseFigure = config.getLNBNoiseFigure().has_value()
        ? *config.getLNBNoiseFigure()
        : noiseTempToNoiseFigure(*config.getLNBNoiseTemp());
    report("LNB noise figure", lnbNoiseFigure, "dB");

    double totalNoiseFig = totalNoiseFigure(
        {lnbNoiseFigure, coax.noiseFigureInDb, config.getRxNoiseFigure()},
        {config.getLNBGain(), -coax.lossInDb});
    report("Rx noise figure", totalNoiseFig, "dB");

    double inputNoiseTemp = noiseFigureToNoiseTemp(totalNoiseFig);
    report("Antenna noise temp", config.getAntennaNoiseTemp(), "K");
    report("Input-noise temp", inputNoiseTemp, "K");

    double sysNoiseTemp = systemNoiseTemp(config.getAntennaNoiseTemp(), inputNoiseTemp);
    report("System noise temp", sysNoiseTemp, "K");
    double sysNoiseTempInDbK = absToDb(sysNoiseTemp);

    report("Rx Power", rxPower(eirpInDbw, pathLossInDb, rxDishGainInDb) + 30.0, "dBm");
    report("(G/T)", gainOverTemp(rxDishGainInDb, sysNoiseTempInDbK), "dB/K");

    double cnrInDb = cnr(eirpInDbw, pathLossInDb, rxDishGainInDb, sysNoiseTempInDbK,
                         config.getBandwidth());
    report("(C/N)", cnrInDb, "dB");

    double capacityInBps = capacity(cnrInDb, config.getBandwidth());
    report("Capacity", capacityInBps, "bps");

    return LinkBudgetResult{
        .pointing = pointing,
        .eirpInDbw = eirpInDbw,
        .pathLossInDb = pathLossInDb,
        .rxDishGainInDb = rxDishGainInDb,
        .noiseFigureInDb = {
            .lnb = lnbNoiseFigure,
            .coax = coax.noiseFigureInDb,
            .total = totalNoiseFig
        },
        .noiseTempInKelvin = {
            .effectiveInput = inputNoiseTemp,
            .system = sysNoiseTemp
        },
        .cnrInDb = cnrInDb,
        .capacityInBps = capacityInBps
    };
}

}
