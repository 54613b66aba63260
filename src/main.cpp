/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

#ifndef LINKBUDGET_VERSION
#define LINKBUDGET_VERSION "0.1.1"
#endif

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Program entry point */
int main(int argc, char* argv[]) {
    using linkbudget::EarthModel;

    linkbudget::Config config;
    bool json = false;
    bool verbose = false;
    EarthModel earthModel = EarthModel::Ellipsoidal;

    auto configFile = expandTilde("~/.linkbudget.toml");

    CLI::App app{"Link Budget Calculator"};
    argv = app.ensure_utf8(argv);

    app.set_version_flag("--version", LINKBUDGET_VERSION);
    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag("--json", json, "Return results in a JSON-formatted string");
    app.add_flag("-v,--verbose", verbose, "Display debugging information");

    // Transmitter
    auto eirpOpt = app.add_option_function<double>("--eirp",
        [&config](const double v) { config.setEIRP(v); },
        "EIRP in dBW");
    auto txPowerOpt = app.add_option_function<double>("--tx-power",
        [&config](const double v) { config.setTxPower(v); },
        "Power feeding the Tx antenna in dBW");
    eirpOpt->excludes(txPowerOpt);

    auto txDishSizeOpt = app.add_option_function<double>("--tx-dish-size",
        [&config](const double v) { config.setTxDishSize(v); },
        "Diameter in meters of the parabolic antenna used for transmission. "
        "Used when the power is specified through option --tx-power");
    auto txDishGainOpt = app.add_option_function<double>("--tx-dish-gain",
        [&config](const double v) { config.setTxDishGain(v); },
        "Gain in dBi of the parabolic antenna used for transmission. "
        "Used when the power is specified through option --tx-power");
    txDishSizeOpt->excludes(txDishGainOpt);

    app.add_option_function<double>("--freq",
        [&config](const double v) { config.setFrequency(v); },
        "Downlink carrier frequency in Hz for satellite signals or simply the "
        "signal frequency in Hz for radar (passively reflected) signals")->required();
    app.add_option_function<double>("--if-bw",
        [&config](const double v) { config.setBandwidth(v); },
        "IF bandwidth in Hz")->required();

    // Receive antenna
    auto rxDishSizeOpt = app.add_option_function<double>("--rx-dish-size",
        [&config](const double v) { config.setRxDishSize(v); },
        "Parabolic antenna (dish) diameter in m");
    auto rxDishGainOpt = app.add_option_function<double>("--rx-dish-gain",
        [&config](const double v) { config.setRxDishGain(v); },
        "Parabolic antenna (dish) gain in dBi");
    rxDishSizeOpt->excludes(rxDishGainOpt);

    app.add_option_function<double>("--antenna-noise-temp",
        [&config](const double v) { config.setAntennaNoiseTemp(v); },
        "Receive antenna's noise temperature in K")->required();

    // Receive chain
    auto lnbNoiseFigOpt = app.add_option_function<double>("--lnb-noise-fig",
        [&config](const double v) { config.setLNBNoiseFigure(v); },
        "LNB's noise figure in dB");
    auto lnbNoiseTempOpt = app.add_option_function<double>("--lnb-noise-temp",
        [&config](const double v) { config.setLNBNoiseTemp(v); },
        "LNB's noise temperature in K");
    lnbNoiseFigOpt->excludes(lnbNoiseTempOpt);

    app.add_option_function<double>("--lnb-gain",
        [&config](const double v) { config.setLNBGain(v); },
        "LNB's gain in dB")->required();
    app.add_option_function<double>("--coax-length",
        [&config](const double v) { config.setCoaxLength(v); },
        "Length of the coaxial transmission line between the LNB and the receiver in ft")->required();
    app.add_option_function<double>("--rx-noise-fig",
        [&config](const double v) { config.setRxNoiseFigure(v); },
        "Receiver's noise figure in dB")->required();

    // Geometry
    app.add_option_function<double>("--sat-long",
        [&config](const double l) { config.setSatelliteLongitude(l); },
        "Satellite's longitude. Negative to the West and positive to the East")->required();
    app.add_option_function<double>("--rx-long",
        [&config](const double l) { config.setLongitude(l); },
        "Receive station's longitude. Negative to the West and positive to the East")->required();
    app.add_option_function<double>("--rx-lat",
        [&config](const double l) { config.setLatitude(l); },
        "Receive station's latitude. Positive to the North and negative to the South")->required();
    app.add_option_function<double>("--rx-height",
        [&config](const double h) { config.setHeight(h); },
        "Receive station's height above sea level in meters (default 0)");

    std::map<std::string, EarthModel> earthModels{
        {"ellipsoidal", EarthModel::Ellipsoidal},
        {"spherical", EarthModel::Spherical}
    };
    app.add_option("--model", earthModel, "Earth model used for the look angles (default ellipsoidal)")
        ->transform(CLI::CheckedTransformer(earthModels, CLI::ignore_case));

    // Radar
    auto radarGroup = app.add_option_group("radar options");
    radarGroup->add_flag_function("--radar",
        [&config](const int64_t v) { config.setRadar(v > 0); },
        "Activate radar mode, so that the link budget considers the pathloss to and back from object");
    radarGroup->add_option_function<double>("--radar-alt",
        [&config](const double a) { config.setRadarAltitude(a); },
        "Altitude of the radar object in meters");
    radarGroup->add_option_function<double>("--radar-cross-section",
        [&config](const double s) { config.setRadarCrossSection(s); },
        "Radar cross section of the radar object in square meters");
    radarGroup->add_flag_function("--radar-bistatic",
        [&config](const int64_t v) { config.setRadarBistatic(v > 0); },
        "Bistatic radar scenario, i.e., radar transmitter and receiver are not collocated");

    app.ignore_case();

    CLI11_PARSE(app, argc, argv);

    config.setEarthModel(earthModel);

    spdlog::set_pattern("%v");
    if (json) {
        spdlog::set_level(spdlog::level::off);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    try {
        linkbudget::StageObserver observer;
        if (!json) {
            observer = linkbudget::logStage;
        }

        auto result = linkbudget::analyze(config, observer);

        if (json) {
            std::cout << linkbudget::toJSON(result) << std::endl;
        }
    } catch (const std::exception &err) {
        std::cerr << err.what() << std::endl;
        std::exit(1);
    }

    return 0;
}
