/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_ANALYSIS_HPP
#define __LINKBUDGET_ANALYSIS_HPP

#include <linkbudget/config.hpp>
#include <linkbudget/pointing.hpp>

#include <functional>
#include <string_view>

namespace linkbudget {

/**
 * Noise figure breakdown of the receive chain, in dB.
 */
struct NoiseFigures {
    double lnb;
    double coax;
    double total;
};

/**
 * Noise temperature breakdown of the receiver, in K.
 */
struct NoiseTemperatures {
    double effectiveInput;
    double system;
};

/**
 * Main results of a link budget analysis.
 */
struct LinkBudgetResult {
    LookAngles pointing;
    double eirpInDbw;
    double pathLossInDb;
    double rxDishGainInDb;
    NoiseFigures noiseFigureInDb;
    NoiseTemperatures noiseTempInKelvin;
    double cnrInDb;
    double capacityInBps;
};

/**
 * An intermediate quantity produced by one stage of the analysis.
 */
struct StageReport {
    std::string_view label;   ///< e.g. "Path loss"
    double value;
    std::string_view unit;    ///< e.g. "dB"; "bps" for capacity
};

/**
 * Receives each intermediate quantity as soon as it is computed.
 */
using StageObserver = std::function<void(const StageReport&)>;

/**
 * Run the link budget analysis.
 *
 * Computes the look angles to the reflector, then the EIRP, path loss,
 * receive chain noise, C/N and channel capacity.
 *
 * @param config Analysis inputs
 * @param observer Optional callback invoked after each stage
 * @return The analysis results
 * @throws InvalidInputException if the configuration is invalid
 */
LinkBudgetResult analyze(const Config& config, const StageObserver& observer = {});

}

#endif
