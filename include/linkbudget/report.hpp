/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_REPORT_HPP
#define __LINKBUDGET_REPORT_HPP

#include <linkbudget/analysis.hpp>

#include <string>

namespace linkbudget {

/**
 * Format a bit rate with the largest fitting SI prefix, e.g. "9.30 Mbps".
 */
std::string formatRate(double bitsPerSecond);

/**
 * Format one stage of the analysis as an aligned line, e.g.
 * "Path loss:          205.39 dB".
 */
std::string formatStage(const StageReport& stage);

/**
 * Log a stage at info level. Usable as a StageObserver.
 */
void logStage(const StageReport& stage);

/**
 * Serialize the results as a flat JSON object.
 */
std::string toJSON(const LinkBudgetResult& result);

}

#endif
