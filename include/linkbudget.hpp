/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_HPP
#define __LINKBUDGET_HPP

#include <linkbudget/errors.hpp>
#include <linkbudget/calc.hpp>
#include <linkbudget/pointing.hpp>
#include <linkbudget/config.hpp>
#include <linkbudget/analysis.hpp>
#include <linkbudget/report.hpp>

#endif
