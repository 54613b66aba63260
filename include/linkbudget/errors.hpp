/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LINKBUDGET_ERRORS_HPP
#define __LINKBUDGET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace linkbudget {

/**
 * Base exception class for link budget errors.
 */
class LinkBudgetException : public std::runtime_error {
public:
    explicit LinkBudgetException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a calculation receives missing, conflicting or
 * out-of-range inputs. Always raised before any result is produced.
 */
class InvalidInputException : public LinkBudgetException {
public:
    explicit InvalidInputException(const std::string& msg) : LinkBudgetException(msg) {}
};

}

#endif
