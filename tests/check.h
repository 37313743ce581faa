// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_TESTS_CHECK_H
#define AREALLOC_TESTS_CHECK_H

#include <cmath>
#include <cstdlib>
#include <iostream>

// like assert, but also active in release builds
#define CHECK(cond)                                                                                 \
    do {                                                                                            \
        if (!(cond)) {                                                                              \
            std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond << std::endl;      \
            std::exit(1);                                                                           \
        }                                                                                           \
    } while (false)

#define CHECK_NEAR(a, b, tol) CHECK(std::abs((a) - (b)) <= (tol))

#define CHECK_THROWS(expr, type) \
    do {                         \
        bool thrown = false;     \
        try {                    \
            expr;                \
        } catch (const type&) {  \
            thrown = true;       \
        }                        \
        CHECK(thrown);           \
    } while (false)

#endif
