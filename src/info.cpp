// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "options.h"

namespace arealloc {

struct Info {
    static const char* const text;
};

const char* const Info::text =
    "Allocation:             areal (split units over zones) and categorical (shares within strata)\n"
    "Validation:             advisory or strict conservation of target totals\n"
    "License:                AGPL-3.0-or-later\n"
    "\n"
    "Build time:             " __DATE__ " " __TIME__
    "\n"
    "Debug:                  "
#if AREALLOC_DEBUGGING
    "yes"
#else
    "no"
#endif
    "\n"
    "Parallelized:           "
#ifdef _OPENMP
    "yes"
#else
    "no"
#endif
    ;

}  // namespace arealloc
