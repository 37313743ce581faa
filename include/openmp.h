// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_OPENMP_H
#define AREALLOC_OPENMP_H

#ifdef _OPENMP
#include <omp.h>
#endif

namespace arealloc::openmp {

inline unsigned int get_thread_count() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

}  // namespace arealloc::openmp

#endif
