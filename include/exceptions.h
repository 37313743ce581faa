// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_EXCEPTIONS_H
#define AREALLOC_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>

// IWYU pragma: private, include "arealloc.h"

namespace arealloc {

class exception : public std::runtime_error {
  public:
    explicit exception(const std::string& s) : std::runtime_error(s) {}

    explicit exception(const char* s) : std::runtime_error(s) {}
};

// inconsistent input (bad membership weights, conflicting unit values); never repaired
class integrity_error : public exception {
  public:
    explicit integrity_error(const std::string& s) : exception(s) {}
};

// allocated sums deviate from expected totals on a strictly validated pass
class conservation_error : public exception {
  private:
    std::size_t violations_;

  public:
    conservation_error(const std::string& s, std::size_t violations) : exception(s), violations_(violations) {}
    std::size_t violations() const { return violations_; }
};

}  // namespace arealloc

#endif
