// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_TYPES_H
#define AREALLOC_TYPES_H

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>

// IWYU pragma: private, include "arealloc.h"

// IWYU pragma: begin_exports
#include "exceptions.h"
#include "options.h"
// IWYU pragma: end_exports

namespace arealloc {

using hash_t = std::uint64_t;
constexpr hash_t hash(const char* str, hash_t prev = 5381) { return *str != '\0' ? hash(str + 1, prev * 33 + *str) : prev; }

class hashed_string final {
  public:
    using base_type = std::string;  // enable settingsnode to read hash_string

  private:
    const std::string str_;
    const hash_t hash_;

  public:
    explicit hashed_string(std::string str) : str_(std::move(str)), hash_(hash(str_.c_str())) {}
    operator hash_t() const { return hash_; }             // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
    operator const std::string&() const { return str_; }  // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
    friend std::ostream& operator<<(std::ostream& lhs, const hashed_string& rhs) { return lhs << rhs.str_; }
};

using FloatType = double;

inline bool within(FloatType value, FloatType expected, FloatType tolerance) { return std::abs(value - expected) <= tolerance; }

}  // namespace arealloc

#endif
