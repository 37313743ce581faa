// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_H
#define AREALLOC_H

#include <iostream>
#include <sstream>
#include <type_traits>
#include <utility>

#include "types.h"  // IWYU pragma: export

namespace arealloc {

namespace log {

namespace detail {

template<class Stream, typename Arg>
inline void to_stream(Stream& s, Arg&& arg) {
    s << arg;
}

template<class Stream, typename Arg, typename... Args>
inline void to_stream(Stream& s, Arg&& arg, Args&&... args) {
    s << arg;
    to_stream(s, std::forward<Args>(args)...);
}

template<typename... Args>
inline void output(Args&&... args) {
#pragma omp critical(output)
    {
        to_stream(std::cout, std::forward<Args>(args)...);
        std::cout << std::endl;
    }
}

template<class>
struct to_void {
    typedef void type;
};
template<class T, class = void>
struct has_name : std::false_type {};
template<class T>
struct has_name<T, typename to_void<decltype(std::declval<T>().name())>::type> : std::true_type {};

}  // namespace detail

template<typename Arg, typename... Args>
inline arealloc::exception error(Arg&& arg, Args&&... args) {
    std::ostringstream ss;
    if constexpr (std::is_pointer<Arg>::value && detail::has_name<typename std::remove_pointer<Arg>::type>::value) {
        detail::to_stream(ss, arg->name(), ": ", std::forward<Args>(args)...);
    } else {
        detail::to_stream(ss, std::forward<Arg>(arg), std::forward<Args>(args)...);
    }
    return arealloc::exception(ss.str());
}

// warnings are part of the advisory reporting and hence not gated by DEBUGGING
template<typename Arg, typename... Args>
inline void warning(Arg&& arg, Args&&... args) {
    if constexpr (std::is_pointer<Arg>::value && detail::has_name<typename std::remove_pointer<Arg>::type>::value) {
        detail::output(arg->name(), " Warning: ", std::forward<Args>(args)...);
    } else {
        detail::output("Warning: ", std::forward<Arg>(arg), std::forward<Args>(args)...);
    }
}

template<typename Arg, typename... Args>
inline void info(Arg&& arg, Args&&... args) {
    if constexpr (Options::DEBUGGING) {
        if constexpr (std::is_pointer<Arg>::value && detail::has_name<typename std::remove_pointer<Arg>::type>::value) {
            detail::output(arg->name(), ": ", std::forward<Args>(args)...);
        } else {
            detail::output(std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }
}

template<typename Arg, typename... Args>
inline void debug(Arg&& arg, Args&&... args) {
    if constexpr (std::is_pointer<Arg>::value && detail::has_name<typename std::remove_pointer<Arg>::type>::value) {
        detail::output(arg->name(), ": ", std::forward<Args>(args)...);
    } else {
        detail::output(std::forward<Arg>(arg), std::forward<Args>(args)...);
    }
}

}  // namespace log

}  // namespace arealloc

#endif
