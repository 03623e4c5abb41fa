// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

/*!
 * \brief Wrapper file for the standalone asio library
 *
 * Every use of asio in CLASP goes through this header. It pulls in the parts
 * of the library the platform layer needs and silences the warnings asio
 * triggers under the project's warning flags.
 */

#if !defined(ASIO_STANDALONE)
#define ASIO_STANDALONE 1
#endif

// Clang
#if defined(__clang__)
#pragma clang diagnostic push
// warning: implicit conversion loses integer precision: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wconversion"
// warning: default label in switch which covers all enumeration values
#pragma clang diagnostic ignored "-Wcovered-switch-default"
// warning: use of old-style cast
#pragma clang diagnostic ignored "-Wold-style-cast"
// warning: implicit conversion changes signedness: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wsign-conversion"
// warning: 'symbol' is not defined, evaluates to 0
#pragma clang diagnostic ignored "-Wundef"
// warning: unused typedef 'argument'
#pragma clang diagnostic ignored "-Wunused-local-typedef"
#endif

// GCC
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#endif

#include <asio.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/system_timer.hpp>

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#if defined(__clang__)
#pragma clang diagnostic pop
#endif
