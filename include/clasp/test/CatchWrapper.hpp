// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

/*!
 * \brief Wrapper file for Catch library
 *
 * This file includes the Catch header for CLASP, and also disables some compiler
 * warnings which are specific to that library.
 */

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wconversion"
#endif

#include <catch2/catch.hpp>

#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
