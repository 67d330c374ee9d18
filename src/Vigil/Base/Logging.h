//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

//! Single include point for logging in Vigil.
/*!
 Vigil logs through loguru, compiled with `LOGURU_USE_FMTLIB=1` so that all
 the `LOG_F`, `DLOG_F`, `CHECK_F` and `LOG_SCOPE_F` macros take `{}` style
 format strings. The definition is propagated by the build to every target
 that links `vigil-base`; it is repeated here so that a translation unit
 compiled outside the build still agrees with the library on the format
 syntax.
*/

#if !defined(LOGURU_USE_FMTLIB)
#  define LOGURU_USE_FMTLIB 1
#endif

#include <fmt/format.h>
#include <loguru.hpp>
