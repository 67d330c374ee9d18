//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef VGL_SCN_STATIC
#    define VGL_SCN_API
#  else
#    ifdef VGL_SCN_EXPORTS
#      define VGL_SCN_API __declspec(dllexport)
#    else
#      define VGL_SCN_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef VGL_SCN_EXPORTS
#    define VGL_SCN_API __attribute__((visibility("default")))
#  else
#    define VGL_SCN_API
#  endif
#else
#  define VGL_SCN_API
#endif

#define VGL_SCN_NDAPI [[nodiscard]] VGL_SCN_API
