/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && defined(VISTA_SHARED_LIBS)
#ifdef VISTA_CORE_EXPORTS
#define VISTA_CORE_API __declspec(dllexport)
#else
#define VISTA_CORE_API __declspec(dllimport)
#endif
#ifdef VISTA_RENDERING_EXPORTS
#define VISTA_RENDERING_API __declspec(dllexport)
#else
#define VISTA_RENDERING_API __declspec(dllimport)
#endif
#ifdef VISTA_VIS_EXPORTS
#define VISTA_VIS_API __declspec(dllexport)
#else
#define VISTA_VIS_API __declspec(dllimport)
#endif
#elif defined(__GNUC__)
#define VISTA_CORE_API      __attribute__((visibility("default")))
#define VISTA_RENDERING_API __attribute__((visibility("default")))
#define VISTA_VIS_API       __attribute__((visibility("default")))
#else
#define VISTA_CORE_API
#define VISTA_RENDERING_API
#define VISTA_VIS_API
#endif

// The logger lives in vista_core
#define VISTA_LOGGER_API VISTA_CORE_API
