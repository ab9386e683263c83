/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && !defined(TWL_STATIC)
#ifdef TWL_CORE_EXPORTS
#define TWL_CORE_API __declspec(dllexport)
#else
#define TWL_CORE_API __declspec(dllimport)
#endif
#ifdef TWL_TWEEN_EXPORTS
#define TWL_TWEEN_API __declspec(dllexport)
#else
#define TWL_TWEEN_API __declspec(dllimport)
#endif
#elif defined(_WIN32)
#define TWL_CORE_API
#define TWL_TWEEN_API
#else
#define TWL_CORE_API  __attribute__((visibility("default")))
#define TWL_TWEEN_API __attribute__((visibility("default")))
#endif
