// Copyright 2023 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_PUBLIC_EXPORT_H_
#define HLSKEY_PUBLIC_EXPORT_H_

#if defined(SHARED_LIBRARY_BUILD)
#if defined(_WIN32)

#if defined(HLSKEY_IMPLEMENTATION)
#define HLSKEY_EXPORT __declspec(dllexport)
#else
#define HLSKEY_EXPORT __declspec(dllimport)
#endif  // defined(HLSKEY_IMPLEMENTATION)

#else  // defined(_WIN32)

#if defined(HLSKEY_IMPLEMENTATION)
#define HLSKEY_EXPORT __attribute__((visibility("default")))
#else
#define HLSKEY_EXPORT
#endif

#endif  // defined(_WIN32)

#else  // defined(SHARED_LIBRARY_BUILD)
#define HLSKEY_EXPORT
#endif  // defined(SHARED_LIBRARY_BUILD)

#endif  // HLSKEY_PUBLIC_EXPORT_H_
