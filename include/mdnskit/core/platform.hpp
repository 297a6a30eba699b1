/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <cstdint>
#include <string>  // For size_t

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

// Windows
#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
    #define MDK_WINDOWS 1
#else
    #define MDK_WINDOWS 0
#endif

// Apple
#if defined(__APPLE__)
    #define MDK_APPLE 1
    #define MDK_POSIX 1  // POSIX-certified.
    #include <TargetConditionals.h>
    #if TARGET_OS_IPHONE  // iOS, tvOS, or watchOS device or simulator
        #define MDK_IPHONE 1
        #define MDK_MACOS 0
    #elif TARGET_OS_MAC  // Apple desktop OS
        #define MDK_IPHONE 0
        #define MDK_MACOS 1
    #else
        #error "Unknown Apple platform"
    #endif
#else
    #define MDK_APPLE 0
    #define MDK_IPHONE 0
    #define MDK_MACOS 0
#endif

// Android
#if defined(__ANDROID__)
    #define MDK_ANDROID 1
    #define MDK_POSIX 1  // Mostly POSIX compliant.
#else
    #define MDK_ANDROID 0
#endif

// Linux
#if defined(__linux__)
    #define MDK_LINUX 1
    #define MDK_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define MDK_LINUX 0
#endif

// Posix
#ifndef MDK_POSIX
    #if defined(_POSIX_VERSION)
        #define MDK_POSIX 1
    #else
        #define MDK_POSIX 0
    #endif
#endif

#if defined(_MSC_VER)
    #define MDK_FUNCTION __FUNCSIG__
#else
    #define MDK_FUNCTION __PRETTY_FUNCTION__
#endif

#if MDK_WINDOWS
    #ifndef NOMINMAX
        #error "Please define NOMINMAX as compile constant in your build system."
    #endif
#endif
