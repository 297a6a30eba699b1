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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

/**
 * When MDK_LOG_ON_ASSERT is true (1), a critical log message is emitted when an assertion fails. Default is on.
 */
#ifndef MDK_LOG_ON_ASSERT
    #define MDK_LOG_ON_ASSERT 1
#endif

/**
 * When MDK_THROW_EXCEPTION_ON_ASSERT is true (1), an mdk::Exception is thrown when an assertion fails. Default is off.
 */
#ifndef MDK_THROW_EXCEPTION_ON_ASSERT
    #define MDK_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When MDK_ABORT_ON_ASSERT is true (1), the program aborts when an assertion fails. Default is off.
 */
#ifndef MDK_ABORT_ON_ASSERT
    #define MDK_ABORT_ON_ASSERT 0
#endif

#define MDK_LOG_ON_ASSERT_IF_ENABLED(msg) \
    if (MDK_LOG_ON_ASSERT) {              \
        MDK_CRITICAL(msg);                \
    }

#define MDK_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (MDK_THROW_EXCEPTION_ON_ASSERT) {    \
        MDK_THROW_EXCEPTION(msg);           \
    }

#define MDK_ABORT_IF_ENABLED(msg)                                  \
    if (MDK_ABORT_ON_ASSERT) {                                     \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Asserts that condition is true, otherwise logs, throws and/or aborts depending on the configuration above.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting. Must be a string literal.
 */
#define MDK_ASSERT(condition, message)                                    \
    do {                                                                  \
        if (!(condition)) {                                               \
            MDK_LOG_ON_ASSERT_IF_ENABLED("Assertion failure: " message)   \
            MDK_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            MDK_ABORT_IF_ENABLED(message)                                 \
        }                                                                 \
    } while (false)

/**
 * Same as MDK_ASSERT, but returns from the calling (void) function when the condition is false.
 */
#define MDK_ASSERT_RETURN(condition, message)                             \
    do {                                                                  \
        if (!(condition)) {                                               \
            MDK_LOG_ON_ASSERT_IF_ENABLED("Assertion failure: " message)   \
            MDK_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            MDK_ABORT_IF_ENABLED(message)                                 \
            return;                                                       \
        }                                                                 \
    } while (false)

/**
 * Asserts that a branch is never reached.
 */
#define MDK_ASSERT_FALSE(message) MDK_ASSERT(false, message)
