// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Compiler portability macros shared by every public filelog header.
 *
 * Macros defined here:
 *   - FILELOG_EXPORT    : Marks a symbol for export from the shared library.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * FILELOG_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * The library is built with hidden visibility; GCC and Clang need the
 * "default" attribute to export a symbol from the .so.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define FILELOG_EXPORT __attribute__((visibility("default")))
#else
#   define FILELOG_EXPORT
#endif
