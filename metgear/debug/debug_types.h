// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

/**
 * Define the possible classes/categories of logging messages
 */
typedef enum {
    MG_NONE        = 0x00000000,

    MG_GENERAL     = 0x00000001,
    MG_ENVIRONMENT = 0x00000002,
    MG_IO          = 0x00000004,
    MG_NETWORK     = 0x00000008,
    MG_UNDEFD      = 0x00000010, // For range checking

    MG_ALL         = 0xFFFFFFFF
} mgDebugClass;


/**
 * Define the possible logging priorities (and their order).
 */
typedef enum {
    MG_BULK = 1,       // For frequent messages
    MG_DEBUG,          // Less frequent debug type messages
    MG_INFO,           // Informatory messages
    MG_WARN,           // Possible impending problem
    MG_ALERT,          // Very possible impending problem
    MG_POPUP,          // Severe enough to alert using a pop-up window

    MG_MANDATORY_INFO  // Always printed, regardless of the configured level
} mgDebugPriority;
