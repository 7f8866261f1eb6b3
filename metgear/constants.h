// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 1997 Curtis L. Olson  - http://www.flightgear.org/~curt

/**
 * @file
 * @brief Various constant definitions.
 */

#pragma once

/** Statute Miles to Meters */
#define MG_SM_TO_METER      1609.3412

/** Feet to Meters */
#define MG_FEET_TO_METER    0.3048

/** Knots to Meters per second */
#define MG_KT_TO_MPS        0.5144444444444

/** Inches Mercury to Pascal */
#define MG_INHG_TO_PA       3386.388640341
