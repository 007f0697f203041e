/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief main library API
 */

#pragma once

#include "vrb_config.h"
#include "vrb_defines.h"
#include "vrb_events.h"
#include "vrb_types.h"

/*------------------------------------------------------*/

/** \brief settings for vrb_initialize()
 *
 * \details Example:
 *
 *      VrbSettings settings = VRB_SETTINGS_INIT();
 *      settings.logFunc = myLogFunc; // set custom log function
 *      vrb_initialize(&settings);
 */
typedef struct VrbSettings
{
    VrbSize structSize;
    /** custom log function, or `NULL` */
    VrbLogFunc logFunc;
} VrbSettings;

/** \brief default initializer for VrbSettings struct */
#define VRB_SETTINGS_INIT() {               \
    VRB_STRUCT_SIZE(VrbSettings, logFunc),  \
    NULL                                    \
}

/**
 * \brief initialize VRB library settings
 *
 * \note Call before any other VRB function!
 * \param settings (optional) settings struct
 */
VRB_API VrbError VRB_CALL vrb_initialize(const VrbSettings *settings);

/**
 * \brief terminate VRB library
 *
 * \note Call before program exit.
 */
VRB_API void VRB_CALL vrb_terminate(void);

/**
 * \brief get the VRB version number
 *
 * \param [out] major major version
 * \param [out] minor minor version
 * \param [out] patch bugfix version
 */
VRB_API void VRB_CALL vrb_getVersion(
        VrbInt32 *major, VrbInt32 *minor, VrbInt32 *patch);

/**
 * \brief get the VRB version string
 *
 * Format: `<major>.<minor>.<patch>`
 * \return the version as a C string
 */
VRB_API const VrbChar * VRB_CALL vrb_getVersionString(void);

/**
 * \brief get a textual description for an error code
 *
 * \param err the error code
 * \return a C string describing the error; if the error code is unknown,
 *         an empty string is returned.
 */
VRB_API const VrbChar * VRB_CALL vrb_strerror(VrbError err);

/**
 * \brief get the host-facing event name
 *
 * E.g. "vrchat-mute" or "realtime-message".
 * \param type the event type
 * \return the event name; empty string for unknown types
 */
VRB_API const VrbChar * VRB_CALL vrb_eventName(VrbEventType type);
