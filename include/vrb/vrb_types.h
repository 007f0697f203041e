/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief VRB types
 */

#pragma once

#include "vrb_config.h"
#include "vrb_defines.h"

#include <stddef.h>
#include <stdint.h>

/*---------- basic types ----------*/

/** \brief boolean type */
typedef int32_t VrbBool;

#define kVrbTrue 1
#define kVrbFalse 0

/** \brief character type */
typedef char VrbChar;
/** \brief byte type */
typedef unsigned char VrbByte;
/** \brief 32-bit signed integer */
typedef int32_t VrbInt32;
/** \brief 32-bit unsigned integer */
typedef uint32_t VrbUInt32;
/** \brief size type */
typedef size_t VrbSize;

/*---------- error codes ----------*/

/** \brief error codes */
VRB_ENUM(VrbError)
{
    /** no error */
    kVrbOk = 0,
    /** operation not permitted */
    kVrbErrorNotPermitted,
    /** bad argument for function/method call */
    kVrbErrorBadArgument,
    /** socket error (resolve, bind, send or receive) */
    kVrbErrorSocket,
    /** realtime connection: URL or WebSocket handshake failed */
    kVrbErrorHandshake,
    /** realtime connection: there is no active connection */
    kVrbErrorNotConnected,
    /** realtime connection: read or write failed */
    kVrbErrorTransport,
    /** unspecified system error */
    kVrbErrorSystem
};

/** \brief error code plus descriptive message */
typedef struct VrbErrorInfo
{
    VrbError code;
    VrbChar message[VRB_ERROR_MESSAGE_SIZE];
} VrbErrorInfo;

/*---------- logging ----------*/

/** \brief log levels */
VRB_ENUM(VrbLogLevel)
{
    /** no logging */
    kVrbLogLevelNone = 0,
    /** only errors */
    kVrbLogLevelError = 1,
    /** only errors and warnings */
    kVrbLogLevelWarning = 2,
    /** errors, warnings and notifications */
    kVrbLogLevelVerbose = 3,
    /** all messages */
    kVrbLogLevelDebug = 4
};

/** \brief custom log function type
 *
 * \param level the log level
 * \param message the message
 */
typedef void (VRB_CALL *VrbLogFunc)(VrbLogLevel level, const VrbChar *message);

/*---------- events ----------*/

/** \brief event handling modes */
VRB_ENUM(VrbEventMode)
{
    /** no event handling */
    kVrbEventModeNone = 0,
    /** events are handled in the thread that produced them */
    kVrbEventModeCallback = 1,
    /** events are queued and must be polled with `pollEvents()` */
    kVrbEventModePoll = 2
};

/** \brief thread levels for event handlers */
VRB_ENUM(VrbThreadLevel)
{
    /** unknown thread (e.g. pollEvents() caller) */
    kVrbThreadLevelUnknown = 0,
    /** OSC listener thread */
    kVrbThreadLevelListener = 1,
    /** realtime network thread */
    kVrbThreadLevelNetwork = 2
};

/** \cond DO_NOT_DOCUMENT */
union VrbEvent;
/** \endcond */

/** \brief event handler function type
 *
 * \param user user data
 * \param event the event
 * \param level the thread level
 */
typedef void (VRB_CALL *VrbEventHandler)(
        void *user, const union VrbEvent *event, VrbThreadLevel level);
