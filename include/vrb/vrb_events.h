/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief VRB event types
 */

#pragma once

#include "vrb_config.h"
#include "vrb_defines.h"
#include "vrb_types.h"

/*--------------------------------------------*/

/** \brief VRB event types */
VRB_ENUM(VrbEventType)
{
    /** generic error event */
    kVrbEventError = 0,
    /** OSC listener: "MuteSelf" avatar parameter changed */
    kVrbEventVrchatMute,
    /** realtime connection: received a text frame */
    kVrbEventRealtimeMessage,
    /** realtime connection: closed by the remote end or by realtimeClose() */
    kVrbEventRealtimeClose,
    /** realtime connection: read error; the connection is dead */
    kVrbEventRealtimeError
};

/*--------------------------------------------*/

/** \brief common header of all event structs */
#define VRB_EVENT_HEADER            \
    /** \cond DO_NOT_DOCUMENT */    \
    VrbEventType type;              \
    VrbUInt32 structSize;           \
    /** \endcond */

/** \brief base event */
typedef struct VrbEventBase
{
    VRB_EVENT_HEADER
} VrbEventBase;

/** \brief error event */
typedef struct VrbEventError
{
    VRB_EVENT_HEADER
    /** error code */
    VrbError errorCode;
    /** error message */
    const VrbChar *errorMessage;
} VrbEventError;

/** \brief "vrchat-mute" event */
typedef struct VrbEventVrchatMute
{
    VRB_EVENT_HEADER
    VrbBool muted; /**< new mute state */
} VrbEventVrchatMute;

/** \brief "realtime-message" event */
typedef struct VrbEventRealtimeMessage
{
    VRB_EVENT_HEADER
    const VrbChar *text; /**< text payload (not NULL-terminated!) */
    VrbSize size; /**< payload size in bytes */
} VrbEventRealtimeMessage;

/** \brief "realtime-close" event */
typedef struct VrbEventRealtimeClose
{
    VRB_EVENT_HEADER
} VrbEventRealtimeClose;

/** \brief "realtime-error" event */
typedef struct VrbEventRealtimeError
{
    VRB_EVENT_HEADER
    VrbError errorCode; /**< always #kVrbErrorTransport */
    const VrbChar *errorMessage; /**< error description */
} VrbEventRealtimeError;

/*----------------------------------------------------*/

/** \brief union holding all possible events */
union VrbEvent
{
    VrbEventType type; /**< \brief the event type */
    VrbEventBase base; /**< \brief base */
    VrbEventError error; /**< \brief error */
    VrbEventVrchatMute vrchatMute; /**< \brief mute state */
    VrbEventRealtimeMessage realtimeMessage; /**< \brief text frame */
    VrbEventRealtimeClose realtimeClose; /**< \brief connection closed */
    VrbEventRealtimeError realtimeError; /**< \brief connection error */
};
