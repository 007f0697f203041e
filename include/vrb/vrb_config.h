/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief compile time configuration
 *
 * All settings can be overridden with compiler definitions,
 * e.g. `-DVRB_LOG_LEVEL=kVrbLogLevelDebug`.
 */

#pragma once

/** \brief max. log level; messages above are compiled out */
#ifndef VRB_LOG_LEVEL
# define VRB_LOG_LEVEL kVrbLogLevelWarning
#endif

/** \brief use IPv6 sockets where possible */
#ifndef VRB_USE_IPV6
# define VRB_USE_IPV6 1
#endif

/** \brief max. UDP packet size */
#ifndef VRB_MAX_PACKET_SIZE
# define VRB_MAX_PACKET_SIZE 4096
#endif

/** \brief default address of the OSC listener */
#ifndef VRB_OSC_LISTEN_ADDRESS
# define VRB_OSC_LISTEN_ADDRESS "127.0.0.1"
#endif

/** \brief default port of the OSC listener */
#ifndef VRB_OSC_LISTEN_PORT
# define VRB_OSC_LISTEN_PORT 9001
#endif

/** \brief default realtime service URL
 *
 * The first `%s` is replaced with the model name.
 */
#ifndef VRB_REALTIME_URL
# define VRB_REALTIME_URL "wss://dashscope.aliyuncs.com/api-ws/v1/realtime?model=%s"
#endif

/** \brief size of the error message buffer in VrbErrorInfo */
#ifndef VRB_ERROR_MESSAGE_SIZE
# define VRB_ERROR_MESSAGE_SIZE 256
#endif
