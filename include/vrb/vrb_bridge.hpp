/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief C++ interface for the VRB bridge
 */

#pragma once

#include "vrb_config.h"
#include "vrb_defines.h"
#include "vrb_events.h"
#include "vrb_types.h"

#include <memory>

/** \cond DO_NOT_DOCUMENT */
typedef struct VrbBridge VrbBridge;
/** \endcond */

/** \brief settings for VrbBridge::setup() */
typedef struct VrbBridgeSettings
{
    VrbSize structSize;
    /** IP address of the OSC listener */
    const VrbChar *listenAddress;
    /** UDP port of the OSC listener */
    VrbInt32 listenPort;
    /** realtime service URL template; `%s` is replaced with the model */
    const VrbChar *realtimeUrl;
} VrbBridgeSettings;

/** \brief default initializer for VrbBridgeSettings struct */
#define VRB_BRIDGE_SETTINGS_INIT() {                    \
    VRB_STRUCT_SIZE(VrbBridgeSettings, realtimeUrl),    \
    VRB_OSC_LISTEN_ADDRESS, VRB_OSC_LISTEN_PORT,        \
    VRB_REALTIME_URL                                    \
}

/** \brief create a new VRB bridge instance
 *
 * \return new VrbBridge instance on success; `NULL` on failure
 */
VRB_API VrbBridge * VRB_CALL VrbBridge_new(void);

/** \brief destroy VRB bridge
 *
 * Stops the OSC listener and closes the realtime connection.
 */
VRB_API void VRB_CALL VrbBridge_free(VrbBridge *bridge);

/*-----------------------------------------------------------*/

/** \brief VRB bridge interface
 *
 * All methods that take a `VrbErrorInfo *` argument accept `NULL`;
 * otherwise the struct receives the error code and a description.
 */
struct VrbBridge {
public:
    /** \brief custom deleter for VrbBridge */
    class Deleter {
    public:
        void operator()(VrbBridge *obj){
            VrbBridge_free(obj);
        }
    };

    /** \brief smart pointer for VRB bridge instance */
    using Ptr = std::unique_ptr<VrbBridge, Deleter>;

    /** \brief create a new managed VRB bridge instance
     *
     * \return valid Ptr on success; empty Ptr failure
     */
    static Ptr create() {
        return Ptr(VrbBridge_new());
    }

    /*------------------ methods -------------------------------*/

    /** \brief setup the bridge object
     *
     * \attention Not threadsafe - only call in the beginning!
     */
    virtual VrbError VRB_CALL setup(const VrbBridgeSettings& settings) = 0;

    /** \brief set event handler function and event handling mode
     *
     * \attention Not threadsafe - only call in the beginning!
     */
    virtual VrbError VRB_CALL setEventHandler(
        VrbEventHandler fn, void *user, VrbEventMode mode) = 0;

    /** \brief check for pending events
     *
     * \note Threadsafe
     */
    virtual VrbBool VRB_CALL eventsAvailable() = 0;

    /** \brief poll events
     *
     * \note Threadsafe, but not reentrant.
     *
     * This function will call the registered event handler one or more times.
     * \attention The event handler must have been registered with #kVrbEventModePoll.
     */
    virtual VrbError VRB_CALL pollEvents() = 0;

    /** \brief send `/chatbox/typing T` to the given endpoint
     *
     * \note Threadsafe and reentrant.
     */
    virtual VrbError VRB_CALL sendTyping(
        const VrbChar *address, VrbInt32 port, VrbErrorInfo *info) = 0;

    /** \brief send `/chatbox/input <text> T` to the given endpoint
     *
     * \note Threadsafe and reentrant.
     */
    virtual VrbError VRB_CALL sendMessage(
        const VrbChar *text, const VrbChar *address, VrbInt32 port,
        VrbErrorInfo *info) = 0;

    /** \brief start the OSC listener
     *
     * Only the first call has an effect; the listener can't be restarted.
     * Bind and receive errors are logged and also reported as a
     * kVrbEventError event (kVrbErrorSocket); the listener then stays dead.
     *
     * \note Threadsafe
     */
    virtual VrbError VRB_CALL startOscListener() = 0;

    /** \brief open the system audio settings (Windows only) */
    virtual VrbError VRB_CALL showAudioSettings() = 0;

    /** \brief connect to the realtime service
     *
     * Blocks until the WebSocket handshake has finished.
     * An existing connection is closed first.
     *
     * \attention Must not be called from a realtime event handler!
     */
    virtual VrbError VRB_CALL realtimeConnect(
        const VrbChar *apiKey, const VrbChar *model, VrbErrorInfo *info) = 0;

    /** \brief send a text frame
     *
     * Blocks until the frame has been written.
     *
     * \attention Must not be called from a realtime event handler!
     */
    virtual VrbError VRB_CALL realtimeSend(
        const VrbChar *text, VrbErrorInfo *info) = 0;

    /** \brief close the realtime connection
     *
     * \attention Must not be called from a realtime event handler!
     */
    virtual VrbError VRB_CALL realtimeClose(VrbErrorInfo *info) = 0;
protected:
    ~VrbBridge(){} // non-virtual!
};
