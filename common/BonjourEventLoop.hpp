// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include <functional>
#include <memory>

struct AvahiPoll;
struct AvahiSimplePoll;
struct AvahiTimeout;

/*!
 * A one-shot timer on the event loop.
 * Destroying the timer cancels it when it has not fired.
 */
class BONJOUR_SCAN_API BonjourTimer
{
public:
    typedef std::function<void(void)> Handler;

    ~BonjourTimer(void);

    //! Stop the timer, safe to call more than once
    void cancel(void);

    //! True until the timer fired or was cancelled
    bool pending(void) const;

private:
    friend class BonjourEventLoop;
    BonjourTimer(const AvahiPoll *poll, const Handler &handler);
    static void timeoutCallback(AvahiTimeout *t, void *userdata);
    const AvahiPoll *_poll;
    AvahiTimeout *_timeout;
    Handler _handler;
    bool _pending;
};

/*!
 * Single threaded event loop shared by every discovery session.
 * All client sockets, resolver callbacks, and timers are dispatched
 * from the thread that calls runFor().
 */
class BONJOUR_SCAN_API BonjourEventLoop
{
public:
    BonjourEventLoop(void);

    ~BonjourEventLoop(void);

    //! Was the poll object created?
    bool status(void) const;

    //! Poll API handed to avahi clients
    const AvahiPoll *getPoll(void) const;

    /*!
     * Schedule a handler to run once after the timeout.
     * A zero timeout runs on the next loop iteration.
     * \return the timer or null when the loop is unusable
     */
    std::unique_ptr<BonjourTimer> newTimer(const long timeoutUs, const BonjourTimer::Handler &handler);

    /*!
     * Dispatch events until the timeout has elapsed.
     * Returns early only if the poll reports an error.
     */
    void runFor(const long timeoutUs);

private:
    BonjourEventLoop(const BonjourEventLoop &) = delete;
    BonjourEventLoop &operator=(const BonjourEventLoop &) = delete;
    AvahiSimplePoll *_simplePoll;
};
