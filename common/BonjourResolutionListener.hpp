// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourMDNSClient.hpp"
#include "BonjourEventLoop.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

//! Lifecycle of the single resolution task
enum BonjourResolutionState
{
    BONJOUR_RESOLUTION_IDLE,
    BONJOUR_RESOLUTION_QUEUED,
    BONJOUR_RESOLUTION_RESOLVING,
    BONJOUR_RESOLUTION_RESOLVED,
    BONJOUR_RESOLUTION_FAILED,
    BONJOUR_RESOLUTION_CANCELLED,
};

//! A browse notification waiting for the resolution task
struct BonjourPendingNotification
{
    BonjourMDNSClient *client;
    std::string serviceType;
    std::string name;
    BonjourStateChange change;
};

/*!
 * Turns the first browse notification on one interface
 * into resolved addresses, port, and properties.
 *
 * The browse callback only queues the notification.
 * The resolution task runs from the event loop, takes exactly one
 * notification, and issues one bounded resolve request.
 * Later notifications stay in the queue unread.
 */
class BONJOUR_SCAN_API BonjourResolutionListener
{
public:
    /*!
     * \param loop the loop that dispatches the task
     * \param ifAddr the session interface, "addr%zone" for scoped IPv6
     * \param resolveTimeoutUs bound on the resolve request
     */
    BonjourResolutionListener(BonjourEventLoop &loop, const std::string &ifAddr, const long resolveTimeoutUs);

    ~BonjourResolutionListener(void);

    //! Browse callback: queue the notification, never blocks
    void onServiceStateChange(BonjourMDNSClient &client, const std::string &serviceType,
        const std::string &name, const BonjourStateChange change);

    /*!
     * Cancel the resolution task and wait for it to finish.
     * Cancellation is a normal outcome and is never reported.
     * Safe to call more than once.
     */
    void close(void);

    //! True once the task reached a terminal state
    bool finished(void) const;

    BonjourResolutionState getState(void) const;

    //! Number of notifications still queued
    size_t pendingCount(void) const;

    //! Resolved addresses, empty until resolved
    const std::vector<std::string> &getAddresses(void) const;

    const BonjourProperties &getProperties(void) const;

    uint16_t getPort(void) const;

private:
    void queryAddresses(void);
    void handleResolved(const bool found, const BonjourServiceRecord &record);
    void handleResolveTimeout(void);

    BonjourEventLoop &_loop;
    const std::string _ifAddr;
    const long _resolveTimeoutUs;

    std::deque<BonjourPendingNotification> _queue;
    BonjourResolutionState _state;

    //the task: a wakeup on the loop, the request, and its deadline
    std::unique_ptr<BonjourTimer> _wakeup;
    std::unique_ptr<BonjourServiceResolver> _resolver;
    std::unique_ptr<BonjourTimer> _deadline;

    BonjourProperties _properties;
    uint16_t _port;
    std::vector<std::string> _addresses;
};
