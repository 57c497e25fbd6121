// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourAnswer.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class BonjourEventLoop;

//! Kinds of browse notifications
enum BonjourStateChange
{
    BONJOUR_SERVICE_ADDED,
    BONJOUR_SERVICE_REMOVED,
    BONJOUR_SERVICE_UPDATED,
};

//! Full record of a resolved service instance
struct BONJOUR_SCAN_API BonjourServiceRecord
{
    BonjourServiceRecord(void);
    std::vector<std::string> ipv4; //! A record addresses
    std::vector<std::string> ipv6; //! AAAA record addresses, without scope
    uint16_t port; //! SRV record port
    BonjourProperties properties; //! TXT record pairs
};

//! An active browse subscription
class BONJOUR_SCAN_API BonjourServiceBrowser
{
public:
    virtual ~BonjourServiceBrowser(void);

    //! Stop delivering notifications, safe to call more than once
    virtual void cancel(void) = 0;
};

//! An outstanding resolve request
class BONJOUR_SCAN_API BonjourServiceResolver
{
public:
    virtual ~BonjourServiceResolver(void);

    //! Abandon the request, the handler will not be called
    virtual void cancel(void) = 0;
};

/*!
 * The mDNS client scoped to a single interface address.
 * Every callback is dispatched from the event loop the client was made on.
 */
class BONJOUR_SCAN_API BonjourMDNSClient
{
public:
    typedef std::function<void(BonjourMDNSClient &client, const std::string &serviceType,
        const std::string &name, const BonjourStateChange change)> StateChangeHandler;

    //! Called once with found=false when the resolve failed
    typedef std::function<void(const bool found, const BonjourServiceRecord &record)> ResolveHandler;

    //! Makes one client bound to the given interface address
    typedef std::function<std::unique_ptr<BonjourMDNSClient>(BonjourEventLoop &loop, const std::string &ifAddr)> Factory;

    virtual ~BonjourMDNSClient(void);

    //! Is the client bound and operational?
    virtual bool status(void) = 0;

    /*!
     * Subscribe to instances of a service type on this interface.
     * \return the subscription or null on failure
     */
    virtual std::unique_ptr<BonjourServiceBrowser> browse(const std::string &serviceType, const StateChangeHandler &handler) = 0;

    /*!
     * Request the full record of one instance on this interface.
     * \return the request or null on failure
     */
    virtual std::unique_ptr<BonjourServiceResolver> resolve(const std::string &serviceType, const std::string &name, const ResolveHandler &handler) = 0;

    //! Disconnect, browsers and resolvers must be cancelled first
    virtual void close(void) = 0;

    //! Factory for the avahi daemon backed client
    static std::unique_ptr<BonjourMDNSClient> makeAvahi(BonjourEventLoop &loop, const std::string &ifAddr);
};
