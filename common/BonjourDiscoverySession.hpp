// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourMDNSClient.hpp"
#include "BonjourResolutionListener.hpp"
#include <memory>
#include <string>

class BonjourEventLoop;

/*!
 * One interface worth of discovery:
 * a client bound to the interface address, a browser
 * for the service type, and the listener fed by the browser.
 */
class BONJOUR_SCAN_API BonjourDiscoverySession
{
public:
    BonjourDiscoverySession(
        BonjourEventLoop &loop,
        const BonjourMDNSClient::Factory &factory,
        const std::string &serviceType,
        const std::string &ifAddr,
        const long resolveTimeoutUs);

    ~BonjourDiscoverySession(void);

    //! The interface address this session is bound to
    const std::string &getInterfaceAddress(void) const;

    const BonjourResolutionListener &getListener(void) const;

    /*!
     * Tear down the listener task, then the browser, then the client.
     * Every step runs even when an earlier one failed.
     * Safe to call more than once and never throws.
     */
    void close(void);

    bool closed(void) const;

private:
    const std::string _ifAddr;
    bool _closed;

    //declared in teardown order reversed, so destruction matches close()
    std::unique_ptr<BonjourMDNSClient> _client;
    std::unique_ptr<BonjourServiceBrowser> _browser;
    BonjourResolutionListener _listener;
};
