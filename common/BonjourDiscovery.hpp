// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourConfig.hpp"
#include "BonjourAnswer.hpp"
#include "BonjourIfAddrs.hpp"
#include "BonjourMDNSClient.hpp"
#include <functional>
#include <string>
#include <vector>

/*!
 * Discover a service type across many interfaces at once.
 * One session runs per interface address on a shared event loop,
 * and the answers are reported in interface order without duplicates.
 */
class BONJOUR_SCAN_API BonjourDiscovery
{
public:
    typedef std::function<std::vector<BonjourIfAddr>(void)> Enumerator;

    //! Discovery using avahi and the live interface list
    BonjourDiscovery(const BonjourConfig &config = BonjourConfig::getDefault());

    //! Discovery with a custom client factory and interface enumerator
    BonjourDiscovery(const BonjourConfig &config, const BonjourMDNSClient::Factory &factory, const Enumerator &enumerator);

    const BonjourConfig &getConfig(void) const;

    /*!
     * Browse on every interface address for the configured timeout.
     * \param serviceType fully qualified type, ex "_remoted._tcp.local."
     * \param ifAddrs interface addresses, "addr%zone" for IPv6
     * \param timeoutUs time to wait before collecting answers
     * \return answers ordered by interface address
     */
    std::vector<BonjourAnswer> browse(const std::string &serviceType, const std::vector<std::string> &ifAddrs, const long timeoutUs);

    //! Browse using the configured timeout
    std::vector<BonjourAnswer> browse(const std::string &serviceType, const std::vector<std::string> &ifAddrs);

    //! The filtered interface addresses for an IP version
    std::vector<std::string> listInterfaceAddresses(const int ipVer);

private:
    BonjourConfig _config;
    BonjourMDNSClient::Factory _factory;
    Enumerator _enumerator;
};
