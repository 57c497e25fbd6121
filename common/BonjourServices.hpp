// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourAnswer.hpp"
#include <string>
#include <vector>

class BonjourDiscovery;

/*!
 * Convenience scans for well known device services.
 * The overloads without a timeout use the configured default.
 */
namespace BonjourServices
{
    //! The discovery instance used when none is passed in
    BONJOUR_SCAN_API BonjourDiscovery &getDefaultDiscovery(void);

    //! Scan the IPv6 interfaces, addresses carry the interface zone
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv6(BonjourDiscovery &discovery, const std::string &serviceType, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv6(const std::string &serviceType, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv6(const std::string &serviceType);

    //! Scan the IPv4 interfaces, loopback excluded
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv4(BonjourDiscovery &discovery, const std::string &serviceType, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv4(const std::string &serviceType, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseIPv4(const std::string &serviceType);

    //! Remote service daemon over IPv6
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemoted(BonjourDiscovery &discovery, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemoted(const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemoted(void);

    //! Legacy wireless pairing over IPv4
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseMobdev2(BonjourDiscovery &discovery, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseMobdev2(const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseMobdev2(void);

    //! Manual remote pairing over IPv4
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemotePairing(BonjourDiscovery &discovery, const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemotePairing(const long timeoutUs);
    BONJOUR_SCAN_API std::vector<BonjourAnswer> browseRemotePairing(void);
};
