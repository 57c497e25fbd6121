// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourServices.hpp"
#include "BonjourDiscovery.hpp"
#include "BonjourScanDefs.hpp"

BonjourDiscovery &BonjourServices::getDefaultDiscovery(void)
{
    static BonjourDiscovery discovery;
    return discovery;
}

/***********************************************************************
 * Scans by IP version
 **********************************************************************/
std::vector<BonjourAnswer> BonjourServices::browseIPv6(BonjourDiscovery &discovery, const std::string &serviceType, const long timeoutUs)
{
    return discovery.browse(serviceType, discovery.listInterfaceAddresses(BONJOUR_SCAN_IPVER_INET6), timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseIPv6(const std::string &serviceType, const long timeoutUs)
{
    return browseIPv6(getDefaultDiscovery(), serviceType, timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseIPv6(const std::string &serviceType)
{
    auto &discovery = getDefaultDiscovery();
    return browseIPv6(discovery, serviceType, discovery.getConfig().timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseIPv4(BonjourDiscovery &discovery, const std::string &serviceType, const long timeoutUs)
{
    return discovery.browse(serviceType, discovery.listInterfaceAddresses(BONJOUR_SCAN_IPVER_INET), timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseIPv4(const std::string &serviceType, const long timeoutUs)
{
    return browseIPv4(getDefaultDiscovery(), serviceType, timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseIPv4(const std::string &serviceType)
{
    auto &discovery = getDefaultDiscovery();
    return browseIPv4(discovery, serviceType, discovery.getConfig().timeoutUs);
}

/***********************************************************************
 * Well known services
 **********************************************************************/
std::vector<BonjourAnswer> BonjourServices::browseRemoted(BonjourDiscovery &discovery, const long timeoutUs)
{
    return browseIPv6(discovery, BONJOUR_SCAN_REMOTED_SERVICE, timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseRemoted(const long timeoutUs)
{
    return browseRemoted(getDefaultDiscovery(), timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseRemoted(void)
{
    return browseIPv6(BONJOUR_SCAN_REMOTED_SERVICE);
}

std::vector<BonjourAnswer> BonjourServices::browseMobdev2(BonjourDiscovery &discovery, const long timeoutUs)
{
    return browseIPv4(discovery, BONJOUR_SCAN_MOBDEV2_SERVICE, timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseMobdev2(const long timeoutUs)
{
    return browseMobdev2(getDefaultDiscovery(), timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseMobdev2(void)
{
    return browseIPv4(BONJOUR_SCAN_MOBDEV2_SERVICE);
}

std::vector<BonjourAnswer> BonjourServices::browseRemotePairing(BonjourDiscovery &discovery, const long timeoutUs)
{
    return browseIPv4(discovery, BONJOUR_SCAN_REMOTEPAIRING_SERVICE, timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseRemotePairing(const long timeoutUs)
{
    return browseRemotePairing(getDefaultDiscovery(), timeoutUs);
}

std::vector<BonjourAnswer> BonjourServices::browseRemotePairing(void)
{
    return browseIPv4(BONJOUR_SCAN_REMOTEPAIRING_SERVICE);
}
