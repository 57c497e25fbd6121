// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include <string>
#include <vector>

struct BONJOUR_SCAN_API BonjourIfAddr
{
    BonjourIfAddr(void);
    int ethno; //! The ethernet index
    int ipVer; //! The ip protocol: 4 or 6
    bool isUp; //! Is this link active?
    std::string name; //! The interface name: ex eth0
    std::string addr; //! The ip address as a string, without scope
};

//! Get a list of IF addrs
BONJOUR_SCAN_API std::vector<BonjourIfAddr> listBonjourIfAddrs(void);

/*!
 * Select the address literals to scan for an IP version.
 * IPv4 skips 127.0.0.1, IPv6 skips ::1 and fe80::1.
 * IPv6 literals are rendered with a zone suffix: addr%zone
 * \param ifAddrs the enumerated interface addresses
 * \param ipVer BONJOUR_SCAN_IPVER_INET or BONJOUR_SCAN_IPVER_INET6
 * \param zoneStyle BONJOUR_SCAN_ZONE_NAME or BONJOUR_SCAN_ZONE_INDEX
 */
BONJOUR_SCAN_API std::vector<std::string> filterBonjourIfAddrs(
    const std::vector<BonjourIfAddr> &ifAddrs, const int ipVer, const int zoneStyle);

//! Split "fe80::5%en0" into the address and the zone (empty when unscoped)
BONJOUR_SCAN_API std::string splitBonjourZone(const std::string &ifAddr, std::string &zone);

/*!
 * Find the interface index for an address literal.
 * A zone suffix selects the interface directly,
 * otherwise the address is matched against the list.
 * \return the index or BONJOUR_SCAN_IF_UNSPEC when unknown
 */
BONJOUR_SCAN_API int lookupBonjourIfIndex(const std::string &ifAddr, const std::vector<BonjourIfAddr> &ifAddrs);

//! Lookup using the live interface list
BONJOUR_SCAN_API int lookupBonjourIfIndex(const std::string &ifAddr);
