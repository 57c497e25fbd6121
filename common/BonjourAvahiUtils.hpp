// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include "BonjourMDNSClient.hpp"
#include <avahi-common/strlst.h>
#include <cstddef>
#include <cstdint>
#include <string>

/*!
 * Split a fully qualified service type into the avahi type and domain.
 * Example: "_remoted._tcp.local." -> "_remoted._tcp" and "local"
 * The domain is empty when the type carries none.
 */
BONJOUR_SCAN_API void splitBonjourServiceType(const std::string &serviceType, std::string &type, std::string &domain);

//! TXT record strings to properties, a key without a value maps to empty
BONJOUR_SCAN_API BonjourProperties bonjourTxtToProperties(AvahiStringList *txt);

/*!
 * Render the rdata of an A or AAAA record as an address literal.
 * \return the literal or empty for other types and malformed data
 */
BONJOUR_SCAN_API std::string bonjourRDataToString(const uint16_t type, const void *rdata, const size_t size);

/*!
 * Gathers every address of a resolved host.
 * The service record is seeded from the SRV and TXT answer,
 * then each outstanding A or AAAA lookup adds its addresses
 * and reports when it is done.
 */
class BONJOUR_SCAN_API BonjourAddressCollector
{
public:
    BonjourAddressCollector(void);

    //! Start collecting for a record with the given number of lookups
    void begin(const BonjourServiceRecord &record, const size_t lookups);

    //! Add one literal to ipv4 or ipv6, duplicates are dropped
    void addAddress(const std::string &addr);

    //! Add the address in an A or AAAA rdata, false when not an address
    bool addRData(const uint16_t type, const void *rdata, const size_t size);

    //! Mark one lookup done, true when it was the last one
    bool finishLookup(void);

    bool complete(void) const;

    const BonjourServiceRecord &getRecord(void) const;

private:
    BonjourServiceRecord _record;
    size_t _lookups;
};
