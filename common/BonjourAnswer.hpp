// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <map>

//! TXT record key/value pairs, values are raw bytes
typedef std::map<std::string, std::string> BonjourProperties;

/*!
 * A resolved service answer from one interface.
 * Two answers are equal when the properties, addresses, and port match.
 */
class BONJOUR_SCAN_API BonjourAnswer
{
public:
    BonjourAnswer(const BonjourProperties &properties, const std::vector<std::string> &ips, const uint16_t port);

    //! The TXT record properties
    const BonjourProperties &getProperties(void) const;

    //! Resolved addresses, IPv4 first then scoped IPv6
    const std::vector<std::string> &getIps(void) const;

    //! The service port
    uint16_t getPort(void) const;

    //! Single line markup for printing
    std::string toString(void) const;

    bool operator==(const BonjourAnswer &other) const;
    bool operator!=(const BonjourAnswer &other) const;

private:
    BonjourProperties _properties;
    std::vector<std::string> _ips;
    uint16_t _port;
};
