// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourSocketDefs.hpp"
#include "BonjourScanDefs.hpp"
#include "BonjourIfAddrs.hpp"
#include <SoapySDR/Logger.hpp>
#include <stdexcept>
#include <cctype>

BonjourIfAddr::BonjourIfAddr(void):
    ethno(0),
    ipVer(0),
    isUp(false)
{
    return;
}

static std::string sockAddrToString(const struct sockaddr *sa)
{
    char buff[INET6_ADDRSTRLEN];
    const void *src(nullptr);
    switch(sa->sa_family)
    {
    case AF_INET: src = &((const struct sockaddr_in *)sa)->sin_addr; break;
    case AF_INET6: src = &((const struct sockaddr_in6 *)sa)->sin6_addr; break;
    default: return "";
    }
    if (inet_ntop(sa->sa_family, src, buff, sizeof(buff)) == nullptr) return "";
    return buff;
}

std::vector<BonjourIfAddr> listBonjourIfAddrs(void)
{
    std::vector<BonjourIfAddr> result;

    struct ifaddrs *ifaddr;
    if (getifaddrs(&ifaddr) == -1)
    {
        SoapySDR::log(SOAPY_SDR_ERROR, "BonjourIfAddrs: getifaddrs() failed");
        return result;
    }

    for (struct ifaddrs *ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == NULL) continue;

        BonjourIfAddr ifAddr;
        switch(ifa->ifa_addr->sa_family)
        {
        case AF_INET: ifAddr.ipVer = BONJOUR_SCAN_IPVER_INET; break;
        case AF_INET6: ifAddr.ipVer = BONJOUR_SCAN_IPVER_INET6; break;
        default: break;
        }
        if (ifAddr.ipVer == 0) continue;

        ifAddr.isUp = ((ifa->ifa_flags & IFF_UP) != 0);
        ifAddr.ethno = if_nametoindex(ifa->ifa_name);
        ifAddr.name = ifa->ifa_name;
        ifAddr.addr = sockAddrToString(ifa->ifa_addr);
        if (ifAddr.addr.empty()) continue;
        SoapySDR::logf(SOAPY_SDR_TRACE, "Interface %d: %s [addr=%s, up?%d]",
            ifAddr.ethno, ifAddr.name.c_str(), ifAddr.addr.c_str(), ifAddr.isUp);
        result.push_back(ifAddr);
    }

    freeifaddrs(ifaddr);
    return result;
}

std::vector<std::string> filterBonjourIfAddrs(
    const std::vector<BonjourIfAddr> &ifAddrs, const int ipVer, const int zoneStyle)
{
    std::vector<std::string> result;
    for (const auto &ifAddr : ifAddrs)
    {
        if (not ifAddr.isUp) continue;
        if (ifAddr.ipVer != ipVer) continue;

        if (ipVer == BONJOUR_SCAN_IPVER_INET)
        {
            if (ifAddr.addr == "127.0.0.1") continue;
            result.push_back(ifAddr.addr);
        }

        if (ipVer == BONJOUR_SCAN_IPVER_INET6)
        {
            //skip localhost
            if (ifAddr.addr == "::1" or ifAddr.addr == "fe80::1") continue;
            const auto zone = (zoneStyle == BONJOUR_SCAN_ZONE_INDEX)?
                std::to_string(ifAddr.ethno) : ifAddr.name;
            result.push_back(ifAddr.addr + "%" + zone);
        }
    }
    return result;
}

std::string splitBonjourZone(const std::string &ifAddr, std::string &zone)
{
    const auto pos = ifAddr.find('%');
    if (pos == std::string::npos)
    {
        zone.clear();
        return ifAddr;
    }
    zone = ifAddr.substr(pos+1);
    return ifAddr.substr(0, pos);
}

int lookupBonjourIfIndex(const std::string &ifAddr, const std::vector<BonjourIfAddr> &ifAddrs)
{
    std::string zone;
    const auto addr = splitBonjourZone(ifAddr, zone);

    if (not zone.empty())
    {
        bool numeric = true;
        for (const char ch : zone) numeric = numeric and std::isdigit((unsigned char)ch);
        if (numeric)
        {
            try
            {
                return std::stoi(zone);
            }
            catch (const std::out_of_range &)
            {
                return BONJOUR_SCAN_IF_UNSPEC;
            }
        }
        for (const auto &entry : ifAddrs)
        {
            if (entry.name == zone) return entry.ethno;
        }
        const unsigned int index = if_nametoindex(zone.c_str());
        return (index == 0)? BONJOUR_SCAN_IF_UNSPEC : int(index);
    }

    for (const auto &entry : ifAddrs)
    {
        if (entry.addr == addr) return entry.ethno;
    }
    return BONJOUR_SCAN_IF_UNSPEC;
}

int lookupBonjourIfIndex(const std::string &ifAddr)
{
    return lookupBonjourIfIndex(ifAddr, listBonjourIfAddrs());
}
