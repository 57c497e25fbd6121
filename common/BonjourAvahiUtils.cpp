// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourSocketDefs.hpp"
#include "BonjourAvahiUtils.hpp"
#include <avahi-common/defs.h>
#include <avahi-common/malloc.h>
#include <algorithm>

void splitBonjourServiceType(const std::string &serviceType, std::string &type, std::string &domain)
{
    std::string fqdn = serviceType;
    while (not fqdn.empty() and fqdn.back() == '.') fqdn.pop_back();

    //the type is the instance label and the transport label
    const auto first = fqdn.find('.');
    const auto second = (first == std::string::npos)? first : fqdn.find('.', first+1);
    if (second == std::string::npos)
    {
        type = fqdn;
        domain.clear();
        return;
    }
    type = fqdn.substr(0, second);
    domain = fqdn.substr(second+1);
}

BonjourProperties bonjourTxtToProperties(AvahiStringList *txt)
{
    BonjourProperties properties;
    for (; txt != nullptr; txt = txt->next)
    {
        char *key(nullptr), *value(nullptr); size_t size(0);
        if (avahi_string_list_get_pair(txt, &key, &value, &size) != 0) continue;
        if (key == nullptr) continue;
        properties[key] = (value == nullptr)?std::string():std::string(value, size);
        avahi_free(key);
        avahi_free(value);
    }
    return properties;
}

std::string bonjourRDataToString(const uint16_t type, const void *rdata, const size_t size)
{
    char buff[INET6_ADDRSTRLEN];
    int family(0);
    if (type == AVAHI_DNS_TYPE_A and size == 4) family = AF_INET;
    if (type == AVAHI_DNS_TYPE_AAAA and size == 16) family = AF_INET6;
    if (family == 0 or rdata == nullptr) return "";
    if (inet_ntop(family, rdata, buff, sizeof(buff)) == nullptr) return "";
    return buff;
}

/***********************************************************************
 * Address collector
 **********************************************************************/
BonjourAddressCollector::BonjourAddressCollector(void):
    _lookups(0)
{
    return;
}

void BonjourAddressCollector::begin(const BonjourServiceRecord &record, const size_t lookups)
{
    _record = BonjourServiceRecord();
    _record.port = record.port;
    _record.properties = record.properties;
    _lookups = lookups;
    for (const auto &addr : record.ipv4) this->addAddress(addr);
    for (const auto &addr : record.ipv6) this->addAddress(addr);
}

void BonjourAddressCollector::addAddress(const std::string &addr)
{
    if (addr.empty()) return;
    auto &addrs = (addr.find(':') == std::string::npos)? _record.ipv4 : _record.ipv6;
    if (std::find(addrs.begin(), addrs.end(), addr) == addrs.end()) addrs.push_back(addr);
}

bool BonjourAddressCollector::addRData(const uint16_t type, const void *rdata, const size_t size)
{
    const auto addr = bonjourRDataToString(type, rdata, size);
    if (addr.empty()) return false;
    this->addAddress(addr);
    return true;
}

bool BonjourAddressCollector::finishLookup(void)
{
    if (_lookups == 0) return false;
    _lookups--;
    return _lookups == 0;
}

bool BonjourAddressCollector::complete(void) const
{
    return _lookups == 0;
}

const BonjourServiceRecord &BonjourAddressCollector::getRecord(void) const
{
    return _record;
}
