// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourAnswer.hpp"
#include <cctype>

BonjourAnswer::BonjourAnswer(const BonjourProperties &properties, const std::vector<std::string> &ips, const uint16_t port):
    _properties(properties),
    _ips(ips),
    _port(port)
{
    return;
}

const BonjourProperties &BonjourAnswer::getProperties(void) const
{
    return _properties;
}

const std::vector<std::string> &BonjourAnswer::getIps(void) const
{
    return _ips;
}

uint16_t BonjourAnswer::getPort(void) const
{
    return _port;
}

//TXT values may hold binary data, escape anything unprintable
static std::string escapeBytes(const std::string &bytes)
{
    static const char hex[] = "0123456789abcdef";
    std::string out;
    for (const char ch : bytes)
    {
        const auto byte = (unsigned char)ch;
        if (std::isprint(byte) and byte != '\\') out += ch;
        else
        {
            out += "\\x";
            out += hex[byte >> 4];
            out += hex[byte & 0xf];
        }
    }
    return out;
}

std::string BonjourAnswer::toString(void) const
{
    std::string ips;
    for (const auto &ip : _ips)
    {
        if (not ips.empty()) ips += ", ";
        ips += ip;
    }

    std::string props;
    for (const auto &pair : _properties)
    {
        if (not props.empty()) props += ", ";
        props += escapeBytes(pair.first) + "=" + escapeBytes(pair.second);
    }

    return "port=" + std::to_string(_port) + " ips=[" + ips + "] properties={" + props + "}";
}

bool BonjourAnswer::operator==(const BonjourAnswer &other) const
{
    return _port == other._port and
        _ips == other._ips and
        _properties == other._properties;
}

bool BonjourAnswer::operator!=(const BonjourAnswer &other) const
{
    return not (*this == other);
}
