// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourDiscoverySession.hpp"
#include <SoapySDR/Logger.hpp>
#include <exception>

BonjourDiscoverySession::BonjourDiscoverySession(
    BonjourEventLoop &loop,
    const BonjourMDNSClient::Factory &factory,
    const std::string &serviceType,
    const std::string &ifAddr,
    const long resolveTimeoutUs):
    _ifAddr(ifAddr),
    _closed(false),
    _listener(loop, ifAddr, resolveTimeoutUs)
{
    _client = factory(loop, ifAddr);
    if (not _client or not _client->status())
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "BonjourSession: cannot bind client to %s", ifAddr.c_str());
        return;
    }

    auto &listener = _listener;
    _browser = _client->browse(serviceType, [&listener](BonjourMDNSClient &client,
        const std::string &type, const std::string &name, const BonjourStateChange change)
    {
        listener.onServiceStateChange(client, type, name, change);
    });
    if (not _browser)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "BonjourSession: cannot browse %s on %s", serviceType.c_str(), ifAddr.c_str());
    }
}

BonjourDiscoverySession::~BonjourDiscoverySession(void)
{
    this->close();
}

const std::string &BonjourDiscoverySession::getInterfaceAddress(void) const
{
    return _ifAddr;
}

const BonjourResolutionListener &BonjourDiscoverySession::getListener(void) const
{
    return _listener;
}

void BonjourDiscoverySession::close(void)
{
    if (_closed) return;
    _closed = true;

    try
    {
        _listener.close();
    }
    catch (const std::exception &ex)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "BonjourSession::close(%s) listener: %s", _ifAddr.c_str(), ex.what());
    }

    try
    {
        if (_browser) _browser->cancel();
    }
    catch (const std::exception &ex)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "BonjourSession::close(%s) browser: %s", _ifAddr.c_str(), ex.what());
    }

    try
    {
        if (_client) _client->close();
    }
    catch (const std::exception &ex)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "BonjourSession::close(%s) client: %s", _ifAddr.c_str(), ex.what());
    }
}

bool BonjourDiscoverySession::closed(void) const
{
    return _closed;
}
