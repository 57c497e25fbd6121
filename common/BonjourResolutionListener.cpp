// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourResolutionListener.hpp"
#include "BonjourIfAddrs.hpp"
#include <SoapySDR/Logger.hpp>

BonjourResolutionListener::BonjourResolutionListener(BonjourEventLoop &loop, const std::string &ifAddr, const long resolveTimeoutUs):
    _loop(loop),
    _ifAddr(ifAddr),
    _resolveTimeoutUs(resolveTimeoutUs),
    _state(BONJOUR_RESOLUTION_IDLE),
    _port(0)
{
    return;
}

BonjourResolutionListener::~BonjourResolutionListener(void)
{
    this->close();
}

void BonjourResolutionListener::onServiceStateChange(BonjourMDNSClient &client, const std::string &serviceType,
    const std::string &name, const BonjourStateChange change)
{
    BonjourPendingNotification notification;
    notification.client = &client;
    notification.serviceType = serviceType;
    notification.name = name;
    notification.change = change;
    _queue.push_back(notification);

    if (_state != BONJOUR_RESOLUTION_IDLE) return;

    //wake the task on the next loop iteration
    _state = BONJOUR_RESOLUTION_QUEUED;
    _wakeup = _loop.newTimer(0, [this](void){this->queryAddresses();});
    if (not _wakeup) _state = BONJOUR_RESOLUTION_FAILED;
}

void BonjourResolutionListener::queryAddresses(void)
{
    if (_state != BONJOUR_RESOLUTION_QUEUED or _queue.empty()) return;

    const auto notification = _queue.front();
    _queue.pop_front();
    _state = BONJOUR_RESOLUTION_RESOLVING;

    SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourListener resolving %s on %s", notification.name.c_str(), _ifAddr.c_str());
    _resolver = notification.client->resolve(notification.serviceType, notification.name,
        [this](const bool found, const BonjourServiceRecord &record){this->handleResolved(found, record);});
    if (not _resolver)
    {
        _state = BONJOUR_RESOLUTION_FAILED;
        return;
    }

    _deadline = _loop.newTimer(_resolveTimeoutUs, [this](void){this->handleResolveTimeout();});
}

void BonjourResolutionListener::handleResolved(const bool found, const BonjourServiceRecord &record)
{
    if (_state != BONJOUR_RESOLUTION_RESOLVING) return;
    if (_deadline) _deadline->cancel();

    if (not found)
    {
        _state = BONJOUR_RESOLUTION_FAILED;
        return;
    }

    //IPv6 link-local answers are only usable within the bound interface
    std::string zone;
    splitBonjourZone(_ifAddr, zone);

    std::vector<std::string> addresses(record.ipv4);
    if (not zone.empty())
    {
        for (const auto &addr : record.ipv6) addresses.push_back(addr + "%" + zone);
    }

    _addresses = addresses;
    _properties = record.properties;
    _port = record.port;
    _state = BONJOUR_RESOLUTION_RESOLVED;
    SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourListener resolved %d address(es) port %d on %s",
        int(_addresses.size()), int(_port), _ifAddr.c_str());
}

void BonjourResolutionListener::handleResolveTimeout(void)
{
    if (_state != BONJOUR_RESOLUTION_RESOLVING) return;
    SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourListener resolve timed out on %s", _ifAddr.c_str());
    if (_resolver) _resolver->cancel();
    _state = BONJOUR_RESOLUTION_FAILED;
}

void BonjourResolutionListener::close(void)
{
    //stop every part of the task before reporting it finished
    if (_wakeup) _wakeup->cancel();
    if (_deadline) _deadline->cancel();
    if (_resolver) _resolver->cancel();

    if (not this->finished())
    {
        SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourListener cancelled on %s", _ifAddr.c_str());
        _state = BONJOUR_RESOLUTION_CANCELLED;
    }

    _resolver.reset();
    _deadline.reset();
    _wakeup.reset();
}

bool BonjourResolutionListener::finished(void) const
{
    return _state == BONJOUR_RESOLUTION_RESOLVED or
        _state == BONJOUR_RESOLUTION_FAILED or
        _state == BONJOUR_RESOLUTION_CANCELLED;
}

BonjourResolutionState BonjourResolutionListener::getState(void) const
{
    return _state;
}

size_t BonjourResolutionListener::pendingCount(void) const
{
    return _queue.size();
}

const std::vector<std::string> &BonjourResolutionListener::getAddresses(void) const
{
    return _addresses;
}

const BonjourProperties &BonjourResolutionListener::getProperties(void) const
{
    return _properties;
}

uint16_t BonjourResolutionListener::getPort(void) const
{
    return _port;
}
