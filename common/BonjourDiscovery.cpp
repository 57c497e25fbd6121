// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourDiscovery.hpp"
#include "BonjourDiscoverySession.hpp"
#include "BonjourEventLoop.hpp"
#include <SoapySDR/Logger.hpp>
#include <algorithm>
#include <memory>

BonjourDiscovery::BonjourDiscovery(const BonjourConfig &config):
    _config(config),
    _factory(&BonjourMDNSClient::makeAvahi),
    _enumerator(&listBonjourIfAddrs)
{
    return;
}

BonjourDiscovery::BonjourDiscovery(const BonjourConfig &config, const BonjourMDNSClient::Factory &factory, const Enumerator &enumerator):
    _config(config),
    _factory(factory),
    _enumerator(enumerator)
{
    return;
}

const BonjourConfig &BonjourDiscovery::getConfig(void) const
{
    return _config;
}

std::vector<BonjourAnswer> BonjourDiscovery::browse(const std::string &serviceType, const std::vector<std::string> &ifAddrs, const long timeoutUs)
{
    std::vector<BonjourAnswer> answers;

    BonjourEventLoop loop;
    if (not loop.status())
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "BonjourDiscovery::browse(%s) no event loop", serviceType.c_str());
        return answers;
    }

    //one session per interface, all driven by the same loop
    std::vector<std::unique_ptr<BonjourDiscoverySession>> sessions;
    for (const auto &ifAddr : ifAddrs)
    {
        sessions.emplace_back(new BonjourDiscoverySession(loop, _factory, serviceType, ifAddr, _config.resolveTimeoutUs));
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourDiscovery browsing %s on %d interface(s) for %ld us",
        serviceType.c_str(), int(sessions.size()), timeoutUs);
    loop.runFor(timeoutUs);

    //collect in interface order, not completion order
    for (auto &session : sessions)
    {
        const auto &listener = session->getListener();
        if (not listener.getAddresses().empty())
        {
            const BonjourAnswer answer(listener.getProperties(), listener.getAddresses(), listener.getPort());
            if (std::find(answers.begin(), answers.end(), answer) == answers.end())
            {
                answers.push_back(answer);
            }
        }
        session->close();
    }

    return answers;
}

std::vector<BonjourAnswer> BonjourDiscovery::browse(const std::string &serviceType, const std::vector<std::string> &ifAddrs)
{
    return this->browse(serviceType, ifAddrs, _config.timeoutUs);
}

std::vector<std::string> BonjourDiscovery::listInterfaceAddresses(const int ipVer)
{
    return filterBonjourIfAddrs(_enumerator(), ipVer, _config.zoneStyle);
}
