// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourMDNSClient.hpp"
#include "BonjourEventLoop.hpp"
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/*!
 * How the synthetic responder behaves on one interface.
 */
struct FakeResponse
{
    FakeResponse(void):
        notifyCount(1),
        notifyDelayUs(0),
        resolveDelayUs(0),
        found(true)
    {
        return;
    }

    int notifyCount; //! browse notifications to deliver
    long notifyDelayUs; //! delay before the notifications
    long resolveDelayUs; //! delay before the resolve answer
    bool found; //! false reports a resolve failure
    BonjourServiceRecord record;
};

/*!
 * Shared state for every fake client made by one factory.
 * Interfaces without a response never notify.
 */
struct FakeNetwork
{
    FakeNetwork(void):
        clientsCreated(0),
        clientsClosed(0),
        throwOnBrowserCancel(false)
    {
        return;
    }

    std::map<std::string, FakeResponse> responses;
    std::set<std::string> unbindable;
    std::vector<std::string> boundAddrs;
    std::vector<std::string> events;
    int clientsCreated;
    int clientsClosed;
    bool throwOnBrowserCancel;

    BonjourMDNSClient::Factory factory(void);

    size_t countEvents(const std::string &prefix) const
    {
        size_t count(0);
        for (const auto &event : events)
        {
            if (event.compare(0, prefix.size(), prefix) == 0) count++;
        }
        return count;
    }

    //! Position of the first event with the exact text, or -1
    int indexOf(const std::string &event) const
    {
        for (size_t i = 0; i < events.size(); i++)
        {
            if (events[i] == event) return int(i);
        }
        return -1;
    }
};

class FakeServiceBrowser : public BonjourServiceBrowser
{
public:
    FakeServiceBrowser(FakeNetwork &network, const std::string &ifAddr):
        network(network),
        ifAddr(ifAddr),
        cancelled(false)
    {
        return;
    }

    void cancel(void)
    {
        if (cancelled) return;
        cancelled = true;
        timers.clear();
        network.events.push_back("browser-cancel:"+ifAddr);
        if (network.throwOnBrowserCancel) throw std::runtime_error("browser cancel failed");
    }

    FakeNetwork &network;
    const std::string ifAddr;
    bool cancelled;
    std::vector<std::unique_ptr<BonjourTimer>> timers;
};

class FakeServiceResolver : public BonjourServiceResolver
{
public:
    FakeServiceResolver(FakeNetwork &network, const std::string &ifAddr):
        network(network),
        ifAddr(ifAddr)
    {
        return;
    }

    void cancel(void)
    {
        if (not timer or not timer->pending()) return;
        timer.reset();
        network.events.push_back("resolver-cancel:"+ifAddr);
    }

    FakeNetwork &network;
    const std::string ifAddr;
    std::unique_ptr<BonjourTimer> timer;
};

class FakeMDNSClient : public BonjourMDNSClient
{
public:
    FakeMDNSClient(FakeNetwork &network, BonjourEventLoop &loop, const std::string &ifAddr):
        network(network),
        loop(loop),
        ifAddr(ifAddr),
        closed(false)
    {
        network.clientsCreated++;
        network.boundAddrs.push_back(ifAddr);
    }

    bool status(void)
    {
        return network.unbindable.count(ifAddr) == 0;
    }

    std::unique_ptr<BonjourServiceBrowser> browse(const std::string &serviceType, const StateChangeHandler &handler)
    {
        if (closed) network.events.push_back("use-after-close:"+ifAddr);
        network.events.push_back("browse:"+ifAddr+":"+serviceType);
        std::unique_ptr<FakeServiceBrowser> browser(new FakeServiceBrowser(network, ifAddr));

        const auto it = network.responses.find(ifAddr);
        if (it == network.responses.end()) return std::unique_ptr<BonjourServiceBrowser>(browser.release());

        for (int i = 0; i < it->second.notifyCount; i++)
        {
            const auto name = "Device" + std::to_string(i) + "." + serviceType;
            browser->timers.push_back(loop.newTimer(it->second.notifyDelayUs, [this, handler, serviceType, name](void)
            {
                handler(*this, serviceType, name, BONJOUR_SERVICE_ADDED);
            }));
        }
        return std::unique_ptr<BonjourServiceBrowser>(browser.release());
    }

    std::unique_ptr<BonjourServiceResolver> resolve(const std::string &, const std::string &name, const ResolveHandler &handler)
    {
        if (closed) network.events.push_back("use-after-close:"+ifAddr);
        network.events.push_back("resolve:"+ifAddr+":"+name);
        std::unique_ptr<FakeServiceResolver> resolver(new FakeServiceResolver(network, ifAddr));

        const auto response = network.responses.at(ifAddr);
        resolver->timer = loop.newTimer(response.resolveDelayUs, [handler, response](void)
        {
            handler(response.found, response.record);
        });
        return std::unique_ptr<BonjourServiceResolver>(resolver.release());
    }

    void close(void)
    {
        if (closed) return;
        closed = true;
        network.clientsClosed++;
        network.events.push_back("client-close:"+ifAddr);
    }

    FakeNetwork &network;
    BonjourEventLoop &loop;
    const std::string ifAddr;
    bool closed;
};

inline BonjourMDNSClient::Factory FakeNetwork::factory(void)
{
    FakeNetwork *network = this;
    return [network](BonjourEventLoop &loop, const std::string &ifAddr)
    {
        return std::unique_ptr<BonjourMDNSClient>(new FakeMDNSClient(*network, loop, ifAddr));
    };
}

//! Build a record with one IPv4 address and a TXT pair
inline BonjourServiceRecord makeFakeRecord(const std::string &ipv4, const uint16_t port, const std::string &identifier)
{
    BonjourServiceRecord record;
    if (not ipv4.empty()) record.ipv4.push_back(ipv4);
    record.port = port;
    record.properties["identifier"] = identifier;
    return record;
}
