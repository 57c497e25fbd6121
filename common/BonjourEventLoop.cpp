// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourEventLoop.hpp"
#include <SoapySDR/Logger.hpp>
#include <avahi-common/simple-watch.h>
#include <avahi-common/timeval.h>
#include <algorithm>
#include <chrono>
#include <climits>

//! Round up to milliseconds, clamped to what avahi accepts
static int timeoutUsToMs(const long long timeoutUs)
{
    if (timeoutUs <= 0) return 0;
    const long long ms = timeoutUs/1000 + ((timeoutUs%1000 != 0)?1:0);
    return int(std::min<long long>(ms, INT_MAX));
}

//! Longest runFor() deadline, keeps the clock arithmetic in range
static const long long MAX_RUN_US = 365LL*24*3600*1000*1000;

/***********************************************************************
 * Timer implementation
 **********************************************************************/
BonjourTimer::BonjourTimer(const AvahiPoll *poll, const Handler &handler):
    _poll(poll),
    _timeout(nullptr),
    _handler(handler),
    _pending(true)
{
    return;
}

BonjourTimer::~BonjourTimer(void)
{
    this->cancel();
    if (_timeout != nullptr) _poll->timeout_free(_timeout);
}

void BonjourTimer::cancel(void)
{
    if (not _pending) return;
    _pending = false;
    if (_timeout != nullptr) _poll->timeout_update(_timeout, nullptr);
}

bool BonjourTimer::pending(void) const
{
    return _pending;
}

void BonjourTimer::timeoutCallback(AvahiTimeout *, void *userdata)
{
    auto self = (BonjourTimer*)userdata;
    if (not self->_pending) return;
    self->_pending = false;

    //the handler may destroy this timer, do not touch self afterwards
    auto handler = self->_handler;
    handler();
}

/***********************************************************************
 * Event loop implementation
 **********************************************************************/
BonjourEventLoop::BonjourEventLoop(void):
    _simplePoll(avahi_simple_poll_new())
{
    if (_simplePoll == nullptr)
    {
        SoapySDR::log(SOAPY_SDR_ERROR, "avahi_simple_poll_new() failed");
    }
}

BonjourEventLoop::~BonjourEventLoop(void)
{
    if (_simplePoll != nullptr) avahi_simple_poll_free(_simplePoll);
}

bool BonjourEventLoop::status(void) const
{
    return _simplePoll != nullptr;
}

const AvahiPoll *BonjourEventLoop::getPoll(void) const
{
    if (_simplePoll == nullptr) return nullptr;
    return avahi_simple_poll_get(_simplePoll);
}

std::unique_ptr<BonjourTimer> BonjourEventLoop::newTimer(const long timeoutUs, const BonjourTimer::Handler &handler)
{
    const auto poll = this->getPoll();
    if (poll == nullptr) return std::unique_ptr<BonjourTimer>();

    std::unique_ptr<BonjourTimer> timer(new BonjourTimer(poll, handler));
    struct timeval tv;
    avahi_elapse_time(&tv, unsigned(timeoutUsToMs(timeoutUs)), 0);
    timer->_timeout = poll->timeout_new(poll, &tv, &BonjourTimer::timeoutCallback, timer.get());
    if (timer->_timeout == nullptr)
    {
        SoapySDR::log(SOAPY_SDR_ERROR, "BonjourEventLoop: timeout_new() failed");
        return std::unique_ptr<BonjourTimer>();
    }
    return timer;
}

void BonjourEventLoop::runFor(const long timeoutUs)
{
    if (_simplePoll == nullptr) return;

    const auto exitTime = std::chrono::steady_clock::now() +
        std::chrono::microseconds(std::min<long long>(timeoutUs, MAX_RUN_US));
    while (true)
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            exitTime - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        const int ret = avahi_simple_poll_iterate(_simplePoll, timeoutUsToMs(remaining));
        if (ret != 0)
        {
            if (ret < 0) SoapySDR::log(SOAPY_SDR_ERROR, "avahi_simple_poll_iterate() failed");
            break;
        }
    }
}
