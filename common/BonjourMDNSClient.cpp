// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourMDNSClient.hpp"

BonjourServiceRecord::BonjourServiceRecord(void):
    port(0)
{
    return;
}

BonjourServiceBrowser::~BonjourServiceBrowser(void)
{
    return;
}

BonjourServiceResolver::~BonjourServiceResolver(void)
{
    return;
}

BonjourMDNSClient::~BonjourMDNSClient(void)
{
    return;
}
