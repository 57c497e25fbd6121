// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"

/***********************************************************************
 * Well known service types
 **********************************************************************/
//! Remote service daemon, advertised on the IPv6 link-local tunnel
#define BONJOUR_SCAN_REMOTED_SERVICE "_remoted._tcp.local."

//! Legacy wireless pairing of mobile devices
#define BONJOUR_SCAN_MOBDEV2_SERVICE "_apple-mobdev2._tcp.local."

//! Manual pairing for the remote pairing protocol
#define BONJOUR_SCAN_REMOTEPAIRING_SERVICE "_remotepairing-manual-pairing._tcp.local."

/***********************************************************************
 * Timing defaults
 **********************************************************************/
/*!
 * Default time to wait on all interfaces before collecting answers.
 * Windows takes longer to report the resolved addresses.
 */
#ifdef _WIN32
#define BONJOUR_SCAN_DEFAULT_TIMEOUT_US (2*1000*1000) //2 s
#else
#define BONJOUR_SCAN_DEFAULT_TIMEOUT_US (1*1000*1000) //1 s
#endif

//! Upper bound on a single full-record resolve request
#define BONJOUR_SCAN_RESOLVE_TIMEOUT_US (3000*1000) //3000 ms

/***********************************************************************
 * Interface scoping
 **********************************************************************/
//! Constants for specifying IP versions
#define BONJOUR_SCAN_IPVER_UNSPEC  -1
#define BONJOUR_SCAN_IPVER_INET     4
#define BONJOUR_SCAN_IPVER_INET6    6

//! Render the IPv6 zone as the interface name: fe80::1%en0
#define BONJOUR_SCAN_ZONE_NAME      0

//! Render the IPv6 zone as the interface index: fe80::1%4
#define BONJOUR_SCAN_ZONE_INDEX     1

#ifdef _WIN32
#define BONJOUR_SCAN_DEFAULT_ZONE_STYLE BONJOUR_SCAN_ZONE_INDEX
#else
#define BONJOUR_SCAN_DEFAULT_ZONE_STYLE BONJOUR_SCAN_ZONE_NAME
#endif

//! Interface index meaning "not bound to any interface"
#define BONJOUR_SCAN_IF_UNSPEC     -1

/***********************************************************************
 * Key-words for configuration markup
 **********************************************************************/
//! Time to wait for answers in microseconds
#define BONJOUR_SCAN_KWARG_TIMEOUT "timeout"

//! Resolve request bound in microseconds
#define BONJOUR_SCAN_KWARG_RESOLVE_TIMEOUT "resolveTimeout"

//! Zone rendering style: "name" or "index"
#define BONJOUR_SCAN_KWARG_ZONE "zone"
