/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file VirtualNetwork.h
 * @brief Domain record describing a tenant virtual network
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_VIRTUALNETWORK_H
#define OVNPOLICY_VIRTUALNETWORK_H

#include <boost/optional.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * Kind of virtual network
 */
enum class NetworkType {OVERLAY, VLAN, EXTERNAL, ISOLATED};

/**
 * Lower-case name of a network type
 */
const char* toString(NetworkType type);

/**
 * Parse a network type, case-insensitively.  Unknown strings mean overlay.
 */
NetworkType parseNetworkType(const std::string& str);

/**
 * DHCP service settings for a network
 */
struct DhcpConfig {
    /** Whether DHCP options should be created */
    bool enabled = false;
    /** Lease time in seconds, 0 for the default */
    uint32_t leaseTimeSec = 0;
    /** DNS servers handed to guests */
    std::vector<std::string> dnsServers;
    /** NTP servers handed to guests */
    std::vector<std::string> ntpServers;
    /** DNS domain name */
    std::string domainName;
};

/**
 * IPv4 addressing of a network
 */
struct IpConfig {
    /** Subnet CIDR, e.g. "10.0.1.0/24" */
    std::string ipv4Subnet;
    /** Gateway address, e.g. "10.0.1.1" */
    std::string ipv4Gateway;
    /** DHCP settings */
    DhcpConfig dhcp;
};

/**
 * VLAN settings of a VLAN-backed network
 */
struct VlanConfig {
    /** 802.1Q tag */
    uint32_t vlanId = 0;
    /** Name of the physical network the VLAN lives on */
    std::string physicalNetwork;
};

/**
 * Desired state of a network
 */
struct NetworkSpec {
    NetworkType type = NetworkType::OVERLAY;
    boost::optional<VlanConfig> vlan;
    IpConfig ipConfig;
    /** MTU, 0 for the default */
    uint32_t mtu = 0;
};

/**
 * A tenant virtual network
 */
struct VirtualNetwork {
    std::string id;
    std::string projectId;
    std::string name;
    NetworkSpec spec;
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_VIRTUALNETWORK_H */
