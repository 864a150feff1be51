/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NbModel.h
 * @brief Logical network objects stored in the OVN northbound database
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NBMODEL_H
#define OVNPOLICY_NBMODEL_H

#include <boost/optional.hpp>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * String to string map used for external_ids, options and other_config
 */
typedef std::map<std::string, std::string> StringMap;

/**
 * Direction of an ACL relative to the logical port
 */
enum class AclDirection {TO_LPORT, FROM_LPORT};

/**
 * ACL verdicts
 */
enum class AclAction {ALLOW, ALLOW_RELATED, ALLOW_STATELESS, DROP, REJECT};

/**
 * NAT rule kinds
 */
enum class NatType {SNAT, DNAT, DNAT_AND_SNAT};

/** @return "to-lport" or "from-lport" */
const char* toString(AclDirection direction);
/** @return the OVN action keyword, e.g. "allow-related" */
const char* toString(AclAction action);
/** @return "snat", "dnat" or "dnat_and_snat" */
const char* toString(NatType type);

/**
 * Parse an OVN direction keyword
 * @throws std::invalid_argument on an unknown keyword
 */
AclDirection parseAclDirection(const std::string& str);

/**
 * Parse an OVN action keyword
 * @throws std::invalid_argument on an unknown keyword
 */
AclAction parseAclAction(const std::string& str);

/**
 * Parse an OVN NAT type keyword
 * @throws std::invalid_argument on an unknown keyword
 */
NatType parseNatType(const std::string& str);

/**
 * Logical_Switch: an L2 segment
 */
struct LogicalSwitch {
    std::string uuid;
    std::string name;
    std::vector<std::string> ports;
    std::vector<std::string> acls;
    std::vector<std::string> loadBalancers;
    StringMap externalIds;
    StringMap otherConfig;
};

/**
 * Logical_Switch_Port: a VIF, localnet, router peer or other attachment
 */
struct LogicalSwitchPort {
    std::string uuid;
    std::string name;
    /** "", "direct", "dpdkvhostuser", "localnet" or "router" */
    std::string type;
    std::vector<std::string> addresses;
    std::vector<std::string> portSecurity;
    bool enabled = true;
    boost::optional<int> tag;
    StringMap options;
    StringMap externalIds;
};

/**
 * Logical_Router: an L3 router
 */
struct LogicalRouter {
    std::string uuid;
    std::string name;
    bool enabled = true;
    std::vector<std::string> ports;
    std::vector<std::string> nat;
    std::vector<std::string> loadBalancers;
    StringMap options;
    StringMap externalIds;
};

/**
 * Logical_Router_Port: a router interface onto a switch
 */
struct LogicalRouterPort {
    std::string uuid;
    std::string name;
    std::string mac;
    /** CIDR-with-gateway, e.g. "192.168.1.1/24" */
    std::vector<std::string> networks;
    bool enabled = true;
    boost::optional<std::string> peer;
    StringMap externalIds;
};

/**
 * ACL: one firewall rule
 */
struct Acl {
    std::string uuid;
    AclDirection direction = AclDirection::TO_LPORT;
    /** 0 to 32767, higher is evaluated first */
    int priority = 0;
    std::string match;
    AclAction action = AclAction::ALLOW;
    boost::optional<std::string> name;
    StringMap externalIds;
};

/**
 * Address_Set: a named set of addresses usable in match expressions
 */
struct AddressSet {
    std::string uuid;
    std::string name;
    std::vector<std::string> addresses;
    StringMap externalIds;
};

/**
 * Port_Group: the ports a security group applies to and its ACLs
 */
struct PortGroup {
    std::string uuid;
    std::string name;
    std::vector<std::string> ports;
    std::vector<std::string> acls;
    StringMap externalIds;
};

/**
 * DHCP_Options: per-subnet DHCP configuration
 */
struct DhcpOptions {
    std::string uuid;
    std::string cidr;
    StringMap options;
    StringMap externalIds;
};

/**
 * NAT: a translation rule on a logical router
 */
struct Nat {
    std::string uuid;
    NatType type = NatType::SNAT;
    std::string externalIp;
    std::string logicalIp;
    /** UUID of the owning logical router */
    std::string router;
    StringMap externalIds;
};

/**
 * Load_Balancer: VIPs and their backends
 */
struct OvnLoadBalancer {
    std::string uuid;
    std::string name;
    /** "vip:port" to comma separated "backend:port" list */
    StringMap vips;
    std::string protocol;
    StringMap externalIds;
};

/**
 * Print an ACL in "direction priority match action" form
 */
std::ostream& operator<<(std::ostream& os, const Acl& acl);

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_NBMODEL_H */
