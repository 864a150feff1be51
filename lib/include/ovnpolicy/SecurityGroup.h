/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file SecurityGroup.h
 * @brief Domain records describing a security group and its rules
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_SECURITYGROUP_H
#define OVNPOLICY_SECURITYGROUP_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * Direction of traffic a rule inspects, relative to the VM
 */
enum class RuleDirection {INGRESS, EGRESS};

/**
 * What to do with traffic matched by a rule
 */
enum class RuleAction {ALLOW, DROP, REJECT};

/**
 * Convert a direction to its canonical string "INGRESS"/"EGRESS"
 */
const char* toString(RuleDirection direction);

/**
 * Convert an action to its canonical string "ALLOW"/"DROP"/"REJECT"
 */
const char* toString(RuleAction action);

/**
 * Parse a direction, case-insensitively.  Anything other than "egress"
 * is treated as ingress.
 */
RuleDirection parseRuleDirection(const std::string& str);

/**
 * Parse an action, case-insensitively.  Unknown strings mean allow.
 */
RuleAction parseRuleAction(const std::string& str);

/**
 * A single firewall rule of a security group
 */
struct SecurityGroupRule {
    /** Rule identifier */
    std::string id;
    /** Direction of inspected traffic */
    RuleDirection direction = RuleDirection::INGRESS;
    /** "tcp", "udp", "sctp", "icmp", "icmpv6", "gre", "esp", "ah",
        "vrrp", "any", a protocol number or empty */
    std::string protocol;
    /** First destination port, 0 for any */
    uint32_t portMin = 0;
    /** Last destination port */
    uint32_t portMax = 0;
    /** ICMP type, -1 for any */
    int32_t icmpType = -1;
    /** ICMP code, -1 for any */
    int32_t icmpCode = -1;
    /** Remote CIDR, empty or 0.0.0.0/0 / ::/0 for any */
    std::string remoteIpPrefix;
    /** Remote security group whose members the rule matches */
    std::string remoteSecurityGroupId;
    /** Action to take */
    RuleAction action = RuleAction::ALLOW;
    /** Rule priority relative to the other rules of the group */
    uint32_t priority = 0;
    /** Human readable description; used as the ACL name */
    std::string description;
};

/**
 * A named, ordered set of rules applied to ports
 */
struct SecurityGroup {
    /** Security group identifier */
    std::string id;
    /** Display name */
    std::string name;
    /** Whether connection tracking is used */
    bool stateful = true;
    /** Ordered rule set */
    std::vector<SecurityGroupRule> rules;
};

/**
 * Print a rule to an ostream
 */
std::ostream& operator<<(std::ostream& os, const SecurityGroupRule& rule);

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_SECURITYGROUP_H */
