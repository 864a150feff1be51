/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Conversions for domain record enumerations
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/SecurityGroup.h>
#include <ovnpolicy/VirtualNetwork.h>
#include <ovnpolicy/Port.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace ovnpolicy {

using boost::algorithm::to_lower_copy;

static const char* RuleDirectionStrings[] = {"INGRESS", "EGRESS"};

const char* toString(RuleDirection direction) {
    return RuleDirectionStrings[static_cast<uint32_t>(direction)];
}

static const char* RuleActionStrings[] = {"ALLOW", "DROP", "REJECT"};

const char* toString(RuleAction action) {
    return RuleActionStrings[static_cast<uint32_t>(action)];
}

RuleDirection parseRuleDirection(const std::string& str) {
    if (to_lower_copy(str) == "egress")
        return RuleDirection::EGRESS;
    return RuleDirection::INGRESS;
}

RuleAction parseRuleAction(const std::string& str) {
    std::string lower = to_lower_copy(str);
    if (lower == "drop")
        return RuleAction::DROP;
    if (lower == "reject")
        return RuleAction::REJECT;
    return RuleAction::ALLOW;
}

const char* toString(NetworkType type) {
    switch (type) {
    case NetworkType::VLAN:
        return "vlan";
    case NetworkType::EXTERNAL:
        return "external";
    case NetworkType::ISOLATED:
        return "isolated";
    case NetworkType::OVERLAY:
    default:
        return "overlay";
    }
}

NetworkType parseNetworkType(const std::string& str) {
    std::string lower = to_lower_copy(str);
    if (lower == "vlan")
        return NetworkType::VLAN;
    if (lower == "external")
        return NetworkType::EXTERNAL;
    if (lower == "isolated")
        return NetworkType::ISOLATED;
    return NetworkType::OVERLAY;
}

BindingType parseBindingType(const std::string& str) {
    std::string lower = to_lower_copy(str);
    if (lower == "direct")
        return BindingType::DIRECT;
    if (lower == "macvtap")
        return BindingType::MACVTAP;
    if (lower == "vhost_user" || lower == "vhost-user")
        return BindingType::VHOST_USER;
    return BindingType::NORMAL;
}

std::ostream& operator<<(std::ostream& os, const SecurityGroupRule& rule) {
    os << "SecurityGroupRule[id=" << rule.id
       << ",direction=" << toString(rule.direction)
       << ",protocol=" << (rule.protocol.empty() ? "any" : rule.protocol);
    if (rule.portMin > 0)
        os << ",ports=" << rule.portMin << "-" << rule.portMax;
    if (!rule.remoteIpPrefix.empty())
        os << ",remote=" << rule.remoteIpPrefix;
    if (!rule.remoteSecurityGroupId.empty())
        os << ",remoteGroup=" << rule.remoteSecurityGroupId;
    os << ",action=" << toString(rule.action)
       << ",priority=" << rule.priority << "]";
    return os;
}

} /* namespace ovnpolicy */
