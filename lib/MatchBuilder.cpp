/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for MatchBuilder class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/MatchBuilder.h>
#include <ovnpolicy/NameMapper.h>
#include <ovnpolicy/Errors.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/asio/ip/address.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ovnpolicy {

using std::string;
using std::vector;

static const uint32_t MAX_PORT = 65535;
static const int32_t MAX_ICMP_FIELD = 255;
static const unsigned long MAX_IP_PROTO = 255;

static bool isIpv6(const string& prefix) {
    return prefix.find(':') != string::npos;
}

static bool isDecimal(const string& str, size_t maxDigits) {
    return !str.empty() && str.size() <= maxDigits &&
        std::all_of(str.begin(), str.end(),
                    [](unsigned char c) { return std::isdigit(c); });
}

static bool isNamedProtocol(const string& proto) {
    return proto == "any" || proto == "tcp" || proto == "udp" ||
        proto == "sctp" || proto == "icmp" || proto == "icmpv6" ||
        proto == "gre" || proto == "esp" || proto == "ah" ||
        proto == "vrrp";
}

// address or address/length, with the length bounded by the family
static bool isValidPrefix(const string& prefix) {
    // scoped IPv6 addresses have no meaning in a match
    if (prefix.find('%') != string::npos)
        return false;
    size_t slash = prefix.find('/');
    boost::system::error_code ec;
    boost::asio::ip::address addr =
        boost::asio::ip::make_address(prefix.substr(0, slash), ec);
    if (ec)
        return false;
    if (slash == string::npos)
        return true;
    const string len = prefix.substr(slash + 1);
    if (!isDecimal(len, 3))
        return false;
    return std::stoul(len) <= (addr.is_v6() ? 128UL : 32UL);
}

static bool isValidGroupId(const string& id) {
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '_';
        });
}

bool MatchBuilder::isAnyPrefix(const string& prefix) {
    return prefix.empty() || prefix == "0.0.0.0/0" || prefix == "::/0";
}

void MatchBuilder::validate(const SecurityGroupRule& rule) {
    std::ostringstream err;
    if (rule.portMin > MAX_PORT) {
        err << "port_min " << rule.portMin << " out of range";
    } else if (rule.portMax > MAX_PORT) {
        err << "port_max " << rule.portMax << " out of range";
    } else if (rule.portMin > 0 && rule.portMax != 0 &&
               rule.portMax < rule.portMin) {
        err << "port_max " << rule.portMax
            << " is below port_min " << rule.portMin;
    } else if (rule.icmpType > MAX_ICMP_FIELD) {
        err << "icmp_type " << rule.icmpType << " out of range";
    } else if (rule.icmpCode > MAX_ICMP_FIELD) {
        err << "icmp_code " << rule.icmpCode << " out of range";
    } else if (rule.icmpType < -1 || rule.icmpCode < -1) {
        err << "negative ICMP type/code other than -1";
    } else {
        const string proto = boost::algorithm::to_lower_copy(rule.protocol);
        if (!proto.empty() && !isNamedProtocol(proto) &&
            !(isDecimal(proto, 3) && std::stoul(proto) <= MAX_IP_PROTO)) {
            err << "unknown protocol \"" << rule.protocol << "\"";
        } else if (!isAnyPrefix(rule.remoteIpPrefix) &&
                   !isValidPrefix(rule.remoteIpPrefix)) {
            err << "invalid remote_ip_prefix \""
                << rule.remoteIpPrefix << "\"";
        } else if (!isValidGroupId(rule.remoteSecurityGroupId)) {
            err << "invalid remote_group_id \""
                << rule.remoteSecurityGroupId << "\"";
        }
    }
    const string msg = err.str();
    if (!msg.empty())
        throw TranslationError(msg);
}

void MatchBuilder::addProtocolClauses(const SecurityGroupRule& rule,
                                      vector<string>& clauses) {
    const string proto = boost::algorithm::to_lower_copy(rule.protocol);

    if (proto == "tcp" || proto == "udp" || proto == "sctp") {
        clauses.push_back(proto);
        if (rule.portMin > 0) {
            // a zero port_max means a single port
            if (rule.portMax == rule.portMin || rule.portMax == 0) {
                clauses.push_back(proto + ".dst == " +
                                  std::to_string(rule.portMin));
            } else {
                clauses.push_back(proto + ".dst >= " +
                                  std::to_string(rule.portMin));
                clauses.push_back(proto + ".dst <= " +
                                  std::to_string(rule.portMax));
            }
        }
    } else if (proto == "icmp" || proto == "icmpv6") {
        const string field = (proto == "icmp") ? "icmp4" : "icmp6";
        clauses.push_back(field);
        if (rule.icmpType >= 0)
            clauses.push_back(field + ".type == " +
                              std::to_string(rule.icmpType));
        if (rule.icmpCode >= 0)
            clauses.push_back(field + ".code == " +
                              std::to_string(rule.icmpCode));
    } else if (proto == "gre") {
        clauses.push_back("ip.proto == 47");
    } else if (proto == "esp") {
        clauses.push_back("ip.proto == 50");
    } else if (proto == "ah") {
        clauses.push_back("ip.proto == 51");
    } else if (proto == "vrrp") {
        clauses.push_back("ip.proto == 112");
    } else if (!proto.empty()) {
        clauses.push_back("ip.proto == " + proto);
    }
}

string MatchBuilder::build(const SecurityGroupRule& rule,
                           const string& portGroup) {
    validate(rule);

    const bool ingress = rule.direction == RuleDirection::INGRESS;
    const bool v6 = isIpv6(rule.remoteIpPrefix);
    vector<string> clauses;

    clauses.push_back((ingress ? "outport == @" : "inport == @") + portGroup);
    clauses.push_back(v6 ? "ip6" : "ip4");

    if (!rule.protocol.empty() &&
        boost::algorithm::to_lower_copy(rule.protocol) != "any") {
        addProtocolClauses(rule, clauses);
    }

    if (!isAnyPrefix(rule.remoteIpPrefix)) {
        string field = v6 ? "ip6" : "ip4";
        field += ingress ? ".src" : ".dst";
        clauses.push_back(field + " == " + rule.remoteIpPrefix);
    }

    if (!rule.remoteSecurityGroupId.empty()) {
        const string remote =
            NameMapper::portGroupName(rule.remoteSecurityGroupId);
        clauses.push_back((ingress ? "inport == @" : "outport == @") + remote);
    }

    return boost::algorithm::join(clauses, " && ");
}

} /* namespace ovnpolicy */
