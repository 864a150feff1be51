/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for DomainReader class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/DomainReader.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/line.hpp>

#include <fstream>
#include <vector>

namespace ovnpolicy {

using boost::optional;
using boost::property_tree::ptree;
using std::string;
using std::vector;

namespace {

class strip_comments : public boost::iostreams::line_filter {
private:
    std::string do_filter(const std::string& line) override {
        // only comments that begin the line
        auto trimmed = line;
        boost::trim(trimmed);
        if (boost::starts_with(trimmed, "#") ||
            boost::starts_with(trimmed, "//")) {
            return std::string();
        }
        return line;
    }
};

} /* anonymous namespace */

static vector<string> readStrings(const ptree& properties,
                                  const string& key) {
    vector<string> result;
    optional<const ptree&> list = properties.get_child_optional(key);
    if (list) {
        for (const ptree::value_type& v : list.get())
            result.push_back(v.second.data());
    }
    return result;
}

SecurityGroupRule DomainReader::readRule(const ptree& properties) {
    static const string RULE_ID("id");
    static const string DIRECTION("direction");
    static const string PROTOCOL("protocol");
    static const string PORT_MIN("port_min");
    static const string PORT_MAX("port_max");
    static const string ICMP_TYPE("icmp_type");
    static const string ICMP_CODE("icmp_code");
    static const string REMOTE_PREFIX("remote_ip_prefix");
    static const string REMOTE_SG("remote_security_group_id");
    static const string ACTION("action");
    static const string PRIORITY("priority");
    static const string DESCRIPTION("description");

    SecurityGroupRule rule;
    rule.id = properties.get<string>(RULE_ID);
    rule.direction =
        parseRuleDirection(properties.get<string>(DIRECTION, "INGRESS"));
    rule.protocol = properties.get<string>(PROTOCOL, "");
    rule.portMin = properties.get<uint32_t>(PORT_MIN, 0);
    rule.portMax = properties.get<uint32_t>(PORT_MAX, rule.portMin);
    rule.icmpType = properties.get<int32_t>(ICMP_TYPE, -1);
    rule.icmpCode = properties.get<int32_t>(ICMP_CODE, -1);
    rule.remoteIpPrefix = properties.get<string>(REMOTE_PREFIX, "");
    rule.remoteSecurityGroupId = properties.get<string>(REMOTE_SG, "");
    rule.action = parseRuleAction(properties.get<string>(ACTION, "ALLOW"));
    rule.priority = properties.get<uint32_t>(PRIORITY, 0);
    rule.description = properties.get<string>(DESCRIPTION, "");
    return rule;
}

SecurityGroup DomainReader::readSecurityGroup(const ptree& properties) {
    static const string SG_ID("id");
    static const string SG_NAME("name");
    static const string SG_STATEFUL("stateful");
    static const string SG_RULES("rules");

    SecurityGroup sg;
    sg.id = properties.get<string>(SG_ID);
    sg.name = properties.get<string>(SG_NAME, "");
    sg.stateful = properties.get<bool>(SG_STATEFUL, true);

    optional<const ptree&> rules = properties.get_child_optional(SG_RULES);
    if (rules) {
        for (const ptree::value_type& v : rules.get())
            sg.rules.push_back(readRule(v.second));
    }
    return sg;
}

VirtualNetwork DomainReader::readNetwork(const ptree& properties) {
    VirtualNetwork network;
    network.id = properties.get<string>("id");
    network.projectId = properties.get<string>("project_id", "");
    network.name = properties.get<string>("name", "");

    optional<const ptree&> spec = properties.get_child_optional("spec");
    if (!spec)
        return network;

    network.spec.type =
        parseNetworkType(spec->get<string>("type", "OVERLAY"));
    network.spec.mtu = spec->get<uint32_t>("mtu", 0);

    optional<const ptree&> vlan = spec->get_child_optional("vlan");
    if (vlan) {
        VlanConfig vc;
        vc.vlanId = vlan->get<uint32_t>("vlan_id", 0);
        vc.physicalNetwork = vlan->get<string>("physical_network", "");
        network.spec.vlan = vc;
    }

    optional<const ptree&> ipConfig = spec->get_child_optional("ip_config");
    if (ipConfig) {
        IpConfig& ip = network.spec.ipConfig;
        ip.ipv4Subnet = ipConfig->get<string>("ipv4_subnet", "");
        ip.ipv4Gateway = ipConfig->get<string>("ipv4_gateway", "");
        optional<const ptree&> dhcp = ipConfig->get_child_optional("dhcp");
        if (dhcp) {
            ip.dhcp.enabled = dhcp->get<bool>("enabled", false);
            ip.dhcp.leaseTimeSec = dhcp->get<uint32_t>("lease_time_sec", 0);
            ip.dhcp.dnsServers = readStrings(dhcp.get(), "dns_servers");
            ip.dhcp.ntpServers = readStrings(dhcp.get(), "ntp_servers");
            ip.dhcp.domainName = dhcp->get<string>("domain_name", "");
        }
    }
    return network;
}

Port DomainReader::readPort(const ptree& properties) {
    Port port;
    port.id = properties.get<string>("id");
    port.networkId = properties.get<string>("network_id");

    optional<const ptree&> spec = properties.get_child_optional("spec");
    if (spec) {
        port.spec.macAddress = spec->get<string>("mac_address", "");
        optional<const ptree&> ips = spec->get_child_optional("fixed_ips");
        if (ips) {
            for (const ptree::value_type& v : ips.get()) {
                FixedIp fip;
                fip.subnetId = v.second.get<string>("subnet_id", "");
                fip.ipAddress = v.second.get<string>("ip_address");
                port.spec.fixedIps.push_back(fip);
            }
        }
        port.spec.securityGroupIds =
            readStrings(spec.get(), "security_group_ids");
        port.spec.portSecurityEnabled =
            spec->get<bool>("port_security_enabled", true);
        optional<const ptree&> binding = spec->get_child_optional("binding");
        if (binding) {
            port.spec.binding.type =
                parseBindingType(binding->get<string>("type", "NORMAL"));
            port.spec.binding.vhostSocket =
                binding->get<string>("vhost_socket", "");
        }
    }

    optional<const ptree&> status = properties.get_child_optional("status");
    if (status) {
        port.status.vmId = status->get<string>("vm_id", "");
        port.status.hostId = status->get<string>("host_id", "");
    }
    return port;
}

LoadBalancer DomainReader::readLoadBalancer(const ptree& properties) {
    LoadBalancer lb;
    lb.id = properties.get<string>("id");
    lb.projectId = properties.get<string>("project_id", "");
    lb.name = properties.get<string>("name", "");

    optional<const ptree&> spec = properties.get_child_optional("spec");
    if (!spec)
        return lb;

    lb.spec.vip = spec->get<string>("vip", "");
    lb.spec.protocol = spec->get<string>("protocol", "");
    optional<const ptree&> listeners = spec->get_child_optional("listeners");
    if (listeners) {
        for (const ptree::value_type& v : listeners.get()) {
            Listener l;
            l.id = v.second.get<string>("id", "");
            l.port = v.second.get<uint32_t>("port");
            lb.spec.listeners.push_back(l);
        }
    }
    optional<const ptree&> members = spec->get_child_optional("members");
    if (members) {
        for (const ptree::value_type& v : members.get()) {
            Member m;
            m.listenerId = v.second.get<string>("listener_id", "");
            m.address = v.second.get<string>("address");
            m.port = v.second.get<uint32_t>("port");
            lb.spec.members.push_back(m);
        }
    }
    return lb;
}

void DomainReader::readJsonFile(const string& path, ptree& properties) {
    std::ifstream file(path, std::ios_base::in | std::ios_base::binary);
    if (!file.is_open())
        throw boost::property_tree::json_parser_error("cannot open file",
                                                      path, 0);
    boost::iostreams::filtering_streambuf<boost::iostreams::input> inbuf;
    inbuf.push(strip_comments());
    inbuf.push(file);
    std::istream instream(&inbuf);
    boost::property_tree::read_json(instream, properties);
}

} /* namespace ovnpolicy */
