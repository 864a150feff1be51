/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Built-in security group presets
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/SecurityGroupPresets.h>

namespace ovnpolicy {

using std::string;
using std::vector;

static SecurityGroupRule tcpRule(const string& id, uint32_t port,
                                 const string& description) {
    SecurityGroupRule rule;
    rule.id = id;
    rule.direction = RuleDirection::INGRESS;
    rule.protocol = "tcp";
    rule.portMin = port;
    rule.portMax = port;
    rule.action = RuleAction::ALLOW;
    rule.description = description;
    return rule;
}

static SecurityGroupRule prefixRule(const string& id, const string& prefix) {
    SecurityGroupRule rule;
    rule.id = id;
    rule.direction = RuleDirection::INGRESS;
    rule.protocol = "any";
    rule.remoteIpPrefix = prefix;
    rule.action = RuleAction::ALLOW;
    rule.description = "Allow " + prefix;
    return rule;
}

static vector<SecurityGroupPreset> buildPresets() {
    vector<SecurityGroupPreset> presets;

    presets.push_back({"allow-ssh", "Allow SSH access",
                       {tcpRule("allow-ssh-rule", 22, "Allow SSH (TCP 22)")}});
    presets.push_back({"allow-web", "Allow HTTP and HTTPS traffic",
                       {tcpRule("allow-http-rule", 80, "Allow HTTP (TCP 80)"),
                        tcpRule("allow-https-rule", 443,
                                "Allow HTTPS (TCP 443)")}});
    presets.push_back({"allow-rdp", "Allow RDP access",
                       {tcpRule("allow-rdp-rule", 3389,
                                "Allow RDP (TCP 3389)")}});

    SecurityGroupRule icmp;
    icmp.id = "allow-icmp-rule";
    icmp.protocol = "icmp";
    icmp.description = "Allow all ICMP";
    presets.push_back({"allow-icmp", "Allow ICMP (ping)", {icmp}});

    presets.push_back({"allow-database", "Allow common database ports",
                       {tcpRule("allow-mysql-rule", 3306,
                                "Allow MySQL (TCP 3306)"),
                        tcpRule("allow-postgres-rule", 5432,
                                "Allow PostgreSQL (TCP 5432)"),
                        tcpRule("allow-mongodb-rule", 27017,
                                "Allow MongoDB (TCP 27017)"),
                        tcpRule("allow-redis-rule", 6379,
                                "Allow Redis (TCP 6379)")}});
    presets.push_back({"allow-internal", "Allow all internal RFC1918 traffic",
                       {prefixRule("allow-10-rule", "10.0.0.0/8"),
                        prefixRule("allow-172-rule", "172.16.0.0/12"),
                        prefixRule("allow-192-rule", "192.168.0.0/16")}});
    return presets;
}

const vector<SecurityGroupPreset>& getPresets() {
    static const vector<SecurityGroupPreset> presets = buildPresets();
    return presets;
}

boost::optional<const SecurityGroupPreset&> findPreset(const string& name) {
    for (const SecurityGroupPreset& preset : getPresets()) {
        if (preset.name == name)
            return preset;
    }
    return boost::none;
}

} /* namespace ovnpolicy */
