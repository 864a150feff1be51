/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of northbound row conversion
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "NbRowCodec.h"
#include <ovnpolicy/logging.h>

#include <stdexcept>

namespace ovnpolicy {

static std::map<std::string, std::string>
toMembers(const std::vector<std::string>& members) {
    std::map<std::string, std::string> result;
    for (auto& m : members)
        result[m];
    return result;
}

OvsdbValue stringSet(const std::vector<std::string>& members) {
    return OvsdbValue(Dtype::SET, "", toMembers(members));
}

OvsdbValue uuidSet(const std::vector<std::string>& uuids) {
    return OvsdbValue(Dtype::SET, "uuid", toMembers(uuids));
}

OvsdbValue stringMap(const StringMap& items) {
    return OvsdbValue(Dtype::MAP, "", items);
}

OvsdbValue uuidRef(const std::string& uuid) {
    return OvsdbValue("uuid", uuid);
}

OvsdbValue mapEntry(const std::string& key, const std::string& value) {
    return OvsdbValue(Dtype::MAP, "", {{key, value}});
}

static OvsdbValue optionalString(const boost::optional<std::string>& value) {
    if (value)
        return OvsdbValue(value.get());
    return stringSet({});
}

std::string getString(const OvsdbRowDetails& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end())
        return "";
    if (it->second.getType() == Dtype::SET) {
        auto& members = it->second.getCollectionValue();
        return members.empty() ? "" : members.begin()->first;
    }
    return it->second.getStringValue();
}

boost::optional<std::string>
getOptionalString(const OvsdbRowDetails& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end())
        return boost::none;
    if (it->second.getType() == Dtype::SET) {
        auto& members = it->second.getCollectionValue();
        if (members.empty())
            return boost::none;
        return members.begin()->first;
    }
    return it->second.getStringValue();
}

bool getBool(const OvsdbRowDetails& row, const std::string& column,
             bool def) {
    auto it = row.find(column);
    if (it == row.end())
        return def;
    if (it->second.getType() == Dtype::BOOL)
        return it->second.getBoolValue();
    // optional booleans arrive as a set of at most one
    auto members = OvsdbState::getMembers(it->second);
    if (members.empty())
        return def;
    return members.front() == "true";
}

int getInt(const OvsdbRowDetails& row, const std::string& column, int def) {
    auto it = row.find(column);
    if (it == row.end())
        return def;
    if (it->second.getType() == Dtype::INTEGER)
        return it->second.getIntValue();
    auto members = OvsdbState::getMembers(it->second);
    if (members.empty())
        return def;
    try {
        return std::stoi(members.front());
    } catch (const std::logic_error&) {
        LOG(WARNING) << "Invalid integer in column " << column << ": "
                     << members.front();
        return def;
    }
}

std::vector<std::string> getSet(const OvsdbRowDetails& row,
                                const std::string& column) {
    auto it = row.find(column);
    if (it == row.end())
        return std::vector<std::string>();
    return OvsdbState::getMembers(it->second);
}

StringMap getMap(const OvsdbRowDetails& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end() || it->second.getType() != Dtype::MAP)
        return StringMap();
    return it->second.getCollectionValue();
}

static std::string getUuid(const OvsdbRowDetails& row) {
    return getString(row, UUID_COLUMN);
}

OvsdbRowData toRow(const LogicalSwitch& ls) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(ls.name);
    row["external_ids"] = stringMap(ls.externalIds);
    row["other_config"] = stringMap(ls.otherConfig);
    return row;
}

OvsdbRowData toRow(const LogicalSwitchPort& lsp) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(lsp.name);
    row["type"] = OvsdbValue(lsp.type);
    row["addresses"] = stringSet(lsp.addresses);
    row["port_security"] = stringSet(lsp.portSecurity);
    row["enabled"] = OvsdbValue(lsp.enabled);
    if (lsp.tag)
        row["tag"] = OvsdbValue(lsp.tag.get());
    row["options"] = stringMap(lsp.options);
    row["external_ids"] = stringMap(lsp.externalIds);
    return row;
}

OvsdbRowData toRow(const LogicalRouter& lr) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(lr.name);
    row["enabled"] = OvsdbValue(lr.enabled);
    row["options"] = stringMap(lr.options);
    row["external_ids"] = stringMap(lr.externalIds);
    return row;
}

OvsdbRowData toRow(const LogicalRouterPort& lrp) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(lrp.name);
    row["mac"] = OvsdbValue(lrp.mac);
    row["networks"] = stringSet(lrp.networks);
    row["enabled"] = OvsdbValue(lrp.enabled);
    row["peer"] = optionalString(lrp.peer);
    row["external_ids"] = stringMap(lrp.externalIds);
    return row;
}

OvsdbRowData toRow(const Acl& acl) {
    OvsdbRowData row;
    row["direction"] = OvsdbValue(std::string(toString(acl.direction)));
    row["priority"] = OvsdbValue(acl.priority);
    row["match"] = OvsdbValue(acl.match);
    row["action"] = OvsdbValue(std::string(toString(acl.action)));
    row["name"] = optionalString(acl.name);
    row["external_ids"] = stringMap(acl.externalIds);
    return row;
}

OvsdbRowData toRow(const AddressSet& as) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(as.name);
    row["addresses"] = stringSet(as.addresses);
    row["external_ids"] = stringMap(as.externalIds);
    return row;
}

OvsdbRowData toRow(const PortGroup& pg) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(pg.name);
    row["ports"] = uuidSet(pg.ports);
    row["acls"] = uuidSet(pg.acls);
    row["external_ids"] = stringMap(pg.externalIds);
    return row;
}

OvsdbRowData toRow(const DhcpOptions& dhcp) {
    OvsdbRowData row;
    row["cidr"] = OvsdbValue(dhcp.cidr);
    row["options"] = stringMap(dhcp.options);
    row["external_ids"] = stringMap(dhcp.externalIds);
    return row;
}

OvsdbRowData toRow(const Nat& nat) {
    OvsdbRowData row;
    row["type"] = OvsdbValue(std::string(toString(nat.type)));
    row["external_ip"] = OvsdbValue(nat.externalIp);
    row["logical_ip"] = OvsdbValue(nat.logicalIp);
    row["external_ids"] = stringMap(nat.externalIds);
    return row;
}

OvsdbRowData toRow(const OvnLoadBalancer& lb) {
    OvsdbRowData row;
    row["name"] = OvsdbValue(lb.name);
    row["vips"] = stringMap(lb.vips);
    row["protocol"] = lb.protocol.empty()
        ? stringSet({}) : OvsdbValue(lb.protocol);
    row["external_ids"] = stringMap(lb.externalIds);
    return row;
}

void fromRow(const OvsdbRowDetails& row, LogicalSwitch& ls) {
    ls.uuid = getUuid(row);
    ls.name = getString(row, "name");
    ls.ports = getSet(row, "ports");
    ls.acls = getSet(row, "acls");
    ls.loadBalancers = getSet(row, "load_balancer");
    ls.externalIds = getMap(row, "external_ids");
    ls.otherConfig = getMap(row, "other_config");
}

void fromRow(const OvsdbRowDetails& row, LogicalSwitchPort& lsp) {
    lsp.uuid = getUuid(row);
    lsp.name = getString(row, "name");
    lsp.type = getString(row, "type");
    lsp.addresses = getSet(row, "addresses");
    lsp.portSecurity = getSet(row, "port_security");
    lsp.enabled = getBool(row, "enabled", true);
    auto tag = getSet(row, "tag");
    if (!tag.empty())
        lsp.tag = getInt(row, "tag", 0);
    else
        lsp.tag = boost::none;
    lsp.options = getMap(row, "options");
    lsp.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, LogicalRouter& lr) {
    lr.uuid = getUuid(row);
    lr.name = getString(row, "name");
    lr.enabled = getBool(row, "enabled", true);
    lr.ports = getSet(row, "ports");
    lr.nat = getSet(row, "nat");
    lr.loadBalancers = getSet(row, "load_balancer");
    lr.options = getMap(row, "options");
    lr.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, LogicalRouterPort& lrp) {
    lrp.uuid = getUuid(row);
    lrp.name = getString(row, "name");
    lrp.mac = getString(row, "mac");
    lrp.networks = getSet(row, "networks");
    lrp.enabled = getBool(row, "enabled", true);
    lrp.peer = getOptionalString(row, "peer");
    lrp.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, Acl& acl) {
    acl.uuid = getUuid(row);
    acl.direction = parseAclDirection(getString(row, "direction"));
    acl.priority = getInt(row, "priority", 0);
    acl.match = getString(row, "match");
    acl.action = parseAclAction(getString(row, "action"));
    acl.name = getOptionalString(row, "name");
    acl.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, AddressSet& as) {
    as.uuid = getUuid(row);
    as.name = getString(row, "name");
    as.addresses = getSet(row, "addresses");
    as.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, PortGroup& pg) {
    pg.uuid = getUuid(row);
    pg.name = getString(row, "name");
    pg.ports = getSet(row, "ports");
    pg.acls = getSet(row, "acls");
    pg.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, DhcpOptions& dhcp) {
    dhcp.uuid = getUuid(row);
    dhcp.cidr = getString(row, "cidr");
    dhcp.options = getMap(row, "options");
    dhcp.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, Nat& nat) {
    nat.uuid = getUuid(row);
    nat.type = parseNatType(getString(row, "type"));
    nat.externalIp = getString(row, "external_ip");
    nat.logicalIp = getString(row, "logical_ip");
    nat.externalIds = getMap(row, "external_ids");
}

void fromRow(const OvsdbRowDetails& row, OvnLoadBalancer& lb) {
    lb.uuid = getUuid(row);
    lb.name = getString(row, "name");
    lb.vips = getMap(row, "vips");
    lb.protocol = getString(row, "protocol");
    lb.externalIds = getMap(row, "external_ids");
}

} /* namespace ovnpolicy */
