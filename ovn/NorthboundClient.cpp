/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NorthboundClient class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "NorthboundClient.h"
#include "CachingNorthboundStore.h"
#include "MemoryNorthboundStore.h"
#include "NbRowCodec.h"
#include "OvsdbNorthboundStore.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/NameMapper.h>
#include <ovnpolicy/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace ovnpolicy {

using std::string;
using std::vector;
using std::list;

namespace {

OvsdbConditions byName(const string& name) {
    return {OvsdbCondition("name", OvsdbFunction::EQ, OvsdbValue(name))};
}

OvsdbConditions byUuid(const string& uuid) {
    return {OvsdbCondition(UUID_COLUMN, OvsdbFunction::EQ, uuidRef(uuid))};
}

OvsdbConditions byExternalId(const string& key, const string& value) {
    return {OvsdbCondition("external_ids", OvsdbFunction::INCLUDES,
                           mapEntry(key, value))};
}

OvsdbConditions referencing(const string& column, const string& uuid) {
    return {OvsdbCondition(column, OvsdbFunction::INCLUDES,
                           uuidSet({uuid}))};
}

OvsdbTransactMessage insertOp(OvsdbTable table, const string& uuid,
                              const OvsdbRowData& row) {
    OvsdbTransactMessage msg(OvsdbOperation::INSERT, table);
    msg.externalKey = std::make_pair("uuid", uuid);
    msg.rowData = row;
    return msg;
}

OvsdbTransactMessage updateOp(OvsdbTable table,
                              const OvsdbConditions& conditions,
                              const OvsdbRowData& row) {
    OvsdbTransactMessage msg(OvsdbOperation::UPDATE, table);
    msg.conditions = conditions;
    msg.rowData = row;
    return msg;
}

OvsdbTransactMessage mutateOp(OvsdbTable table,
                              const OvsdbConditions& conditions,
                              const string& column, OvsdbOperation mutator,
                              const OvsdbValue& value) {
    OvsdbTransactMessage msg(OvsdbOperation::MUTATE, table);
    msg.conditions = conditions;
    msg.mutateRowData[column] = std::make_pair(mutator, value);
    return msg;
}

OvsdbTransactMessage deleteOp(OvsdbTable table,
                              const OvsdbConditions& conditions) {
    OvsdbTransactMessage msg(OvsdbOperation::DELETE, table);
    msg.conditions = conditions;
    return msg;
}

const uint32_t DEFAULT_LEASE_TIME = 86400;

} /* anonymous namespace */

NorthboundClient::NorthboundClient(const NorthboundConfig& config_,
                                   std::shared_ptr<IdGenerator> idGenerator_)
    : config(config_), idGenerator(std::move(idGenerator_)),
      translator(idGenerator), mockMode(false) {
    std::unique_ptr<NorthboundStore> backend;
    try {
        backend.reset(new OvsdbNorthboundStore(config));
    } catch (const ConnectionError& e) {
        if (!config.getUseMockOnFailure()) {
            LOG(ERROR) << "Could not connect to northbound database: "
                       << e.what();
            throw;
        }
        LOG(WARNING) << "Could not connect to northbound database at \""
                     << config.getAddress() << "\": " << e.what()
                     << "; falling back to the in-memory store";
        backend.reset(new MemoryNorthboundStore(idGenerator));
        mockMode = true;
    }
    init(std::move(backend));
}

NorthboundClient::NorthboundClient(std::unique_ptr<NorthboundStore> backend,
                                   const NorthboundConfig& config_,
                                   std::shared_ptr<IdGenerator> idGenerator_)
    : config(config_), idGenerator(std::move(idGenerator_)),
      translator(idGenerator), mockMode(false) {
    if (!backend)
        throw std::invalid_argument("Northbound store must not be null");
    mockMode =
        dynamic_cast<MemoryNorthboundStore*>(backend.get()) != nullptr;
    init(std::move(backend));
}

NorthboundClient::~NorthboundClient() {
}

void NorthboundClient::init(std::unique_ptr<NorthboundStore> backend) {
    if (config.isCacheEnabled()) {
        LOG(DEBUG) << "Caching northbound reads for "
                   << config.getCacheTtl().count() << "ms";
        store.reset(new CachingNorthboundStore(std::move(backend),
                                               config.getCacheTtl()));
    } else {
        store = std::move(backend);
    }
}

bool NorthboundClient::isConnected() const {
    return store->isConnected();
}

void NorthboundClient::close() {
    LOG(INFO) << "Closing northbound client";
    store->close();
}

template <typename T>
boost::optional<T> NorthboundClient::findOne(OvsdbTable table,
                                             const OvsdbConditions& conditions) {
    OvsdbTableDetails rows;
    store->select(table, conditions, rows);
    if (rows.empty())
        return boost::none;
    if (rows.size() > 1) {
        LOG(WARNING) << "Found " << rows.size() << " "
                     << OvsdbMessage::toString(table)
                     << " rows where one was expected";
    }
    T result;
    fromRow(rows.begin()->second, result);
    return result;
}

template <typename T>
vector<T> NorthboundClient::findAll(OvsdbTable table,
                                    const OvsdbConditions& conditions) {
    OvsdbTableDetails rows;
    store->select(table, conditions, rows);
    vector<T> result;
    for (auto& row : rows) {
        T item;
        fromRow(row.second, item);
        result.push_back(std::move(item));
    }
    return result;
}

/*
 * Logical switches
 */

LogicalSwitch NorthboundClient::createLogicalSwitch(const VirtualNetwork& network) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::switchName(network.id);
    LOG(INFO) << "Creating logical switch " << name << " for network "
              << network.id << " of type " << toString(network.spec.type);

    auto existing = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                           byName(name));
    if (existing) {
        LOG(INFO) << "Logical switch " << name << " already exists";
        return existing.get();
    }

    LogicalSwitch ls;
    ls.uuid = idGenerator->generateUuid();
    ls.name = name;
    ls.externalIds[extid::NETWORK_ID] = network.id;
    ls.externalIds[extid::PROJECT_ID] = network.projectId;
    ls.externalIds[extid::NAME] = network.name;
    switch (network.spec.type) {
    case NetworkType::VLAN:
        if (network.spec.vlan)
            ls.otherConfig["vlan"] =
                std::to_string(network.spec.vlan.get().vlanId);
        break;
    case NetworkType::OVERLAY:
        ls.otherConfig["subnet"] = network.spec.ipConfig.ipv4Subnet;
        break;
    default:
        break;
    }
    if (network.spec.mtu > 0)
        ls.otherConfig["mtu"] = std::to_string(network.spec.mtu);

    store->transact({insertOp(OvsdbTable::LOGICAL_SWITCH, ls.uuid,
                              toRow(ls))});

    if (network.spec.ipConfig.dhcp.enabled) {
        try {
            createNetworkDhcpOptions(name, network);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to create DHCP options for " << name
                         << ": " << e.what();
        }
    }

    LOG(INFO) << "Logical switch " << name << " created with uuid "
              << ls.uuid;
    return ls;
}

LogicalSwitch NorthboundClient::getLogicalSwitch(const string& networkId) {
    const string name = NameMapper::switchName(networkId);
    auto ls = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                     byName(name));
    if (!ls)
        throw NotFoundError("logical switch", name);
    return ls.get();
}

void NorthboundClient::deleteLogicalSwitch(const string& networkId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::switchName(networkId);
    LOG(INFO) << "Deleting logical switch " << name << " of network "
              << networkId;

    // ports of the switch go with it
    store->transact({deleteOp(OvsdbTable::LOGICAL_SWITCH, byName(name)),
                     deleteOp(OvsdbTable::DHCP_OPTIONS,
                              byExternalId(extid::SWITCH, name))});
}

/*
 * DHCP
 */

DhcpOptions
NorthboundClient::createNetworkDhcpOptions(const string& switchName,
                                           const VirtualNetwork& network) {
    const IpConfig& ipConfig = network.spec.ipConfig;
    if (ipConfig.ipv4Subnet.empty())
        throw std::invalid_argument("IPv4 subnet is required for DHCP");
    const DhcpConfig& dhcp = ipConfig.dhcp;

    LOG(INFO) << "Creating DHCP options for " << switchName << " cidr "
              << ipConfig.ipv4Subnet;

    DhcpOptions opts;
    opts.uuid = idGenerator->generateUuid();
    opts.cidr = ipConfig.ipv4Subnet;
    opts.options["server_id"] = ipConfig.ipv4Gateway;
    opts.options["server_mac"] = idGenerator->generateMac();
    opts.options["router"] = ipConfig.ipv4Gateway;
    opts.options["lease_time"] = std::to_string(dhcp.leaseTimeSec > 0
                                                ? dhcp.leaseTimeSec
                                                : DEFAULT_LEASE_TIME);
    if (!dhcp.dnsServers.empty())
        opts.options["dns_server"] = boost::algorithm::join(dhcp.dnsServers, ",");
    if (!dhcp.domainName.empty())
        opts.options["domain_name"] = "\"" + dhcp.domainName + "\"";
    if (!dhcp.ntpServers.empty())
        opts.options["ntp_server"] = boost::algorithm::join(dhcp.ntpServers, ",");
    opts.externalIds[extid::NETWORK_ID] = network.id;
    opts.externalIds[extid::SWITCH] = switchName;

    store->transact({insertOp(OvsdbTable::DHCP_OPTIONS, opts.uuid,
                              toRow(opts))});
    return opts;
}

DhcpOptions NorthboundClient::createDhcpOptions(const DhcpOptionsConfig& cfg) {
    std::unique_lock<std::mutex> guard(writeMutex);
    LOG(INFO) << "Creating DHCP options for cidr " << cfg.cidr
              << " router " << cfg.router;

    DhcpOptions opts;
    opts.uuid = idGenerator->generateUuid();
    opts.cidr = cfg.cidr;
    opts.options["server_id"] = cfg.serverId;
    opts.options["server_mac"] = cfg.serverMac.empty()
        ? idGenerator->generateMac() : cfg.serverMac;
    opts.options["router"] = cfg.router;
    opts.options["lease_time"] =
        std::to_string(cfg.leaseTime > 0 ? cfg.leaseTime : DEFAULT_LEASE_TIME);
    if (!cfg.dnsServers.empty())
        opts.options["dns_server"] =
            "{" + boost::algorithm::join(cfg.dnsServers, ", ") + "}";
    if (cfg.mtu > 0)
        opts.options["mtu"] = std::to_string(cfg.mtu);
    if (!cfg.domainName.empty())
        opts.options["domain_name"] = "\"" + cfg.domainName + "\"";

    store->transact({insertOp(OvsdbTable::DHCP_OPTIONS, opts.uuid,
                              toRow(opts))});
    return opts;
}

vector<DhcpOptions> NorthboundClient::listDhcpOptions(const string& switchName) {
    OvsdbConditions conditions;
    if (!switchName.empty())
        conditions = byExternalId(extid::SWITCH, switchName);
    return findAll<DhcpOptions>(OvsdbTable::DHCP_OPTIONS, conditions);
}

/*
 * Logical switch ports
 */

string NorthboundClient::portName(const string& portId) {
    return NameMapper::switchPortName(portId);
}

void NorthboundClient::insertSwitchPort(const LogicalSwitch& ls,
                                        const LogicalSwitchPort& lsp) {
    store->transact({insertOp(OvsdbTable::LOGICAL_SWITCH_PORT, lsp.uuid,
                              toRow(lsp)),
                     mutateOp(OvsdbTable::LOGICAL_SWITCH, byUuid(ls.uuid),
                              "ports", OvsdbOperation::INSERT,
                              uuidSet({lsp.uuid}))});
}

LogicalSwitchPort NorthboundClient::createLogicalSwitchPort(const Port& port) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string switchName = NameMapper::switchName(port.networkId);
    const string name = NameMapper::switchPortName(port.id);
    LOG(INFO) << "Creating logical switch port " << name << " on "
              << switchName;

    auto ls = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                     byName(switchName));
    if (!ls)
        throw NotFoundError("logical switch", switchName);
    auto existing = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                               byName(name));
    if (existing) {
        LOG(INFO) << "Logical switch port " << name << " already exists";
        return existing.get();
    }

    // "MAC IP1 IP2 ..."
    vector<string> parts{port.spec.macAddress};
    for (auto& fixedIp : port.spec.fixedIps)
        parts.push_back(fixedIp.ipAddress);
    const string address = boost::algorithm::join(parts, " ");

    LogicalSwitchPort lsp;
    lsp.uuid = idGenerator->generateUuid();
    lsp.name = name;
    lsp.addresses.push_back(address);
    lsp.enabled = true;
    lsp.externalIds[extid::PORT_ID] = port.id;
    lsp.externalIds[extid::VM_ID] = port.status.vmId;
    if (!port.spec.securityGroupIds.empty() && port.spec.portSecurityEnabled)
        lsp.portSecurity.push_back(address);

    switch (port.spec.binding.type) {
    case BindingType::DIRECT:
        lsp.type = "direct";
        lsp.options["requested-chassis"] = port.status.hostId;
        break;
    case BindingType::VHOST_USER:
        lsp.type = "dpdkvhostuser";
        if (!port.spec.binding.vhostSocket.empty())
            lsp.options["vhost-sock"] = port.spec.binding.vhostSocket;
        break;
    default:
        break;
    }

    insertSwitchPort(ls.get(), lsp);
    LOG(INFO) << "Logical switch port " << name << " created with uuid "
              << lsp.uuid << " addresses \"" << address << "\"";
    return lsp;
}

LogicalSwitchPort NorthboundClient::getLogicalSwitchPort(const string& portId) {
    const string name = NameMapper::switchPortName(portId);
    auto lsp = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                          byName(name));
    if (!lsp)
        throw NotFoundError("logical switch port", name);
    return lsp.get();
}

void NorthboundClient::deleteLogicalSwitchPort(const string& portId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::switchPortName(portId);
    LOG(INFO) << "Deleting logical switch port " << name;

    auto lsp = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                          byName(name));
    if (!lsp) {
        LOG(DEBUG) << "Logical switch port " << name << " does not exist";
        return;
    }
    // port groups only hold weak references
    store->transact({mutateOp(OvsdbTable::LOGICAL_SWITCH,
                              referencing("ports", lsp->uuid), "ports",
                              OvsdbOperation::DELETE, uuidSet({lsp->uuid})),
                     deleteOp(OvsdbTable::LOGICAL_SWITCH_PORT,
                              byUuid(lsp->uuid))});
}

void NorthboundClient::bindPort(const string& portId, const string& vmId,
                                const string& hostId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::switchPortName(portId);
    LOG(INFO) << "Binding port " << name << " to vm " << vmId
              << " on host " << hostId;

    auto lsp = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                          byName(name));
    if (!lsp)
        throw NotFoundError("logical switch port", name);

    StringMap externalIds = lsp->externalIds;
    StringMap options = lsp->options;
    externalIds[extid::VM_ID] = vmId;
    options["requested-chassis"] = hostId;
    OvsdbRowData row;
    row["external_ids"] = stringMap(externalIds);
    row["options"] = stringMap(options);
    store->transact({updateOp(OvsdbTable::LOGICAL_SWITCH_PORT,
                              byUuid(lsp->uuid), row)});
}

LogicalSwitchPort
NorthboundClient::createLocalnetPort(const string& networkId, uint32_t vlanId,
                                     const string& physicalNetwork) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string switchName = NameMapper::switchName(networkId);
    const string name = NameMapper::localnetPortName(networkId);
    LOG(INFO) << "Creating localnet port " << name << " vlan " << vlanId
              << " physical network " << physicalNetwork;

    auto ls = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                     byName(switchName));
    if (!ls)
        throw NotFoundError("logical switch", switchName);
    auto existing = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                               byName(name));
    if (existing)
        return existing.get();

    LogicalSwitchPort lsp;
    lsp.uuid = idGenerator->generateUuid();
    lsp.name = name;
    lsp.type = "localnet";
    lsp.addresses.push_back("unknown");
    lsp.enabled = true;
    lsp.options["network_name"] = physicalNetwork;
    lsp.externalIds[extid::NETWORK_ID] = networkId;
    if (vlanId > 0)
        lsp.tag = static_cast<int>(vlanId);

    insertSwitchPort(ls.get(), lsp);
    return lsp;
}

/*
 * Logical routers
 */

LogicalRouter NorthboundClient::createLogicalRouter(const string& routerId,
                                                    const string& projectId,
                                                    bool distributed) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::routerName(routerId);
    LOG(INFO) << "Creating logical router " << name
              << (distributed ? " (distributed)" : "");

    auto existing = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                           byName(name));
    if (existing) {
        LOG(INFO) << "Logical router " << name << " already exists";
        return existing.get();
    }

    LogicalRouter lr;
    lr.uuid = idGenerator->generateUuid();
    lr.name = name;
    lr.enabled = true;
    lr.externalIds[extid::ROUTER_ID] = routerId;
    lr.externalIds[extid::PROJECT_ID] = projectId;
    // no chassis binds the router to every chassis
    if (distributed)
        lr.options["chassis"] = "";

    store->transact({insertOp(OvsdbTable::LOGICAL_ROUTER, lr.uuid,
                              toRow(lr))});
    return lr;
}

LogicalRouter NorthboundClient::getLogicalRouter(const string& routerId) {
    const string name = NameMapper::routerName(routerId);
    auto lr = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                     byName(name));
    if (!lr)
        throw NotFoundError("logical router", name);
    return lr.get();
}

void NorthboundClient::deleteLogicalRouter(const string& routerId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::routerName(routerId);
    LOG(INFO) << "Deleting logical router " << name;

    auto lr = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                     byName(name));
    if (!lr) {
        LOG(DEBUG) << "Logical router " << name << " does not exist";
        return;
    }

    list<OvsdbTransactMessage> ops;
    // switch-side peers name the router port in their options
    for (auto& lrpUuid : lr->ports) {
        auto lrp = findOne<LogicalRouterPort>(OvsdbTable::LOGICAL_ROUTER_PORT,
                                              byUuid(lrpUuid));
        if (!lrp) continue;
        OvsdbConditions peerCond{
            OvsdbCondition("options", OvsdbFunction::INCLUDES,
                           mapEntry("router-port", lrp->name))};
        for (auto& peer : findAll<LogicalSwitchPort>(
                 OvsdbTable::LOGICAL_SWITCH_PORT, peerCond)) {
            ops.push_back(mutateOp(OvsdbTable::LOGICAL_SWITCH,
                                   referencing("ports", peer.uuid), "ports",
                                   OvsdbOperation::DELETE,
                                   uuidSet({peer.uuid})));
        }
    }
    // router ports and NAT rules are owned by the router
    ops.push_back(deleteOp(OvsdbTable::LOGICAL_ROUTER, byUuid(lr->uuid)));
    store->transact(ops);
}

LogicalRouterPort
NorthboundClient::addRouterInterface(const string& routerId,
                                     const string& networkId,
                                     const string& gatewayCidr) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string routerName = NameMapper::routerName(routerId);
    const string switchName = NameMapper::switchName(networkId);
    const string lrpName = NameMapper::routerPortName(routerId, networkId);
    LOG(INFO) << "Adding router interface " << lrpName << " gateway "
              << gatewayCidr;

    auto lr = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                     byName(routerName));
    if (!lr)
        throw NotFoundError("logical router", routerName);
    auto ls = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                     byName(switchName));
    if (!ls)
        throw NotFoundError("logical switch", switchName);
    auto existing = findOne<LogicalRouterPort>(OvsdbTable::LOGICAL_ROUTER_PORT,
                                               byName(lrpName));
    if (existing) {
        LOG(INFO) << "Router interface " << lrpName << " already exists";
        return existing.get();
    }

    LogicalRouterPort lrp;
    lrp.uuid = idGenerator->generateUuid();
    lrp.name = lrpName;
    lrp.mac = idGenerator->generateMac();
    lrp.networks.push_back(gatewayCidr);
    lrp.enabled = true;
    lrp.externalIds[extid::NETWORK_ID] = networkId;

    LogicalSwitchPort peer;
    peer.uuid = idGenerator->generateUuid();
    peer.name = NameMapper::routerPeerPortName(routerId, networkId);
    peer.type = "router";
    peer.addresses.push_back("router");
    peer.options["router-port"] = lrpName;

    store->transact({insertOp(OvsdbTable::LOGICAL_ROUTER_PORT, lrp.uuid,
                              toRow(lrp)),
                     mutateOp(OvsdbTable::LOGICAL_ROUTER, byUuid(lr->uuid),
                              "ports", OvsdbOperation::INSERT,
                              uuidSet({lrp.uuid})),
                     insertOp(OvsdbTable::LOGICAL_SWITCH_PORT, peer.uuid,
                              toRow(peer)),
                     mutateOp(OvsdbTable::LOGICAL_SWITCH, byUuid(ls->uuid),
                              "ports", OvsdbOperation::INSERT,
                              uuidSet({peer.uuid}))});
    return lrp;
}

LogicalRouterPort
NorthboundClient::getLogicalRouterPort(const string& routerId,
                                       const string& networkId) {
    const string name = NameMapper::routerPortName(routerId, networkId);
    auto lrp = findOne<LogicalRouterPort>(OvsdbTable::LOGICAL_ROUTER_PORT,
                                          byName(name));
    if (!lrp)
        throw NotFoundError("logical router port", name);
    return lrp.get();
}

/*
 * NAT
 */

Nat NorthboundClient::createNat(const string& routerId, NatType type,
                                const string& externalIp,
                                const string& logicalIp,
                                const StringMap& externalIds) {
    const string routerName = NameMapper::routerName(routerId);
    auto lr = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                     byName(routerName));
    if (!lr)
        throw NotFoundError("logical router", routerName);

    Nat nat;
    nat.uuid = idGenerator->generateUuid();
    nat.type = type;
    nat.externalIp = externalIp;
    nat.logicalIp = logicalIp;
    nat.router = lr->uuid;
    nat.externalIds = externalIds;

    store->transact({insertOp(OvsdbTable::NAT, nat.uuid, toRow(nat)),
                     mutateOp(OvsdbTable::LOGICAL_ROUTER, byUuid(lr->uuid),
                              "nat", OvsdbOperation::INSERT,
                              uuidSet({nat.uuid}))});
    return nat;
}

Nat NorthboundClient::createFloatingIpNat(const string& routerId,
                                          const string& floatingIp,
                                          const string& internalIp) {
    std::unique_lock<std::mutex> guard(writeMutex);
    LOG(INFO) << "Creating floating IP NAT " << floatingIp << " -> "
              << internalIp << " on " << NameMapper::routerName(routerId);
    return createNat(routerId, NatType::DNAT_AND_SNAT, floatingIp, internalIp,
                     {{extid::FLOATING_IP, floatingIp}});
}

void NorthboundClient::deleteFloatingIpNat(const string& floatingIp) {
    std::unique_lock<std::mutex> guard(writeMutex);
    LOG(INFO) << "Deleting floating IP NAT " << floatingIp;

    OvsdbConditions cond{
        OvsdbCondition("external_ip", OvsdbFunction::EQ,
                       OvsdbValue(floatingIp)),
        OvsdbCondition("type", OvsdbFunction::EQ,
                       OvsdbValue(string(toString(NatType::DNAT_AND_SNAT))))};
    list<OvsdbTransactMessage> ops;
    for (auto& nat : findAll<Nat>(OvsdbTable::NAT, cond)) {
        ops.push_back(mutateOp(OvsdbTable::LOGICAL_ROUTER,
                               referencing("nat", nat.uuid), "nat",
                               OvsdbOperation::DELETE, uuidSet({nat.uuid})));
        ops.push_back(deleteOp(OvsdbTable::NAT, byUuid(nat.uuid)));
    }
    if (!ops.empty())
        store->transact(ops);
}

Nat NorthboundClient::createSnat(const string& routerId,
                                 const string& externalIp,
                                 const string& logicalSubnet) {
    std::unique_lock<std::mutex> guard(writeMutex);
    LOG(INFO) << "Creating SNAT " << logicalSubnet << " -> " << externalIp
              << " on " << NameMapper::routerName(routerId);
    return createNat(routerId, NatType::SNAT, externalIp, logicalSubnet,
                     {{extid::SNAT, "true"}});
}

vector<Nat> NorthboundClient::listNat(const string& routerId) {
    LogicalRouter lr = getLogicalRouter(routerId);
    std::set<string> owned(lr.nat.begin(), lr.nat.end());
    vector<Nat> result;
    for (auto& nat : findAll<Nat>(OvsdbTable::NAT, OvsdbConditions())) {
        if (owned.count(nat.uuid) == 0) continue;
        nat.router = lr.uuid;
        result.push_back(nat);
    }
    return result;
}

/*
 * Security groups
 */

TranslationResult
NorthboundClient::
createSecurityGroupAcls(const std::shared_ptr<const SecurityGroup>& sg) {
    TranslationResult result = translator.translateSecurityGroup(sg);

    std::unique_lock<std::mutex> guard(writeMutex);
    const string pgName = NameMapper::portGroupName(sg->id);
    const string asName = NameMapper::addressSetName(sg->id);
    LOG(INFO) << "Creating ACLs for security group " << sg->id << " ("
              << sg->name << "): " << sg->rules.size() << " rule(s), "
              << result.acls.size() << " ACL(s)";

    list<OvsdbTransactMessage> ops;
    auto as = findOne<AddressSet>(OvsdbTable::ADDRESS_SET, byName(asName));
    if (!as) {
        AddressSet newAs;
        newAs.uuid = idGenerator->generateUuid();
        newAs.name = asName;
        newAs.externalIds[extid::SG_ID] = sg->id;
        ops.push_back(insertOp(OvsdbTable::ADDRESS_SET, newAs.uuid,
                               toRow(newAs)));
    }

    auto pg = findOne<PortGroup>(OvsdbTable::PORT_GROUP, byName(pgName));
    if (pg) {
        // the previous ACLs lose their last reference and go away
        result.portGroup.uuid = pg->uuid;
        result.portGroup.ports = pg->ports;
        OvsdbRowData row;
        row["acls"] = uuidSet(result.portGroup.acls);
        row["external_ids"] = stringMap(result.portGroup.externalIds);
        ops.push_back(updateOp(OvsdbTable::PORT_GROUP, byUuid(pg->uuid), row));
    } else {
        ops.push_back(insertOp(OvsdbTable::PORT_GROUP, result.portGroup.uuid,
                               toRow(result.portGroup)));
    }

    for (auto& acl : result.acls)
        ops.push_back(insertOp(OvsdbTable::ACL, acl.uuid, toRow(acl)));

    store->transact(ops);
    if (!result.skipped.empty()) {
        LOG(WARNING) << "Security group " << sg->id << " stored with "
                     << result.skipped.size() << " skipped rule(s)";
    }
    return result;
}

void NorthboundClient::deleteSecurityGroupAcls(const string& sgId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    LOG(INFO) << "Deleting ACLs for security group " << sgId;
    // ACLs are owned by the port group
    store->transact({deleteOp(OvsdbTable::PORT_GROUP,
                              byName(NameMapper::portGroupName(sgId))),
                     deleteOp(OvsdbTable::ADDRESS_SET,
                              byName(NameMapper::addressSetName(sgId)))});
}

PortGroup NorthboundClient::getPortGroup(const string& sgId) {
    const string name = NameMapper::portGroupName(sgId);
    auto pg = findOne<PortGroup>(OvsdbTable::PORT_GROUP, byName(name));
    if (!pg)
        throw NotFoundError("port group", name);
    return pg.get();
}

AddressSet NorthboundClient::getAddressSet(const string& sgId) {
    const string name = NameMapper::addressSetName(sgId);
    auto as = findOne<AddressSet>(OvsdbTable::ADDRESS_SET, byName(name));
    if (!as)
        throw NotFoundError("address set", name);
    return as.get();
}

vector<Acl> NorthboundClient::listAcls(const string& sgId) {
    PortGroup pg = getPortGroup(sgId);
    std::set<string> owned(pg.acls.begin(), pg.acls.end());
    vector<Acl> result;
    for (auto& acl : findAll<Acl>(OvsdbTable::ACL, OvsdbConditions())) {
        if (owned.count(acl.uuid))
            result.push_back(acl);
    }
    std::sort(result.begin(), result.end(),
              [](const Acl& a, const Acl& b) {
                  if (a.priority != b.priority)
                      return a.priority > b.priority;
                  if (a.direction != b.direction)
                      return a.direction < b.direction;
                  return a.match < b.match;
              });
    return result;
}

void NorthboundClient::applySecurityGroupToPort(const string& portId,
                                                const string& sgId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string pgName = NameMapper::portGroupName(sgId);
    const string name = NameMapper::switchPortName(portId);
    LOG(DEBUG) << "Applying security group " << sgId << " to port " << name;

    auto pg = findOne<PortGroup>(OvsdbTable::PORT_GROUP, byName(pgName));
    if (!pg)
        throw NotFoundError("port group", pgName);
    auto lsp = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                          byName(name));
    if (!lsp)
        throw NotFoundError("logical switch port", name);

    store->transact({mutateOp(OvsdbTable::PORT_GROUP, byUuid(pg->uuid),
                              "ports", OvsdbOperation::INSERT,
                              uuidSet({lsp->uuid}))});
}

void NorthboundClient::removeSecurityGroupFromPort(const string& portId,
                                                   const string& sgId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string pgName = NameMapper::portGroupName(sgId);
    const string name = NameMapper::switchPortName(portId);
    LOG(DEBUG) << "Removing security group " << sgId << " from port " << name;

    auto lsp = findOne<LogicalSwitchPort>(OvsdbTable::LOGICAL_SWITCH_PORT,
                                          byName(name));
    if (!lsp)
        return;
    store->transact({mutateOp(OvsdbTable::PORT_GROUP, byName(pgName),
                              "ports", OvsdbOperation::DELETE,
                              uuidSet({lsp->uuid}))});
}

void NorthboundClient::updateAddressSet(const string& sgId,
                                        const vector<string>& addresses) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::addressSetName(sgId);
    LOG(INFO) << "Updating address set " << name << " with "
              << addresses.size() << " address(es)";

    auto as = findOne<AddressSet>(OvsdbTable::ADDRESS_SET, byName(name));
    if (!as)
        throw NotFoundError("address set", name);
    OvsdbRowData row;
    row["addresses"] = stringSet(addresses);
    store->transact({updateOp(OvsdbTable::ADDRESS_SET, byUuid(as->uuid),
                              row)});
}

/*
 * Load balancers
 */

OvnLoadBalancer NorthboundClient::buildLoadBalancer(const LoadBalancer& lb) {
    OvnLoadBalancer ovnLb;
    ovnLb.name = NameMapper::loadBalancerName(lb.id);
    ovnLb.protocol = boost::algorithm::to_lower_copy(lb.spec.protocol);
    if (ovnLb.protocol.empty())
        ovnLb.protocol = "tcp";

    // "vip:port" -> "member:port,member:port"
    for (auto& listener : lb.spec.listeners) {
        vector<string> members;
        for (auto& member : lb.spec.members) {
            if (member.listenerId.empty() ||
                member.listenerId == listener.id)
                members.push_back(member.address + ":" +
                                  std::to_string(member.port));
        }
        if (!members.empty()) {
            ovnLb.vips[lb.spec.vip + ":" + std::to_string(listener.port)] =
                boost::algorithm::join(members, ",");
        }
    }
    ovnLb.externalIds[extid::LB_ID] = lb.id;
    ovnLb.externalIds[extid::PROJECT_ID] = lb.projectId;
    return ovnLb;
}

OvnLoadBalancer NorthboundClient::createLoadBalancer(const LoadBalancer& lb) {
    std::unique_lock<std::mutex> guard(writeMutex);
    OvnLoadBalancer ovnLb = buildLoadBalancer(lb);
    LOG(INFO) << "Creating load balancer " << ovnLb.name << " vip "
              << lb.spec.vip << " with " << ovnLb.vips.size() << " vip(s)";

    auto existing = findOne<OvnLoadBalancer>(OvsdbTable::LOAD_BALANCER,
                                             byName(ovnLb.name));
    if (existing) {
        LOG(INFO) << "Load balancer " << ovnLb.name << " already exists";
        return existing.get();
    }
    ovnLb.uuid = idGenerator->generateUuid();
    store->transact({insertOp(OvsdbTable::LOAD_BALANCER, ovnLb.uuid,
                              toRow(ovnLb))});
    return ovnLb;
}

OvnLoadBalancer NorthboundClient::updateLoadBalancer(const LoadBalancer& lb) {
    std::unique_lock<std::mutex> guard(writeMutex);
    OvnLoadBalancer ovnLb = buildLoadBalancer(lb);
    LOG(INFO) << "Updating load balancer " << ovnLb.name;

    auto existing = findOne<OvnLoadBalancer>(OvsdbTable::LOAD_BALANCER,
                                             byName(ovnLb.name));
    if (!existing) {
        ovnLb.uuid = idGenerator->generateUuid();
        store->transact({insertOp(OvsdbTable::LOAD_BALANCER, ovnLb.uuid,
                                  toRow(ovnLb))});
        return ovnLb;
    }
    ovnLb.uuid = existing->uuid;
    OvsdbRowData row = toRow(ovnLb);
    row.erase("name");
    store->transact({updateOp(OvsdbTable::LOAD_BALANCER,
                              byUuid(ovnLb.uuid), row)});
    return ovnLb;
}

OvnLoadBalancer NorthboundClient::getLoadBalancer(const string& lbId) {
    const string name = NameMapper::loadBalancerName(lbId);
    auto lb = findOne<OvnLoadBalancer>(OvsdbTable::LOAD_BALANCER,
                                       byName(name));
    if (!lb)
        throw NotFoundError("load balancer", name);
    return lb.get();
}

void NorthboundClient::deleteLoadBalancer(const string& lbId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string name = NameMapper::loadBalancerName(lbId);
    LOG(INFO) << "Deleting load balancer " << name;
    // switches and routers only hold weak references
    store->transact({deleteOp(OvsdbTable::LOAD_BALANCER, byName(name))});
}

void NorthboundClient::assignLoadBalancerToSwitch(const string& lbId,
                                                  const string& networkId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string lbName = NameMapper::loadBalancerName(lbId);
    const string switchName = NameMapper::switchName(networkId);
    LOG(INFO) << "Assigning load balancer " << lbName << " to switch "
              << switchName;

    auto lb = findOne<OvnLoadBalancer>(OvsdbTable::LOAD_BALANCER,
                                       byName(lbName));
    if (!lb)
        throw NotFoundError("load balancer", lbName);
    auto ls = findOne<LogicalSwitch>(OvsdbTable::LOGICAL_SWITCH,
                                     byName(switchName));
    if (!ls)
        throw NotFoundError("logical switch", switchName);
    store->transact({mutateOp(OvsdbTable::LOGICAL_SWITCH, byUuid(ls->uuid),
                              "load_balancer", OvsdbOperation::INSERT,
                              uuidSet({lb->uuid}))});
}

void NorthboundClient::assignLoadBalancerToRouter(const string& lbId,
                                                  const string& routerId) {
    std::unique_lock<std::mutex> guard(writeMutex);
    const string lbName = NameMapper::loadBalancerName(lbId);
    const string routerName = NameMapper::routerName(routerId);
    LOG(INFO) << "Assigning load balancer " << lbName << " to router "
              << routerName;

    auto lb = findOne<OvnLoadBalancer>(OvsdbTable::LOAD_BALANCER,
                                       byName(lbName));
    if (!lb)
        throw NotFoundError("load balancer", lbName);
    auto lr = findOne<LogicalRouter>(OvsdbTable::LOGICAL_ROUTER,
                                     byName(routerName));
    if (!lr)
        throw NotFoundError("logical router", routerName);
    store->transact({mutateOp(OvsdbTable::LOGICAL_ROUTER, byUuid(lr->uuid),
                              "load_balancer", OvsdbOperation::INSERT,
                              uuidSet({lb->uuid}))});
}

} /* namespace ovnpolicy */
