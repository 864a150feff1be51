/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NorthboundClient.h
 * @brief Manage OVN northbound objects for platform resources
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NORTHBOUNDCLIENT_H
#define OVNPOLICY_NORTHBOUNDCLIENT_H

#include "NorthboundStore.h"
#include <ovnpolicy/AclTranslator.h>
#include <ovnpolicy/IdGenerator.h>
#include <ovnpolicy/LoadBalancer.h>
#include <ovnpolicy/NbModel.h>
#include <ovnpolicy/NorthboundConfig.h>
#include <ovnpolicy/Port.h>
#include <ovnpolicy/SecurityGroup.h>
#include <ovnpolicy/VirtualNetwork.h>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * Explicit DHCP configuration for a subnet
 */
struct DhcpOptionsConfig {
    /** subnet served */
    std::string cidr;
    /** address of the DHCP server */
    std::string serverId;
    /** MAC of the DHCP server; generated when empty */
    std::string serverMac;
    /** default gateway */
    std::string router;
    /** lease time in seconds; 86400 when zero */
    uint32_t leaseTime = 0;
    /** DNS servers */
    std::vector<std::string> dnsServers;
    /** interface MTU; omitted when zero */
    uint32_t mtu = 0;
    /** DNS search domain */
    std::string domainName;
};

/**
 * Create, read and delete the northbound objects that implement
 * networks, ports, routers, security groups and load balancers.
 *
 * The client is shared between threads.  Reads run concurrently;
 * operations that read and then write are serialized, and every write
 * is issued as one transaction so related objects appear together.
 * Create operations return the existing object when one with the same
 * name is present, and delete operations succeed when there is nothing
 * to delete.
 */
class NorthboundClient : private boost::noncopyable {
public:
    /**
     * Connect to the northbound database named in the configuration.
     * When the connection fails and fallback is enabled, the client
     * uses an in-memory database for the rest of its life.
     *
     * @param config client configuration
     * @param idGenerator source of row ids and MAC addresses
     * @throws ConnectionError if the connection fails and fallback is
     * disabled
     */
    explicit NorthboundClient(const NorthboundConfig& config,
                              std::shared_ptr<IdGenerator> idGenerator =
                              std::make_shared<RandomIdGenerator>());

    /**
     * Use the given backend
     *
     * @param store the backend
     * @param config client configuration; only the cache settings apply
     * @param idGenerator source of row ids and MAC addresses
     */
    NorthboundClient(std::unique_ptr<NorthboundStore> store,
                     const NorthboundConfig& config,
                     std::shared_ptr<IdGenerator> idGenerator);

    ~NorthboundClient();

    // Logical switches

    /**
     * Create the logical switch of a network, and its DHCP options
     * when DHCP is enabled.  A failure to create the DHCP options is
     * logged and does not fail the switch.
     */
    LogicalSwitch createLogicalSwitch(const VirtualNetwork& network);

    /**
     * @throws NotFoundError if the network has no switch
     */
    LogicalSwitch getLogicalSwitch(const std::string& networkId);

    /**
     * Delete a network's switch with its ports and DHCP options
     */
    void deleteLogicalSwitch(const std::string& networkId);

    // DHCP

    /**
     * Create DHCP options from an explicit configuration
     */
    DhcpOptions createDhcpOptions(const DhcpOptionsConfig& config);

    /**
     * List DHCP options created for a switch, or all of them when the
     * switch name is empty
     */
    std::vector<DhcpOptions> listDhcpOptions(const std::string& switchName);

    // Logical switch ports

    /**
     * Create the switch port for a VM port
     * @throws NotFoundError if the port's network has no switch
     */
    LogicalSwitchPort createLogicalSwitchPort(const Port& port);

    /**
     * @throws NotFoundError if the port does not exist
     */
    LogicalSwitchPort getLogicalSwitchPort(const std::string& portId);

    /**
     * Delete a switch port, detaching it from its switch and port groups
     */
    void deleteLogicalSwitchPort(const std::string& portId);

    /**
     * Record the VM and the host a port is bound to
     * @throws NotFoundError if the port does not exist
     */
    void bindPort(const std::string& portId, const std::string& vmId,
                  const std::string& hostId);

    /**
     * The switch port name for a platform port id
     */
    static std::string portName(const std::string& portId);

    /**
     * Create the localnet port that connects a network's switch to a
     * physical network
     * @throws NotFoundError if the network has no switch
     */
    LogicalSwitchPort createLocalnetPort(const std::string& networkId,
                                         uint32_t vlanId,
                                         const std::string& physicalNetwork);

    // Logical routers

    LogicalRouter createLogicalRouter(const std::string& routerId,
                                      const std::string& projectId,
                                      bool distributed);

    /**
     * @throws NotFoundError if the router does not exist
     */
    LogicalRouter getLogicalRouter(const std::string& routerId);

    /**
     * Delete a router with its ports, NAT rules and the switch ports
     * that peer with it
     */
    void deleteLogicalRouter(const std::string& routerId);

    /**
     * Connect a network to a router
     *
     * @param routerId the router
     * @param networkId the network
     * @param gatewayCidr router address on the network, e.g.
     * "10.0.0.1/24"
     * @return the router port
     * @throws NotFoundError if the router or the switch is missing
     */
    LogicalRouterPort addRouterInterface(const std::string& routerId,
                                         const std::string& networkId,
                                         const std::string& gatewayCidr);

    /**
     * @throws NotFoundError if the interface does not exist
     */
    LogicalRouterPort getLogicalRouterPort(const std::string& routerId,
                                           const std::string& networkId);

    // NAT

    /**
     * @throws NotFoundError if the router does not exist
     */
    Nat createFloatingIpNat(const std::string& routerId,
                            const std::string& floatingIp,
                            const std::string& internalIp);

    void deleteFloatingIpNat(const std::string& floatingIp);

    /**
     * @throws NotFoundError if the router does not exist
     */
    Nat createSnat(const std::string& routerId, const std::string& externalIp,
                   const std::string& logicalSubnet);

    /**
     * @throws NotFoundError if the router does not exist
     */
    std::vector<Nat> listNat(const std::string& routerId);

    // Security groups

    /**
     * Generate and store the ACLs, port group and address set of a
     * security group.  Existing ACLs of the group are replaced while
     * the port group keeps its member ports.
     *
     * @return the translation, including any skipped rules
     * @throws std::invalid_argument if sg is null
     */
    TranslationResult
    createSecurityGroupAcls(const std::shared_ptr<const SecurityGroup>& sg);

    /**
     * Delete a security group's port group, ACLs and address set
     */
    void deleteSecurityGroupAcls(const std::string& sgId);

    /**
     * @throws NotFoundError if the group has no port group
     */
    PortGroup getPortGroup(const std::string& sgId);

    /**
     * @throws NotFoundError if the group has no address set
     */
    AddressSet getAddressSet(const std::string& sgId);

    /**
     * The ACLs of a security group, highest priority first
     * @throws NotFoundError if the group has no port group
     */
    std::vector<Acl> listAcls(const std::string& sgId);

    /**
     * Add a port to a security group's port group
     * @throws NotFoundError if the port or the port group is missing
     */
    void applySecurityGroupToPort(const std::string& portId,
                                  const std::string& sgId);

    void removeSecurityGroupFromPort(const std::string& portId,
                                     const std::string& sgId);

    /**
     * Replace the addresses of a security group's address set
     * @throws NotFoundError if the address set is missing
     */
    void updateAddressSet(const std::string& sgId,
                          const std::vector<std::string>& addresses);

    // Load balancers

    OvnLoadBalancer createLoadBalancer(const LoadBalancer& lb);

    /**
     * Update a load balancer in place, keeping its attachments.
     * Creates it when missing.
     */
    OvnLoadBalancer updateLoadBalancer(const LoadBalancer& lb);

    /**
     * @throws NotFoundError if the load balancer does not exist
     */
    OvnLoadBalancer getLoadBalancer(const std::string& lbId);

    void deleteLoadBalancer(const std::string& lbId);

    /**
     * @throws NotFoundError if the load balancer or switch is missing
     */
    void assignLoadBalancerToSwitch(const std::string& lbId,
                                    const std::string& networkId);

    /**
     * @throws NotFoundError if the load balancer or router is missing
     */
    void assignLoadBalancerToRouter(const std::string& lbId,
                                    const std::string& routerId);

    // Backend

    bool isConnected() const;

    /**
     * Check whether the client fell back to the in-memory database
     */
    bool isMockMode() const { return mockMode; }

    void close();

private:
    void init(std::unique_ptr<NorthboundStore> backend);

    template <typename T>
    boost::optional<T> findOne(OvsdbTable table,
                               const OvsdbConditions& conditions);
    template <typename T>
    std::vector<T> findAll(OvsdbTable table,
                           const OvsdbConditions& conditions);

    DhcpOptions createNetworkDhcpOptions(const std::string& switchName,
                                         const VirtualNetwork& network);
    OvnLoadBalancer buildLoadBalancer(const LoadBalancer& lb);
    Nat createNat(const std::string& routerId, NatType type,
                  const std::string& externalIp,
                  const std::string& logicalIp, const StringMap& externalIds);
    void insertSwitchPort(const LogicalSwitch& ls,
                          const LogicalSwitchPort& lsp);

    NorthboundConfig config;
    std::shared_ptr<IdGenerator> idGenerator;
    AclTranslator translator;
    std::unique_ptr<NorthboundStore> store;
    bool mockMode;
    std::mutex writeMutex;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_NORTHBOUNDCLIENT_H
