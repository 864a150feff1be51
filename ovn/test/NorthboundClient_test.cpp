/*
 * Test suite for class NorthboundClient
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "MemoryNorthboundStore.h"
#include "NbRowCodec.h"
#include "NorthboundClient.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/NameMapper.h>
#include <ovnpolicy/test/BaseFixture.h>

#include <algorithm>

namespace ovnpolicy {

using std::string;
using std::vector;
using std::shared_ptr;
using std::make_shared;

BOOST_AUTO_TEST_SUITE(NorthboundClient_test)

static bool contains(const vector<string>& v, const string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

class ClientFixture : public BaseFixture {
public:
    ClientFixture()
        : BaseFixture(), backend(new MemoryNorthboundStore(idGen)),
          client(std::unique_ptr<NorthboundStore>(backend), config, idGen) {}

    static VirtualNetwork network(const string& id) {
        VirtualNetwork net;
        net.id = id;
        net.projectId = "proj-1";
        net.name = "web";
        net.spec.type = NetworkType::OVERLAY;
        net.spec.mtu = 1450;
        net.spec.ipConfig.ipv4Subnet = "10.0.0.0/24";
        net.spec.ipConfig.ipv4Gateway = "10.0.0.1";
        net.spec.ipConfig.dhcp.enabled = true;
        net.spec.ipConfig.dhcp.dnsServers = {"8.8.8.8", "8.8.4.4"};
        net.spec.ipConfig.dhcp.domainName = "example.com";
        return net;
    }

    static Port port(const string& id, const string& networkId,
                     const string& mac, const string& ip) {
        Port p;
        p.id = id;
        p.networkId = networkId;
        p.spec.macAddress = mac;
        FixedIp fixedIp;
        fixedIp.ipAddress = ip;
        p.spec.fixedIps.push_back(fixedIp);
        p.spec.securityGroupIds.push_back("sg-1");
        p.status.vmId = "vm-1";
        return p;
    }

    static shared_ptr<SecurityGroup> webGroup() {
        auto sg = make_shared<SecurityGroup>();
        sg->id = "sg-1";
        sg->name = "web";
        SecurityGroupRule https;
        https.id = "rule-https";
        https.direction = RuleDirection::INGRESS;
        https.protocol = "tcp";
        https.portMin = 443;
        https.portMax = 443;
        https.remoteIpPrefix = "0.0.0.0/0";
        sg->rules.push_back(https);
        return sg;
    }

    static LoadBalancer loadBalancer() {
        LoadBalancer lb;
        lb.id = "lb-1";
        lb.projectId = "proj-1";
        lb.spec.vip = "10.0.0.100";
        lb.spec.protocol = "TCP";
        Listener http;
        http.id = "l1";
        http.port = 80;
        lb.spec.listeners.push_back(http);
        for (auto& address : {"10.0.0.5", "10.0.0.6"}) {
            Member m;
            m.listenerId = "l1";
            m.address = address;
            m.port = 8080;
            lb.spec.members.push_back(m);
        }
        return lb;
    }

    size_t count(OvsdbTable table) {
        OvsdbTableDetails rows;
        backend->select(table, OvsdbConditions(), rows);
        return rows.size();
    }

    boost::optional<LogicalSwitchPort> findPort(const string& name) {
        OvsdbTableDetails rows;
        backend->select(OvsdbTable::LOGICAL_SWITCH_PORT,
                        {OvsdbCondition("name", OvsdbFunction::EQ,
                                        OvsdbValue(name))}, rows);
        if (rows.empty())
            return boost::none;
        LogicalSwitchPort lsp;
        fromRow(rows.begin()->second, lsp);
        return lsp;
    }

    NorthboundConfig config;
    // owned by client
    MemoryNorthboundStore* backend;
    NorthboundClient client;
};

BOOST_FIXTURE_TEST_CASE(fallback, BaseFixture) {
    NorthboundConfig config;
    config.setAddress("");
    NorthboundClient client(config, idGen);
    BOOST_CHECK(client.isMockMode());
    BOOST_CHECK(client.isConnected());

    LogicalSwitch ls = client.createLogicalSwitch(ClientFixture::network("n1"));
    BOOST_CHECK_EQUAL(ls.uuid, client.getLogicalSwitch("n1").uuid);
    client.close();
    BOOST_CHECK(!client.isConnected());

    config.setAddress("tcp:nb.example:99999999999999999999");
    NorthboundClient overlong(config, idGen);
    BOOST_CHECK(overlong.isMockMode());
    overlong.createLogicalSwitch(ClientFixture::network("n2"));
    BOOST_CHECK_EQUAL("ls-n2", overlong.getLogicalSwitch("n2").name);

    config.setUseMockOnFailure(false);
    BOOST_CHECK_THROW(NorthboundClient(config, idGen), ConnectionError);
    config.setAddress("");
    BOOST_CHECK_THROW(NorthboundClient(config, idGen), ConnectionError);
}

BOOST_FIXTURE_TEST_CASE(logical_switch, ClientFixture) {
    BOOST_CHECK(client.isMockMode());
    LogicalSwitch ls = client.createLogicalSwitch(network("net-1"));
    BOOST_CHECK_EQUAL("ls-net-1", ls.name);
    BOOST_CHECK_EQUAL("10.0.0.0/24", ls.otherConfig["subnet"]);
    BOOST_CHECK_EQUAL("1450", ls.otherConfig["mtu"]);

    LogicalSwitch found = client.getLogicalSwitch("net-1");
    BOOST_CHECK_EQUAL(ls.uuid, found.uuid);
    BOOST_CHECK_EQUAL("net-1", found.externalIds[extid::NETWORK_ID]);
    BOOST_CHECK_EQUAL("proj-1", found.externalIds[extid::PROJECT_ID]);
    BOOST_CHECK_EQUAL("web", found.externalIds[extid::NAME]);

    vector<DhcpOptions> dhcp = client.listDhcpOptions("ls-net-1");
    BOOST_REQUIRE_EQUAL(1, dhcp.size());
    BOOST_CHECK_EQUAL("10.0.0.0/24", dhcp[0].cidr);
    BOOST_CHECK_EQUAL("10.0.0.1", dhcp[0].options["router"]);
    BOOST_CHECK_EQUAL("10.0.0.1", dhcp[0].options["server_id"]);
    BOOST_CHECK_EQUAL("86400", dhcp[0].options["lease_time"]);
    BOOST_CHECK_EQUAL("8.8.8.8,8.8.4.4", dhcp[0].options["dns_server"]);
    BOOST_CHECK_EQUAL("\"example.com\"", dhcp[0].options["domain_name"]);
    BOOST_CHECK(boost::starts_with(dhcp[0].options["server_mac"], "0a:"));

    // creating again returns the existing switch
    BOOST_CHECK_EQUAL(ls.uuid, client.createLogicalSwitch(network("net-1")).uuid);
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::LOGICAL_SWITCH));

    client.deleteLogicalSwitch("net-1");
    BOOST_CHECK_THROW(client.getLogicalSwitch("net-1"), NotFoundError);
    BOOST_CHECK(client.listDhcpOptions("ls-net-1").empty());
}

BOOST_FIXTURE_TEST_CASE(vlan_switch, ClientFixture) {
    VirtualNetwork net = network("net-2");
    net.spec.type = NetworkType::VLAN;
    VlanConfig vlan;
    vlan.vlanId = 100;
    vlan.physicalNetwork = "physnet1";
    net.spec.vlan = vlan;
    // DHCP without a subnet is skipped, not fatal
    net.spec.ipConfig.ipv4Subnet = "";

    LogicalSwitch ls = client.createLogicalSwitch(net);
    BOOST_CHECK_EQUAL("100", ls.otherConfig["vlan"]);
    BOOST_CHECK_EQUAL(0, ls.otherConfig.count("subnet"));
    BOOST_CHECK(client.listDhcpOptions("").empty());

    LogicalSwitchPort localnet =
        client.createLocalnetPort("net-2", 100, "physnet1");
    BOOST_CHECK_EQUAL("ls-net-2-localnet", localnet.name);
    BOOST_CHECK_EQUAL("localnet", localnet.type);
    BOOST_CHECK_EQUAL("physnet1", localnet.options["network_name"]);

    auto stored = findPort("ls-net-2-localnet");
    BOOST_REQUIRE(stored);
    BOOST_REQUIRE(stored->tag);
    BOOST_CHECK_EQUAL(100, stored->tag.get());
    BOOST_CHECK(contains(stored->addresses, "unknown"));
    BOOST_CHECK(contains(client.getLogicalSwitch("net-2").ports,
                         localnet.uuid));
}

BOOST_FIXTURE_TEST_CASE(switch_ports, ClientFixture) {
    Port p1 = port("p1", "net-1", "fa:16:3e:00:00:01", "10.0.0.5");
    BOOST_CHECK_THROW(client.createLogicalSwitchPort(p1), NotFoundError);

    client.createLogicalSwitch(network("net-1"));
    LogicalSwitchPort lsp = client.createLogicalSwitchPort(p1);
    BOOST_CHECK_EQUAL("lsp-p1", lsp.name);
    BOOST_CHECK_EQUAL(NorthboundClient::portName("p1"), lsp.name);

    LogicalSwitchPort found = client.getLogicalSwitchPort("p1");
    BOOST_CHECK_EQUAL(lsp.uuid, found.uuid);
    BOOST_REQUIRE_EQUAL(1, found.addresses.size());
    BOOST_CHECK_EQUAL("fa:16:3e:00:00:01 10.0.0.5", found.addresses[0]);
    BOOST_REQUIRE_EQUAL(1, found.portSecurity.size());
    BOOST_CHECK_EQUAL("fa:16:3e:00:00:01 10.0.0.5", found.portSecurity[0]);
    BOOST_CHECK_EQUAL("p1", found.externalIds[extid::PORT_ID]);
    BOOST_CHECK(contains(client.getLogicalSwitch("net-1").ports, lsp.uuid));

    Port p2 = port("p2", "net-1", "fa:16:3e:00:00:02", "10.0.0.6");
    p2.spec.portSecurityEnabled = false;
    p2.spec.binding.type = BindingType::DIRECT;
    p2.status.hostId = "host-2";
    LogicalSwitchPort direct = client.createLogicalSwitchPort(p2);
    BOOST_CHECK(direct.portSecurity.empty());
    BOOST_CHECK_EQUAL("direct", direct.type);
    BOOST_CHECK_EQUAL("host-2", direct.options["requested-chassis"]);

    client.bindPort("p1", "vm-9", "host-1");
    found = client.getLogicalSwitchPort("p1");
    BOOST_CHECK_EQUAL("vm-9", found.externalIds[extid::VM_ID]);
    BOOST_CHECK_EQUAL("host-1", found.options["requested-chassis"]);
    BOOST_CHECK_THROW(client.bindPort("missing", "vm", "host"),
                      NotFoundError);

    client.deleteLogicalSwitchPort("p1");
    BOOST_CHECK_THROW(client.getLogicalSwitchPort("p1"), NotFoundError);
    BOOST_CHECK(!contains(client.getLogicalSwitch("net-1").ports, lsp.uuid));
    client.deleteLogicalSwitchPort("p1");
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::LOGICAL_SWITCH_PORT));

    // ports go with their switch
    client.deleteLogicalSwitch("net-1");
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH_PORT));
}

BOOST_FIXTURE_TEST_CASE(security_group, ClientFixture) {
    client.createLogicalSwitch(network("net-1"));
    LogicalSwitchPort lsp = client.createLogicalSwitchPort(
        port("p1", "net-1", "fa:16:3e:00:00:01", "10.0.0.5"));
    BOOST_CHECK_THROW(client.applySecurityGroupToPort("p1", "sg-1"),
                      NotFoundError);

    TranslationResult result = client.createSecurityGroupAcls(webGroup());
    BOOST_CHECK_EQUAL(6, result.acls.size());

    PortGroup pg = client.getPortGroup("sg-1");
    BOOST_CHECK_EQUAL("pg_sg_sg_1", pg.name);
    BOOST_CHECK_EQUAL(6, pg.acls.size());
    BOOST_CHECK_EQUAL("as_sg_sg_1", client.getAddressSet("sg-1").name);

    vector<Acl> acls = client.listAcls("sg-1");
    BOOST_REQUIRE_EQUAL(6, acls.size());
    for (size_t i = 1; i < acls.size(); ++i)
        BOOST_CHECK(acls[i - 1].priority >= acls[i].priority);
    BOOST_CHECK_EQUAL(32767, acls[0].priority);
    BOOST_CHECK_EQUAL(100, acls[5].priority);

    client.applySecurityGroupToPort("p1", "sg-1");
    BOOST_CHECK(contains(client.getPortGroup("sg-1").ports, lsp.uuid));
    BOOST_CHECK_THROW(client.applySecurityGroupToPort("missing", "sg-1"),
                      NotFoundError);

    // regenerating replaces the ACLs and keeps the member ports
    auto updated = webGroup();
    SecurityGroupRule ssh = updated->rules[0];
    ssh.id = "rule-ssh";
    ssh.portMin = ssh.portMax = 22;
    updated->rules.push_back(ssh);
    client.createSecurityGroupAcls(updated);
    pg = client.getPortGroup("sg-1");
    BOOST_CHECK_EQUAL(7, pg.acls.size());
    BOOST_CHECK(contains(pg.ports, lsp.uuid));
    BOOST_CHECK_EQUAL(7, client.listAcls("sg-1").size());
    BOOST_CHECK_EQUAL(7, count(OvsdbTable::ACL));
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::ADDRESS_SET));

    client.updateAddressSet("sg-1", {"10.0.0.5", "10.0.0.6"});
    BOOST_CHECK_EQUAL(2, client.getAddressSet("sg-1").addresses.size());
    BOOST_CHECK_THROW(client.updateAddressSet("sg-2", {}), NotFoundError);

    client.removeSecurityGroupFromPort("p1", "sg-1");
    BOOST_CHECK(client.getPortGroup("sg-1").ports.empty());
    client.removeSecurityGroupFromPort("missing", "sg-1");

    client.deleteSecurityGroupAcls("sg-1");
    BOOST_CHECK_THROW(client.getPortGroup("sg-1"), NotFoundError);
    BOOST_CHECK_THROW(client.getAddressSet("sg-1"), NotFoundError);
    BOOST_CHECK_THROW(client.listAcls("sg-1"), NotFoundError);
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::ACL));
}

BOOST_FIXTURE_TEST_CASE(router, ClientFixture) {
    BOOST_CHECK_THROW(client.createFloatingIpNat("r1", "192.168.1.10",
                                                 "10.0.0.5"),
                      NotFoundError);

    LogicalRouter lr = client.createLogicalRouter("r1", "proj-1", true);
    BOOST_CHECK_EQUAL("lr-r1", lr.name);
    BOOST_CHECK_EQUAL("", lr.options.at("chassis"));
    BOOST_CHECK_EQUAL("r1", lr.externalIds[extid::ROUTER_ID]);
    BOOST_CHECK_EQUAL(lr.uuid,
                      client.createLogicalRouter("r1", "proj-1", true).uuid);

    LogicalSwitch ls = client.createLogicalSwitch(network("net-1"));
    LogicalRouterPort lrp = client.addRouterInterface("r1", "net-1",
                                                      "10.0.0.1/24");
    BOOST_CHECK_EQUAL("lr-r1-to-ls-net-1", lrp.name);
    BOOST_CHECK(boost::starts_with(lrp.mac, "0a:00:00:"));
    BOOST_CHECK(contains(lrp.networks, "10.0.0.1/24"));
    BOOST_CHECK_EQUAL(lrp.uuid,
                      client.getLogicalRouterPort("r1", "net-1").uuid);
    BOOST_CHECK(contains(client.getLogicalRouter("r1").ports, lrp.uuid));

    auto peer = findPort("ls-net-1-to-lr-r1");
    BOOST_REQUIRE(peer);
    BOOST_CHECK_EQUAL("router", peer->type);
    BOOST_CHECK_EQUAL("lr-r1-to-ls-net-1", peer->options["router-port"]);
    BOOST_CHECK(contains(peer->addresses, "router"));
    BOOST_CHECK(contains(client.getLogicalSwitch("net-1").ports, peer->uuid));

    Nat fip = client.createFloatingIpNat("r1", "192.168.1.10", "10.0.0.5");
    BOOST_CHECK(NatType::DNAT_AND_SNAT == fip.type);
    Nat snat = client.createSnat("r1", "192.168.1.1", "10.0.0.0/24");
    BOOST_CHECK(NatType::SNAT == snat.type);
    BOOST_CHECK_EQUAL(2, client.listNat("r1").size());

    // only the floating IP rule is removed
    client.deleteFloatingIpNat("192.168.1.1");
    BOOST_CHECK_EQUAL(2, client.listNat("r1").size());
    client.deleteFloatingIpNat("192.168.1.10");
    vector<Nat> nat = client.listNat("r1");
    BOOST_REQUIRE_EQUAL(1, nat.size());
    BOOST_CHECK_EQUAL(snat.uuid, nat[0].uuid);
    BOOST_CHECK_EQUAL("10.0.0.0/24", nat[0].logicalIp);
    BOOST_CHECK_EQUAL(lr.uuid, nat[0].router);

    client.deleteLogicalRouter("r1");
    BOOST_CHECK_THROW(client.getLogicalRouter("r1"), NotFoundError);
    BOOST_CHECK_THROW(client.listNat("r1"), NotFoundError);
    BOOST_CHECK(!findPort("ls-net-1-to-lr-r1"));
    BOOST_CHECK(client.getLogicalSwitch("net-1").ports.empty());
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_ROUTER_PORT));
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::NAT));
    client.deleteLogicalRouter("r1");
}

BOOST_FIXTURE_TEST_CASE(load_balancer, ClientFixture) {
    client.createLogicalSwitch(network("net-1"));
    client.createLogicalRouter("r1", "proj-1", false);

    OvnLoadBalancer lb = client.createLoadBalancer(loadBalancer());
    BOOST_CHECK_EQUAL("lb-lb-1", lb.name);
    BOOST_CHECK_EQUAL("tcp", lb.protocol);
    BOOST_CHECK_EQUAL("10.0.0.5:8080,10.0.0.6:8080",
                      lb.vips["10.0.0.100:80"]);
    BOOST_CHECK_EQUAL("lb-1", lb.externalIds[extid::LB_ID]);
    BOOST_CHECK_EQUAL(lb.uuid, client.createLoadBalancer(loadBalancer()).uuid);

    client.assignLoadBalancerToSwitch("lb-1", "net-1");
    client.assignLoadBalancerToRouter("lb-1", "r1");
    BOOST_CHECK(contains(client.getLogicalSwitch("net-1").loadBalancers,
                         lb.uuid));
    BOOST_CHECK(contains(client.getLogicalRouter("r1").loadBalancers,
                         lb.uuid));
    BOOST_CHECK_THROW(client.assignLoadBalancerToSwitch("lb-1", "net-9"),
                      NotFoundError);
    BOOST_CHECK_THROW(client.assignLoadBalancerToRouter("lb-9", "r1"),
                      NotFoundError);

    LoadBalancer changed = loadBalancer();
    changed.spec.members.pop_back();
    OvnLoadBalancer updated = client.updateLoadBalancer(changed);
    BOOST_CHECK_EQUAL(lb.uuid, updated.uuid);
    OvnLoadBalancer found = client.getLoadBalancer("lb-1");
    BOOST_CHECK_EQUAL("10.0.0.5:8080", found.vips["10.0.0.100:80"]);
    BOOST_CHECK(contains(client.getLogicalSwitch("net-1").loadBalancers,
                         lb.uuid));

    client.deleteLoadBalancer("lb-1");
    BOOST_CHECK_THROW(client.getLoadBalancer("lb-1"), NotFoundError);
    BOOST_CHECK(client.getLogicalSwitch("net-1").loadBalancers.empty());
    BOOST_CHECK(client.getLogicalRouter("r1").loadBalancers.empty());

    // updating an absent balancer creates it
    client.updateLoadBalancer(changed);
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::LOAD_BALANCER));
}

BOOST_FIXTURE_TEST_CASE(dhcp_options, ClientFixture) {
    DhcpOptionsConfig cfg;
    cfg.cidr = "10.1.0.0/24";
    cfg.serverId = "10.1.0.1";
    cfg.router = "10.1.0.1";
    cfg.dnsServers = {"1.1.1.1", "8.8.8.8"};
    cfg.mtu = 1400;
    cfg.domainName = "corp";

    DhcpOptions opts = client.createDhcpOptions(cfg);
    BOOST_CHECK_EQUAL("{1.1.1.1, 8.8.8.8}", opts.options["dns_server"]);
    BOOST_CHECK_EQUAL("1400", opts.options["mtu"]);
    BOOST_CHECK_EQUAL("\"corp\"", opts.options["domain_name"]);
    BOOST_CHECK_EQUAL("86400", opts.options["lease_time"]);
    BOOST_CHECK(boost::starts_with(opts.options["server_mac"], "0a:"));

    cfg.serverMac = "fa:16:3e:aa:bb:cc";
    cfg.leaseTime = 600;
    opts = client.createDhcpOptions(cfg);
    BOOST_CHECK_EQUAL("fa:16:3e:aa:bb:cc", opts.options["server_mac"]);
    BOOST_CHECK_EQUAL("600", opts.options["lease_time"]);

    vector<DhcpOptions> all = client.listDhcpOptions("");
    BOOST_REQUIRE_EQUAL(2, all.size());
    BOOST_CHECK_EQUAL("10.1.0.0/24", all[0].cidr);
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace ovnpolicy */
