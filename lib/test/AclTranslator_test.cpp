/*
 * Test suite for class AclTranslator
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include <ovnpolicy/AclTranslator.h>
#include <ovnpolicy/NameMapper.h>
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/test/BaseFixture.h>

#include <set>
#include <tuple>

namespace ovnpolicy {

using std::string;
using std::vector;
using std::shared_ptr;
using std::make_shared;

BOOST_AUTO_TEST_SUITE(AclTranslator_test)

class AclTranslatorFixture : public BaseFixture {
public:
    AclTranslatorFixture() : BaseFixture(), translator(idGen) {}

    shared_ptr<SecurityGroup> webGroup() {
        auto sg = make_shared<SecurityGroup>();
        sg->id = "sg-1";
        sg->name = "web";
        sg->stateful = true;

        SecurityGroupRule https;
        https.id = "11111111-2222-3333-4444-555555555555";
        https.direction = RuleDirection::INGRESS;
        https.protocol = "tcp";
        https.portMin = 443;
        https.portMax = 443;
        https.remoteIpPrefix = "0.0.0.0/0";
        https.action = RuleAction::ALLOW;
        https.priority = 10;
        sg->rules.push_back(https);
        return sg;
    }

    AclTranslator translator;
};

BOOST_FIXTURE_TEST_CASE(null_group, AclTranslatorFixture) {
    shared_ptr<const SecurityGroup> sg;
    BOOST_CHECK_THROW(translator.translateSecurityGroup(sg),
                      std::invalid_argument);
}

BOOST_FIXTURE_TEST_CASE(end_to_end, AclTranslatorFixture) {
    TranslationResult result = translator.translateSecurityGroup(webGroup());
    const vector<Acl>& acls = result.acls;

    BOOST_REQUIRE_EQUAL(6, acls.size());
    BOOST_CHECK(result.skipped.empty());

    BOOST_CHECK_EQUAL(32767, acls[0].priority);
    BOOST_CHECK_EQUAL(32767, acls[1].priority);
    BOOST_CHECK_EQUAL(32766, acls[2].priority);
    BOOST_CHECK_EQUAL(32000, acls[3].priority);
    BOOST_CHECK_EQUAL("stateful-established", acls[0].externalIds.at(extid::BUILTIN));
    BOOST_CHECK_EQUAL("stateful-related", acls[2].externalIds.at(extid::BUILTIN));
    BOOST_CHECK_EQUAL("drop-invalid", acls[3].externalIds.at(extid::BUILTIN));
    BOOST_CHECK(AclAction::DROP == acls[3].action);
    BOOST_CHECK(AclDirection::FROM_LPORT == acls[1].direction);
    BOOST_CHECK_EQUAL("outport == @pg_sg_sg_1 && ct.est && !ct.new",
                      acls[0].match);
    BOOST_CHECK_EQUAL("inport == @pg_sg_sg_1 && ct.est && !ct.new",
                      acls[1].match);
    BOOST_CHECK_EQUAL("outport == @pg_sg_sg_1 && ct.rel && !ct.new",
                      acls[2].match);
    BOOST_CHECK_EQUAL("outport == @pg_sg_sg_1 && ct.inv", acls[3].match);

    const Acl& user = acls[4];
    BOOST_CHECK(AclDirection::TO_LPORT == user.direction);
    BOOST_CHECK_EQUAL(1010, user.priority);
    BOOST_CHECK_EQUAL("outport == @pg_sg_sg_1 && ip4 && tcp && tcp.dst == 443",
                      user.match);
    BOOST_CHECK(AclAction::ALLOW_RELATED == user.action);
    BOOST_CHECK_EQUAL("rule-11111111", user.name.get());
    BOOST_CHECK_EQUAL("11111111-2222-3333-4444-555555555555",
                      user.externalIds.at(extid::RULE_ID));
    BOOST_CHECK_EQUAL("sg-1", user.externalIds.at(extid::SG_ID));

    const Acl& egress = acls[5];
    BOOST_CHECK(AclDirection::FROM_LPORT == egress.direction);
    BOOST_CHECK_EQUAL(100, egress.priority);
    BOOST_CHECK_EQUAL("inport == @pg_sg_sg_1", egress.match);
    BOOST_CHECK(AclAction::ALLOW == egress.action);

    const PortGroup& pg = result.portGroup;
    BOOST_CHECK_EQUAL("pg_sg_sg_1", pg.name);
    BOOST_CHECK_EQUAL("sg-1", pg.externalIds.at(extid::SG_ID));
    BOOST_CHECK_EQUAL("web", pg.externalIds.at(extid::SG_NAME));
    BOOST_CHECK(pg.ports.empty());
    BOOST_REQUIRE_EQUAL(6, pg.acls.size());
    for (size_t i = 0; i < acls.size(); ++i)
        BOOST_CHECK_EQUAL(acls[i].uuid, pg.acls[i]);
}

BOOST_FIXTURE_TEST_CASE(builtins_precede_user_rules, AclTranslatorFixture) {
    auto sg = webGroup();
    for (uint32_t p : {0u, 500u, 999u, 1000u, 5000u, 4294967295u}) {
        SecurityGroupRule rule = sg->rules[0];
        rule.id = "prio-" + std::to_string(p);
        rule.priority = p;
        sg->rules.push_back(rule);
    }
    TranslationResult result = translator.translateSecurityGroup(sg);
    BOOST_REQUIRE_EQUAL(4 + sg->rules.size() + 1, result.acls.size());

    int builtins = 0;
    for (const Acl& acl : result.acls) {
        if (acl.externalIds.count(extid::RULE_ID)) {
            BOOST_CHECK_GE(acl.priority, 1000);
            BOOST_CHECK_LT(acl.priority, 2000);
            BOOST_CHECK_LT(acl.priority, 32000);
        } else if (acl.priority >= 32000) {
            builtins += 1;
        }
    }
    BOOST_CHECK_EQUAL(4, builtins);
}

BOOST_FIXTURE_TEST_CASE(rule_priority_cap, AclTranslatorFixture) {
    BOOST_CHECK_EQUAL(1000, AclTranslator::rulePriority(0));
    BOOST_CHECK_EQUAL(1999, AclTranslator::rulePriority(999));
    BOOST_CHECK_EQUAL(1999, AclTranslator::rulePriority(1000));
    BOOST_CHECK_EQUAL(1999, AclTranslator::rulePriority(4294967295u));
}

BOOST_FIXTURE_TEST_CASE(stateless, AclTranslatorFixture) {
    auto sg = webGroup();
    sg->stateful = false;
    SecurityGroupRule drop;
    drop.id = "drop-telnet";
    drop.protocol = "tcp";
    drop.portMin = 23;
    drop.portMax = 23;
    drop.action = RuleAction::DROP;
    drop.description = "no telnet";
    sg->rules.push_back(drop);
    SecurityGroupRule reject = drop;
    reject.id = "reject-egress";
    reject.direction = RuleDirection::EGRESS;
    reject.action = RuleAction::REJECT;
    sg->rules.push_back(reject);

    TranslationResult result = translator.translateSecurityGroup(sg);
    BOOST_REQUIRE_EQUAL(4, result.acls.size());
    BOOST_CHECK(AclAction::ALLOW == result.acls[0].action);
    BOOST_CHECK(AclAction::DROP == result.acls[1].action);
    BOOST_CHECK_EQUAL("no telnet", result.acls[1].name.get());
    BOOST_CHECK(AclAction::REJECT == result.acls[2].action);
    BOOST_CHECK(AclDirection::FROM_LPORT == result.acls[2].direction);
    BOOST_CHECK_EQUAL(100, result.acls[3].priority);
}

BOOST_FIXTURE_TEST_CASE(skip_invalid_rule, AclTranslatorFixture) {
    auto sg = webGroup();
    SecurityGroupRule bad = sg->rules[0];
    bad.id = "bad-rule";
    bad.portMin = 100000;
    bad.portMax = 100000;
    sg->rules.insert(sg->rules.begin(), bad);

    TranslationResult result = translator.translateSecurityGroup(sg);
    BOOST_CHECK_EQUAL(6, result.acls.size());
    BOOST_REQUIRE_EQUAL(1, result.skipped.size());
    BOOST_CHECK_EQUAL("bad-rule", result.skipped[0].ruleId);
    BOOST_CHECK(!result.skipped[0].reason.empty());
    BOOST_CHECK_EQUAL("outport == @pg_sg_sg_1 && ip4 && tcp && tcp.dst == 443",
                      result.acls[4].match);
}

BOOST_FIXTURE_TEST_CASE(skip_malformed_text, AclTranslatorFixture) {
    auto sg = webGroup();
    size_t valid = translator.translateSecurityGroup(sg).acls.size();

    SecurityGroupRule prefix = sg->rules[0];
    prefix.id = "bad-prefix";
    prefix.remoteIpPrefix = "10.0.0.0/8 || ip4";
    SecurityGroupRule proto = sg->rules[0];
    proto.id = "bad-proto";
    proto.protocol = "tcp || 1";
    SecurityGroupRule remote = sg->rules[0];
    remote.id = "bad-remote";
    remote.remoteSecurityGroupId = "sg-2 || ip4";
    sg->rules.push_back(prefix);
    sg->rules.push_back(proto);
    sg->rules.push_back(remote);

    TranslationResult result = translator.translateSecurityGroup(sg);
    BOOST_CHECK_EQUAL(valid, result.acls.size());
    BOOST_REQUIRE_EQUAL(3, result.skipped.size());
    BOOST_CHECK_EQUAL("bad-prefix", result.skipped[0].ruleId);
    BOOST_CHECK_EQUAL("bad-proto", result.skipped[1].ruleId);
    BOOST_CHECK_EQUAL("bad-remote", result.skipped[2].ruleId);
    for (auto& acl : result.acls)
        BOOST_CHECK(acl.match.find("||") == string::npos);
}

BOOST_FIXTURE_TEST_CASE(deterministic, AclTranslatorFixture) {
    auto sg = webGroup();
    SecurityGroupRule ssh = sg->rules[0];
    ssh.id = "ssh";
    ssh.portMin = ssh.portMax = 22;
    ssh.remoteIpPrefix = "192.168.0.0/16";
    sg->rules.push_back(ssh);

    TranslationResult first = translator.translateSecurityGroup(sg);
    TranslationResult second = translator.translateSecurityGroup(sg);
    BOOST_REQUIRE_EQUAL(first.acls.size(), second.acls.size());

    typedef std::tuple<string, int, int, int> sem_t;
    std::set<sem_t> a, b;
    for (size_t i = 0; i < first.acls.size(); ++i) {
        const Acl& x = first.acls[i];
        const Acl& y = second.acls[i];
        BOOST_CHECK(x.uuid != y.uuid);
        a.insert(sem_t(x.match, x.priority, static_cast<int>(x.action),
                       static_cast<int>(x.direction)));
        b.insert(sem_t(y.match, y.priority, static_cast<int>(y.action),
                       static_cast<int>(y.direction)));
    }
    BOOST_CHECK(a == b);
    BOOST_CHECK(first.portGroup.uuid != second.portGroup.uuid);
    BOOST_CHECK_EQUAL(first.portGroup.name, second.portGroup.name);
}

BOOST_FIXTURE_TEST_CASE(single_rule, AclTranslatorFixture) {
    SecurityGroupRule rule;
    rule.id = "abc";
    rule.direction = RuleDirection::EGRESS;
    rule.protocol = "udp";
    rule.portMin = 123;
    rule.portMax = 123;
    Acl acl = translator.translateRule(rule, "sg-2", false);
    BOOST_CHECK_EQUAL("inport == @pg_sg_sg_2 && ip4 && udp && udp.dst == 123",
                      acl.match);
    BOOST_CHECK(AclAction::ALLOW == acl.action);
    BOOST_CHECK_EQUAL("rule-abc", acl.name.get());
    BOOST_CHECK_EQUAL("sg-2", acl.externalIds.at(extid::SG_ID));

    rule.portMax = 1;
    rule.portMin = 10;
    BOOST_CHECK_THROW(translator.translateRule(rule, "sg-2", false),
                      TranslationError);
}

BOOST_FIXTURE_TEST_CASE(empty_group, AclTranslatorFixture) {
    auto sg = make_shared<SecurityGroup>();
    sg->id = "empty";
    sg->stateful = false;
    TranslationResult result = translator.translateSecurityGroup(sg);
    BOOST_REQUIRE_EQUAL(1, result.acls.size());
    BOOST_CHECK_EQUAL("default-egress-allow", result.acls[0].name.get());
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace ovnpolicy */
