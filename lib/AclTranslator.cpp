/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for AclTranslator class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/AclTranslator.h>
#include <ovnpolicy/MatchBuilder.h>
#include <ovnpolicy/NameMapper.h>
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/logging.h>

#include <stdexcept>

namespace ovnpolicy {

using std::string;
using std::vector;
using std::shared_ptr;

AclTranslator::AclTranslator(shared_ptr<IdGenerator> idGenerator)
    : idGen(std::move(idGenerator)) {
    if (!idGen)
        throw std::invalid_argument("AclTranslator requires an id generator");
}

AclDirection AclTranslator::translateDirection(RuleDirection direction) {
    switch (direction) {
    case RuleDirection::EGRESS:
        return AclDirection::FROM_LPORT;
    case RuleDirection::INGRESS:
    default:
        return AclDirection::TO_LPORT;
    }
}

AclAction AclTranslator::translateAction(RuleAction action, bool stateful) {
    switch (action) {
    case RuleAction::DROP:
        return AclAction::DROP;
    case RuleAction::REJECT:
        return AclAction::REJECT;
    case RuleAction::ALLOW:
    default:
        return stateful ? AclAction::ALLOW_RELATED : AclAction::ALLOW;
    }
}

int AclTranslator::rulePriority(uint32_t rulePriority) {
    uint64_t prio = static_cast<uint64_t>(priority::USER_RULE_BASE) +
        rulePriority;
    if (prio > static_cast<uint64_t>(priority::ADMIN_RULE_BASE - 1))
        prio = priority::ADMIN_RULE_BASE - 1;
    return static_cast<int>(prio);
}

Acl AclTranslator::makeRuleAcl(const SecurityGroupRule& rule,
                               const string& sgId, const string& pgName,
                               bool stateful) {
    Acl acl;
    acl.match = MatchBuilder::build(rule, pgName);
    acl.uuid = idGen->generateUuid();
    acl.direction = translateDirection(rule.direction);
    acl.priority = rulePriority(rule.priority);
    acl.action = translateAction(rule.action, stateful);
    if (!rule.description.empty())
        acl.name = rule.description;
    else
        acl.name = "rule-" + rule.id.substr(0, 8);
    acl.externalIds[extid::RULE_ID] = rule.id;
    acl.externalIds[extid::SG_ID] = sgId;

    LOG(DEBUG) << "Translated " << rule << " to " << acl;
    return acl;
}

Acl AclTranslator::translateRule(const SecurityGroupRule& rule,
                                 const string& sgId, bool stateful) {
    return makeRuleAcl(rule, sgId, NameMapper::portGroupName(sgId), stateful);
}

Acl AclTranslator::makeBuiltin(const string& sgId, AclDirection direction,
                               int priority, const string& match,
                               AclAction action, const string& name,
                               const string& builtin) {
    Acl acl;
    acl.uuid = idGen->generateUuid();
    acl.direction = direction;
    acl.priority = priority;
    acl.match = match;
    acl.action = action;
    acl.name = name;
    acl.externalIds[extid::BUILTIN] = builtin;
    acl.externalIds[extid::SG_ID] = sgId;
    return acl;
}

void AclTranslator::addStatefulAcls(const string& sgId, const string& pgName,
                                    vector<Acl>& acls) {
    const string to = "outport == @" + pgName;
    const string from = "inport == @" + pgName;

    acls.push_back(makeBuiltin(sgId, AclDirection::TO_LPORT,
                               priority::STATEFUL_ESTABLISHED,
                               to + " && ct.est && !ct.new", AclAction::ALLOW,
                               "stateful-established-ingress",
                               "stateful-established"));
    acls.push_back(makeBuiltin(sgId, AclDirection::FROM_LPORT,
                               priority::STATEFUL_ESTABLISHED,
                               from + " && ct.est && !ct.new", AclAction::ALLOW,
                               "stateful-established-egress",
                               "stateful-established"));
    acls.push_back(makeBuiltin(sgId, AclDirection::TO_LPORT,
                               priority::STATEFUL_RELATED,
                               to + " && ct.rel && !ct.new", AclAction::ALLOW,
                               "stateful-related-ingress",
                               "stateful-related"));
    acls.push_back(makeBuiltin(sgId, AclDirection::TO_LPORT,
                               priority::DROP_INVALID,
                               to + " && ct.inv", AclAction::DROP,
                               "drop-invalid", "drop-invalid"));
}

TranslationResult
AclTranslator::translateSecurityGroup(const shared_ptr<const SecurityGroup>& sg) {
    if (!sg)
        throw std::invalid_argument("security group is null");

    LOG(INFO) << "Translating security group " << sg->id
              << " (" << sg->name << "): " << sg->rules.size()
              << " rules, " << (sg->stateful ? "stateful" : "stateless");

    TranslationResult result;
    const string pgName = NameMapper::portGroupName(sg->id);

    if (sg->stateful)
        addStatefulAcls(sg->id, pgName, result.acls);

    for (const SecurityGroupRule& rule : sg->rules) {
        try {
            result.acls.push_back(makeRuleAcl(rule, sg->id, pgName,
                                              sg->stateful));
        } catch (const TranslationError& e) {
            LOG(WARNING) << "Skipping rule " << rule.id
                         << " of security group " << sg->id
                         << ": " << e.what();
            result.skipped.push_back(SkippedRule{rule.id, e.what()});
        }
    }

    result.acls.push_back(makeBuiltin(sg->id, AclDirection::FROM_LPORT,
                                      priority::DEFAULT_EGRESS_ALLOW,
                                      "inport == @" + pgName,
                                      AclAction::ALLOW,
                                      "default-egress-allow",
                                      "default-egress-allow"));

    PortGroup& pg = result.portGroup;
    pg.uuid = idGen->generateUuid();
    pg.name = pgName;
    pg.externalIds[extid::SG_ID] = sg->id;
    pg.externalIds[extid::SG_NAME] = sg->name;
    for (const Acl& acl : result.acls)
        pg.acls.push_back(acl.uuid);

    LOG(INFO) << "Translated security group " << sg->id << " to "
              << result.acls.size() << " ACLs on port group " << pgName
              << (result.skipped.empty() ? "" : ", skipped ")
              << (result.skipped.empty() ? "" :
                  std::to_string(result.skipped.size()) + " rules");
    return result;
}

} /* namespace ovnpolicy */
