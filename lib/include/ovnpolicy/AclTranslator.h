/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file AclTranslator.h
 * @brief Compiles security groups into OVN ACLs and port groups
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_ACLTRANSLATOR_H
#define OVNPOLICY_ACLTRANSLATOR_H

#include <ovnpolicy/IdGenerator.h>
#include <ovnpolicy/NbModel.h>
#include <ovnpolicy/SecurityGroup.h>

#include <memory>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * ACL priorities, higher numbers are evaluated first
 */
namespace priority {
/** allow established connections */
const int STATEFUL_ESTABLISHED = 32767;
/** allow related connections */
const int STATEFUL_RELATED = 32766;
/** drop invalid tracked connections */
const int DROP_INVALID = 32000;
/** administrative overrides, reserved */
const int ADMIN_RULE_BASE = 2000;
/** user rules, rule priority is added to this */
const int USER_RULE_BASE = 1000;
/** allow everything leaving the port */
const int DEFAULT_EGRESS_ALLOW = 100;
/** implicit deny */
const int DEFAULT_DENY = 0;
} /* namespace priority */

/**
 * A rule that could not be translated
 */
struct SkippedRule {
    /** id of the rule */
    std::string ruleId;
    /** why it was skipped */
    std::string reason;
};

/**
 * Everything generated for one security group
 */
struct TranslationResult {
    /** built-ins, then one ACL per translated rule, then the default
        egress allow */
    std::vector<Acl> acls;
    /** port group referencing every generated ACL */
    PortGroup portGroup;
    /** rules left out of the ACL set */
    std::vector<SkippedRule> skipped;
};

/**
 * Translate security groups to ACLs.  Translation is a pure function of
 * the input apart from the row UUIDs drawn from the id generator.
 */
class AclTranslator {
public:
    /**
     * @param idGenerator source of ACL and port group UUIDs
     */
    explicit AclTranslator(std::shared_ptr<IdGenerator> idGenerator);

    /**
     * Translate a complete security group.  Rules that fail to
     * translate are logged, reported in the result and left out.
     *
     * @param sg the security group
     * @return the generated ACLs and port group
     * @throws std::invalid_argument if sg is null
     */
    TranslationResult
    translateSecurityGroup(const std::shared_ptr<const SecurityGroup>& sg);

    /**
     * Translate a single rule of a security group
     *
     * @param rule the rule
     * @param sgId the id of the owning security group
     * @param stateful whether the owning group is stateful
     * @return the ACL
     * @throws TranslationError if the rule is invalid
     */
    Acl translateRule(const SecurityGroupRule& rule, const std::string& sgId,
                      bool stateful);

    /**
     * The ACL direction for a rule direction
     */
    static AclDirection translateDirection(RuleDirection direction);

    /**
     * The ACL action for a rule action
     */
    static AclAction translateAction(RuleAction action, bool stateful);

    /**
     * The effective ACL priority of a user rule: USER_RULE_BASE plus
     * the rule's priority, capped below ADMIN_RULE_BASE
     */
    static int rulePriority(uint32_t rulePriority);

private:
    std::shared_ptr<IdGenerator> idGen;

    Acl makeRuleAcl(const SecurityGroupRule& rule, const std::string& sgId,
                    const std::string& pgName, bool stateful);
    void addStatefulAcls(const std::string& sgId, const std::string& pgName,
                         std::vector<Acl>& acls);
    Acl makeBuiltin(const std::string& sgId, AclDirection direction,
                    int priority, const std::string& match,
                    AclAction action, const std::string& name,
                    const std::string& builtin);
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_ACLTRANSLATOR_H */
