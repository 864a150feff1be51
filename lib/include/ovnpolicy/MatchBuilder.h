/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file MatchBuilder.h
 * @brief Builds OVN match expressions for security group rules
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_MATCHBUILDER_H
#define OVNPOLICY_MATCHBUILDER_H

#include <ovnpolicy/SecurityGroup.h>

#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * Compose the boolean match expression for one rule.  Clauses appear in
 * a fixed order: port group scope, IP version, protocol and its fields,
 * remote prefix, remote security group.  They are joined with " && ".
 */
class MatchBuilder {
public:
    /**
     * Build the expression for a rule scoped to a port group
     *
     * @param rule the rule to translate
     * @param portGroup the name of the port group the rule belongs to
     * @return the match expression
     * @throws TranslationError if the rule carries out of range or
     * malformed values
     */
    static std::string build(const SecurityGroupRule& rule,
                             const std::string& portGroup);

    /**
     * Check the fields of a rule.  Protocols other than the named ones
     * must be IP protocol numbers, the remote prefix must be an address
     * with an optional prefix length and the remote group id may only
     * hold letters, digits, '-' and '_'.
     *
     * @param rule the rule to check
     * @throws TranslationError describing the first problem found
     */
    static void validate(const SecurityGroupRule& rule);

    /**
     * @return true if the prefix means "any address": empty, 0.0.0.0/0
     * or ::/0
     */
    static bool isAnyPrefix(const std::string& prefix);

private:
    static void addProtocolClauses(const SecurityGroupRule& rule,
                                   std::vector<std::string>& clauses);
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_MATCHBUILDER_H */
