/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NameMapper.h
 * @brief Deterministic northbound names derived from domain ids, and the
 * external_ids keys linking northbound rows back to domain entities
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NAMEMAPPER_H
#define OVNPOLICY_NAMEMAPPER_H

#include <string>

namespace ovnpolicy {

/**
 * Keys of the external_ids column.  These are read by other tools
 * inspecting the northbound database and must not change.
 */
namespace extid {
const std::string NETWORK_ID("limiquantix-network-id");
const std::string PROJECT_ID("limiquantix-project-id");
const std::string NAME("limiquantix-name");
const std::string PORT_ID("limiquantix-port-id");
const std::string VM_ID("limiquantix-vm-id");
const std::string ROUTER_ID("limiquantix-router-id");
const std::string SG_ID("limiquantix-sg-id");
const std::string SG_NAME("limiquantix-sg-name");
const std::string RULE_ID("limiquantix-rule-id");
const std::string BUILTIN("limiquantix-builtin");
const std::string SWITCH("limiquantix-switch");
const std::string FLOATING_IP("limiquantix-floating-ip");
const std::string SNAT("limiquantix-snat");
const std::string LB_ID("limiquantix-lb-id");
} /* namespace extid */

/**
 * Maps domain ids to northbound object names.  Every function is pure:
 * the same id always yields the same name.
 */
class NameMapper {
public:
    /** "ls-<network-id>" */
    static std::string switchName(const std::string& networkId);

    /** "lsp-<port-id>" */
    static std::string switchPortName(const std::string& portId);

    /** "lr-<router-id>" */
    static std::string routerName(const std::string& routerId);

    /** "<router-name>-to-<switch-name>" */
    static std::string routerPortName(const std::string& routerId,
                                      const std::string& networkId);

    /** "<switch-name>-to-<router-name>", the switch side of a router
        interface */
    static std::string routerPeerPortName(const std::string& routerId,
                                          const std::string& networkId);

    /** "<switch-name>-localnet" */
    static std::string localnetPortName(const std::string& networkId);

    /**
     * "pg_sg_<sg-id>" with every '-' replaced by '_', since port group
     * names are referenced from match expressions as @name
     */
    static std::string portGroupName(const std::string& sgId);

    /** "as_sg_<sg-id>" with every '-' replaced by '_' */
    static std::string addressSetName(const std::string& sgId);

    /** "lb-<lb-id>" */
    static std::string loadBalancerName(const std::string& lbId);
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_NAMEMAPPER_H */
