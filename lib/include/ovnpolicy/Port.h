/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Port.h
 * @brief Domain record describing a VM network port
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_PORT_H
#define OVNPOLICY_PORT_H

#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * How a port is attached to the hypervisor
 */
enum class BindingType {NORMAL, DIRECT, MACVTAP, VHOST_USER};

/**
 * Parse a binding type, case-insensitively.  Unknown strings mean normal.
 */
BindingType parseBindingType(const std::string& str);

/**
 * An address assigned to a port
 */
struct FixedIp {
    std::string subnetId;
    std::string ipAddress;
};

/**
 * Hypervisor attachment details
 */
struct PortBinding {
    BindingType type = BindingType::NORMAL;
    /** vhost-user socket path for VHOST_USER bindings */
    std::string vhostSocket;
};

/**
 * Desired state of a port
 */
struct PortSpec {
    std::string macAddress;
    std::vector<FixedIp> fixedIps;
    std::vector<std::string> securityGroupIds;
    bool portSecurityEnabled = true;
    PortBinding binding;
};

/**
 * Observed state of a port
 */
struct PortStatus {
    std::string vmId;
    std::string hostId;
};

/**
 * A VM network port on a virtual network
 */
struct Port {
    std::string id;
    std::string networkId;
    PortSpec spec;
    PortStatus status;
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_PORT_H */
