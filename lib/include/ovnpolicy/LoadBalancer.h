/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file LoadBalancer.h
 * @brief Domain record describing a tenant load balancer
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_LOADBALANCER_H
#define OVNPOLICY_LOADBALANCER_H

#include <cstdint>
#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * A port the load balancer listens on
 */
struct Listener {
    std::string id;
    uint32_t port = 0;
};

/**
 * A backend of the load balancer.  A member with an empty listener id
 * serves every listener.
 */
struct Member {
    std::string listenerId;
    std::string address;
    uint32_t port = 0;
};

/**
 * Desired state of a load balancer
 */
struct LoadBalancerSpec {
    std::string vip;
    /** "tcp", "udp" or "sctp"; empty means tcp */
    std::string protocol;
    std::vector<Listener> listeners;
    std::vector<Member> members;
};

/**
 * A tenant load balancer
 */
struct LoadBalancer {
    std::string id;
    std::string projectId;
    std::string name;
    LoadBalancerSpec spec;
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_LOADBALANCER_H */
