/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file DomainReader.h
 * @brief Read domain records from JSON property trees
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_DOMAINREADER_H
#define OVNPOLICY_DOMAINREADER_H

#include <ovnpolicy/LoadBalancer.h>
#include <ovnpolicy/Port.h>
#include <ovnpolicy/SecurityGroup.h>
#include <ovnpolicy/VirtualNetwork.h>

#include <boost/property_tree/ptree_fwd.hpp>

#include <string>

namespace ovnpolicy {

/**
 * Decode domain records using the field names of the platform API,
 * e.g. "port_min" or "remote_ip_prefix".  Missing optional fields take
 * the record defaults; a missing "id" is an error.
 */
class DomainReader {
public:
    /**
     * @throws boost::property_tree::ptree_error on missing or
     * malformed fields
     */
    static SecurityGroup
    readSecurityGroup(const boost::property_tree::ptree& properties);

    /** Decode one rule */
    static SecurityGroupRule
    readRule(const boost::property_tree::ptree& properties);

    /** Decode a virtual network */
    static VirtualNetwork
    readNetwork(const boost::property_tree::ptree& properties);

    /** Decode a port */
    static Port readPort(const boost::property_tree::ptree& properties);

    /** Decode a load balancer */
    static LoadBalancer
    readLoadBalancer(const boost::property_tree::ptree& properties);

    /**
     * Parse a JSON file into a property tree.  Lines starting with
     * "#" or "//" are comments.
     *
     * @param path the file to read
     * @param properties receives the tree
     * @throws boost::property_tree::json_parser_error on a bad file
     */
    static void readJsonFile(const std::string& path,
                             boost::property_tree::ptree& properties);
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_DOMAINREADER_H */
