/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file SecurityGroupPresets.h
 * @brief Ready-made security group rule sets
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_SECURITYGROUPPRESETS_H
#define OVNPOLICY_SECURITYGROUPPRESETS_H

#include <ovnpolicy/SecurityGroup.h>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * A named rule set that can seed a new security group
 */
struct SecurityGroupPreset {
    std::string name;
    std::string description;
    std::vector<SecurityGroupRule> rules;
};

/**
 * @return every preset, in a fixed order
 */
const std::vector<SecurityGroupPreset>& getPresets();

/**
 * Look up a preset by name
 */
boost::optional<const SecurityGroupPreset&>
findPreset(const std::string& name);

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_SECURITYGROUPPRESETS_H */
