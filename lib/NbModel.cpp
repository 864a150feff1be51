/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Conversions for northbound object enumerations
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/NbModel.h>

#include <stdexcept>

namespace ovnpolicy {

static const char* AclDirectionStrings[] = {"to-lport", "from-lport"};

const char* toString(AclDirection direction) {
    return AclDirectionStrings[static_cast<uint32_t>(direction)];
}

static const char* AclActionStrings[] =
    {"allow", "allow-related", "allow-stateless", "drop", "reject"};

const char* toString(AclAction action) {
    return AclActionStrings[static_cast<uint32_t>(action)];
}

static const char* NatTypeStrings[] = {"snat", "dnat", "dnat_and_snat"};

const char* toString(NatType type) {
    return NatTypeStrings[static_cast<uint32_t>(type)];
}

AclDirection parseAclDirection(const std::string& str) {
    for (uint32_t i = 0; i < 2; ++i) {
        if (str == AclDirectionStrings[i])
            return static_cast<AclDirection>(i);
    }
    throw std::invalid_argument("Unknown ACL direction: " + str);
}

AclAction parseAclAction(const std::string& str) {
    for (uint32_t i = 0; i < 5; ++i) {
        if (str == AclActionStrings[i])
            return static_cast<AclAction>(i);
    }
    throw std::invalid_argument("Unknown ACL action: " + str);
}

NatType parseNatType(const std::string& str) {
    for (uint32_t i = 0; i < 3; ++i) {
        if (str == NatTypeStrings[i])
            return static_cast<NatType>(i);
    }
    throw std::invalid_argument("Unknown NAT type: " + str);
}

std::ostream& operator<<(std::ostream& os, const Acl& acl) {
    os << toString(acl.direction) << " " << acl.priority
       << " (" << acl.match << ") " << toString(acl.action);
    if (acl.name)
        os << " [" << acl.name.get() << "]";
    return os;
}

} /* namespace ovnpolicy */
