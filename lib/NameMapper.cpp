/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NameMapper class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/NameMapper.h>

#include <boost/algorithm/string/replace.hpp>

namespace ovnpolicy {

std::string NameMapper::switchName(const std::string& networkId) {
    return "ls-" + networkId;
}

std::string NameMapper::switchPortName(const std::string& portId) {
    return "lsp-" + portId;
}

std::string NameMapper::routerName(const std::string& routerId) {
    return "lr-" + routerId;
}

std::string NameMapper::routerPortName(const std::string& routerId,
                                       const std::string& networkId) {
    return routerName(routerId) + "-to-" + switchName(networkId);
}

std::string NameMapper::routerPeerPortName(const std::string& routerId,
                                           const std::string& networkId) {
    return switchName(networkId) + "-to-" + routerName(routerId);
}

std::string NameMapper::localnetPortName(const std::string& networkId) {
    return switchName(networkId) + "-localnet";
}

std::string NameMapper::portGroupName(const std::string& sgId) {
    return "pg_sg_" + boost::algorithm::replace_all_copy(sgId, "-", "_");
}

std::string NameMapper::addressSetName(const std::string& sgId) {
    return "as_sg_" + boost::algorithm::replace_all_copy(sgId, "-", "_");
}

std::string NameMapper::loadBalancerName(const std::string& lbId) {
    return "lb-" + lbId;
}

} /* namespace ovnpolicy */
