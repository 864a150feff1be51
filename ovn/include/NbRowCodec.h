/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NbRowCodec.h
 * @brief Conversion between northbound records and OVSDB rows
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NBROWCODEC_H
#define OVNPOLICY_NBROWCODEC_H

#include "OvsdbState.h"
#include <ovnpolicy/NbModel.h>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace ovnpolicy {

/**
 * Column values keyed by name, as written by insert and update
 */
typedef std::unordered_map<std::string, OvsdbValue> OvsdbRowData;

/** @return a set of strings */
OvsdbValue stringSet(const std::vector<std::string>& members);
/** @return a set of row references */
OvsdbValue uuidSet(const std::vector<std::string>& uuids);
/** @return a string to string map */
OvsdbValue stringMap(const StringMap& items);
/** @return a reference to a single row */
OvsdbValue uuidRef(const std::string& uuid);
/** @return a map holding a single pair */
OvsdbValue mapEntry(const std::string& key, const std::string& value);

/** @return a scalar string column, "" if absent */
std::string getString(const OvsdbRowDetails& row, const std::string& column);
/** @return an optional string column held as a set of at most one */
boost::optional<std::string> getOptionalString(const OvsdbRowDetails& row,
                                               const std::string& column);
/** @return a boolean column, or the default */
bool getBool(const OvsdbRowDetails& row, const std::string& column,
             bool def);
/** @return an integer column, or the default */
int getInt(const OvsdbRowDetails& row, const std::string& column, int def);
/** @return the members of a set column */
std::vector<std::string> getSet(const OvsdbRowDetails& row,
                                const std::string& column);
/** @return a map column */
StringMap getMap(const OvsdbRowDetails& row, const std::string& column);

/**
 * @name Row encoding
 * The uuid and reference columns that the caller maintains through
 * mutations are left out unless noted.
 */
/**@{*/
OvsdbRowData toRow(const LogicalSwitch& ls);
OvsdbRowData toRow(const LogicalSwitchPort& lsp);
OvsdbRowData toRow(const LogicalRouter& lr);
OvsdbRowData toRow(const LogicalRouterPort& lrp);
OvsdbRowData toRow(const Acl& acl);
OvsdbRowData toRow(const AddressSet& as);
/** Includes the port and ACL references */
OvsdbRowData toRow(const PortGroup& pg);
OvsdbRowData toRow(const DhcpOptions& dhcp);
OvsdbRowData toRow(const Nat& nat);
OvsdbRowData toRow(const OvnLoadBalancer& lb);
/**@}*/

/**
 * @name Row decoding
 */
/**@{*/
void fromRow(const OvsdbRowDetails& row, LogicalSwitch& ls);
void fromRow(const OvsdbRowDetails& row, LogicalSwitchPort& lsp);
void fromRow(const OvsdbRowDetails& row, LogicalRouter& lr);
void fromRow(const OvsdbRowDetails& row, LogicalRouterPort& lrp);
void fromRow(const OvsdbRowDetails& row, Acl& acl);
void fromRow(const OvsdbRowDetails& row, AddressSet& as);
void fromRow(const OvsdbRowDetails& row, PortGroup& pg);
void fromRow(const OvsdbRowDetails& row, DhcpOptions& dhcp);
void fromRow(const OvsdbRowDetails& row, Nat& nat);
void fromRow(const OvsdbRowDetails& row, OvnLoadBalancer& lb);
/**@}*/

} /* namespace ovnpolicy */

#endif //OVNPOLICY_NBROWCODEC_H
