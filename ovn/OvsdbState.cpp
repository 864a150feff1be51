/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the northbound row snapshot
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "OvsdbState.h"

#include <algorithm>

namespace ovnpolicy {

const OvsdbTableDetails& OvsdbState::getTable(OvsdbTable table) const {
    static const OvsdbTableDetails EMPTY;
    auto it = ovsdbState.find(table);
    if (it == ovsdbState.end())
        return EMPTY;
    return it->second;
}

OvsdbRowDetails* OvsdbState::getRow(OvsdbTable table,
                                    const std::string& uuid) {
    auto tit = ovsdbState.find(table);
    if (tit == ovsdbState.end())
        return nullptr;
    auto rit = tit->second.find(uuid);
    if (rit == tit->second.end())
        return nullptr;
    return &rit->second;
}

const OvsdbRowDetails* OvsdbState::getRow(OvsdbTable table,
                                          const std::string& uuid) const {
    return const_cast<OvsdbState*>(this)->getRow(table, uuid);
}

void OvsdbState::findRows(OvsdbTable table, const OvsdbConditions& conditions,
                          OvsdbTableDetails& rows) const {
    for (auto& row : getTable(table)) {
        if (matches(row.second, conditions))
            rows.insert(row);
    }
}

std::vector<std::string>
OvsdbState::findUuids(OvsdbTable table,
                      const OvsdbConditions& conditions) const {
    std::vector<std::string> uuids;
    for (auto& row : getTable(table)) {
        if (matches(row.second, conditions))
            uuids.push_back(row.first);
    }
    return uuids;
}

bool OvsdbState::matches(const OvsdbRowDetails& row,
                         const OvsdbConditions& conditions) {
    for (auto& cond : conditions) {
        auto it = row.find(cond.column);
        if (it == row.end()) {
            // an absent column holds its empty default
            if (cond.function == OvsdbFunction::INCLUDES &&
                getMembers(cond.value).empty())
                continue;
            return false;
        }
        if (!matches(it->second, cond.function, cond.value))
            return false;
    }
    return true;
}

std::vector<std::string> OvsdbState::getMembers(const OvsdbValue& value) {
    std::vector<std::string> members;
    switch (value.getType()) {
    case Dtype::STRING:
        members.push_back(value.getStringValue());
        break;
    case Dtype::INTEGER:
        members.push_back(std::to_string(value.getIntValue()));
        break;
    case Dtype::BOOL:
        members.push_back(value.getBoolValue() ? "true" : "false");
        break;
    case Dtype::SET:
    case Dtype::MAP:
        for (auto& m : value.getCollectionValue())
            members.push_back(m.first);
        break;
    }
    return members;
}

bool OvsdbState::matches(const OvsdbValue& column, OvsdbFunction function,
                         const OvsdbValue& rhs) {
    if (column.getType() == Dtype::MAP || rhs.getType() == Dtype::MAP) {
        if (column.getType() != Dtype::MAP || rhs.getType() != Dtype::MAP)
            return false;
        const auto& have = column.getCollectionValue();
        const auto& want = rhs.getCollectionValue();
        if (function == OvsdbFunction::EQ)
            return have == want;
        for (auto& kv : want) {
            auto it = have.find(kv.first);
            if (it == have.end() || it->second != kv.second)
                return false;
        }
        return true;
    }

    // sets of at most one member compare equal to their atom
    std::vector<std::string> have = getMembers(column);
    std::vector<std::string> want = getMembers(rhs);
    if (function == OvsdbFunction::EQ) {
        if (column.getType() != Dtype::SET && rhs.getType() != Dtype::SET &&
            column.getType() != rhs.getType())
            return false;
        std::sort(have.begin(), have.end());
        std::sort(want.begin(), want.end());
        return have == want;
    }
    for (auto& w : want) {
        if (std::find(have.begin(), have.end(), w) == have.end())
            return false;
    }
    return true;
}

} /* namespace ovnpolicy */
