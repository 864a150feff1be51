/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file OvsdbState.h
 * @brief Snapshot of northbound database rows
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_OVSDBSTATE_H
#define OVNPOLICY_OVSDBSTATE_H

#include "OvsdbMessage.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace ovnpolicy {

/**
 * Row columns by name.  The row id is held in the "_uuid" column.
 */
typedef std::unordered_map<std::string, OvsdbValue> OvsdbRowDetails;

/**
 * Rows of a table keyed by uuid
 */
typedef std::unordered_map<std::string, OvsdbRowDetails> OvsdbTableDetails;

/**
 * Name of the row id column
 */
const std::string UUID_COLUMN("_uuid");

/**
 * Rows of the northbound tables.  Not synchronized; owners serialize
 * access themselves.
 */
class OvsdbState {
public:
    OvsdbState() = default;

    virtual ~OvsdbState() = default;

    /**
     * Insert or replace a row
     */
    void updateRow(OvsdbTable table, const std::string& uuid,
                   const OvsdbRowDetails& row) {
        ovsdbState[table][uuid] = row;
    }

    /**
     * Remove a row if present
     */
    void deleteRow(OvsdbTable table, const std::string& uuid) {
        ovsdbState[table].erase(uuid);
    }

    /**
     * Remove all rows
     */
    void clear() {
        ovsdbState.clear();
    }

    /**
     * Get the rows of a table
     */
    const OvsdbTableDetails& getTable(OvsdbTable table) const;

    /**
     * Get a row by uuid
     * @return the row or nullptr
     */
    OvsdbRowDetails* getRow(OvsdbTable table, const std::string& uuid);

    /**
     * Get a row by uuid
     * @return the row or nullptr
     */
    const OvsdbRowDetails* getRow(OvsdbTable table,
                                  const std::string& uuid) const;

    /**
     * Collect the rows of a table that match all conditions
     *
     * @param table the table
     * @param conditions conditions, empty matches all
     * @param rows rows that match, keyed by uuid
     */
    void findRows(OvsdbTable table, const OvsdbConditions& conditions,
                  OvsdbTableDetails& rows) const;

    /**
     * Get the uuids of rows that match all conditions
     */
    std::vector<std::string> findUuids(OvsdbTable table,
                                       const OvsdbConditions& conditions) const;

    /**
     * Check a row against a conjunction of conditions
     */
    static bool matches(const OvsdbRowDetails& row,
                        const OvsdbConditions& conditions);

    /**
     * Get the members of a column value.  Scalars yield a single member;
     * maps yield their keys.
     */
    static std::vector<std::string> getMembers(const OvsdbValue& value);

private:
    static bool matches(const OvsdbValue& column, OvsdbFunction function,
                        const OvsdbValue& rhs);

    std::unordered_map<OvsdbTable, OvsdbTableDetails> ovsdbState;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_OVSDBSTATE_H
