/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the in-memory northbound database
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "MemoryNorthboundStore.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/logging.h>

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

namespace ovnpolicy {

namespace {

struct RefColumn {
    std::string column;
    OvsdbTable target;
    bool strong;
};

struct TableSchema {
    bool root;
    std::vector<RefColumn> refs;
    std::vector<std::string> indexes;
};

typedef std::map<OvsdbTable, TableSchema> Schema;

const Schema& schema() {
    static const Schema SCHEMA = {
        {OvsdbTable::LOGICAL_SWITCH,
         {true,
          {{"ports", OvsdbTable::LOGICAL_SWITCH_PORT, true},
           {"acls", OvsdbTable::ACL, true},
           {"load_balancer", OvsdbTable::LOAD_BALANCER, false}},
          {}}},
        {OvsdbTable::LOGICAL_SWITCH_PORT, {false, {}, {"name"}}},
        {OvsdbTable::LOGICAL_ROUTER,
         {true,
          {{"ports", OvsdbTable::LOGICAL_ROUTER_PORT, true},
           {"nat", OvsdbTable::NAT, true},
           {"load_balancer", OvsdbTable::LOAD_BALANCER, false}},
          {}}},
        {OvsdbTable::LOGICAL_ROUTER_PORT, {false, {}, {"name"}}},
        {OvsdbTable::ACL, {false, {}, {}}},
        {OvsdbTable::ADDRESS_SET, {true, {}, {"name"}}},
        {OvsdbTable::PORT_GROUP,
         {true,
          {{"ports", OvsdbTable::LOGICAL_SWITCH_PORT, false},
           {"acls", OvsdbTable::ACL, true}},
          {"name"}}},
        {OvsdbTable::DHCP_OPTIONS, {true, {}, {}}},
        {OvsdbTable::NAT, {false, {}, {}}},
        {OvsdbTable::LOAD_BALANCER, {true, {}, {}}},
    };
    return SCHEMA;
}

} /* anonymous namespace */

MemoryNorthboundStore::
MemoryNorthboundStore(std::shared_ptr<IdGenerator> idGenerator_)
    : idGenerator(std::move(idGenerator_)), open(true) {
    if (!idGenerator)
        throw std::invalid_argument("ID generator must not be null");
}

bool MemoryNorthboundStore::isConnected() const {
    return open;
}

void MemoryNorthboundStore::close() {
    open = false;
}

void MemoryNorthboundStore::
select(OvsdbTable table, const OvsdbConditions& conditions,
       OvsdbTableDetails& rows) {
    if (!open)
        throw ConnectionError("In-memory northbound store is closed");
    std::shared_lock<std::shared_timed_mutex> guard(stateMutex);
    state.findRows(table, conditions, rows);
}

void MemoryNorthboundStore::
transact(const std::list<OvsdbTransactMessage>& operations) {
    if (!open)
        throw ConnectionError("In-memory northbound store is closed");
    std::unique_lock<std::shared_timed_mutex> guard(stateMutex);
    // operations apply to a copy that replaces the state on success
    OvsdbState working(state);
    for (auto& op : operations) {
        apply(working, op);
    }
    collectGarbage(working);
    checkConstraints(working);
    state = std::move(working);
    LOG(DEBUG) << "Committed transaction of " << operations.size()
               << " operation(s)";
}

void MemoryNorthboundStore::apply(OvsdbState& working,
                                  const OvsdbTransactMessage& op) {
    OvsdbTable table = op.getTable();
    switch (op.getOperation()) {
    case OvsdbOperation::SELECT:
        break;
    case OvsdbOperation::INSERT:
        {
            std::string uuid = op.externalKey.first == "uuid"
                ? op.externalKey.second : idGenerator->generateUuid();
            if (working.getRow(table, uuid) != nullptr) {
                throw TransactionError("constraint violation",
                                       "duplicate uuid " + uuid + " in " +
                                       OvsdbMessage::toString(table));
            }
            OvsdbRowDetails row(op.rowData.begin(), op.rowData.end());
            row[UUID_COLUMN] = OvsdbValue("uuid", uuid);
            working.updateRow(table, uuid, row);
        }
        break;
    case OvsdbOperation::UPDATE:
        for (auto& uuid : working.findUuids(table, op.conditions)) {
            OvsdbRowDetails* row = working.getRow(table, uuid);
            for (auto& col : op.rowData) {
                if (col.first == UUID_COLUMN) {
                    throw TransactionError("constraint violation",
                                           "_uuid is immutable");
                }
                (*row)[col.first] = col.second;
            }
        }
        break;
    case OvsdbOperation::MUTATE:
        for (auto& uuid : working.findUuids(table, op.conditions)) {
            mutate(*working.getRow(table, uuid), op);
        }
        break;
    case OvsdbOperation::DELETE:
        for (auto& uuid : working.findUuids(table, op.conditions)) {
            working.deleteRow(table, uuid);
        }
        break;
    }
}

void MemoryNorthboundStore::mutate(OvsdbRowDetails& row,
                                   const OvsdbTransactMessage& op) {
    for (auto& m : op.mutateRowData) {
        const std::string& col = m.first;
        OvsdbOperation mutator = m.second.first;
        const OvsdbValue& arg = m.second.second;
        if (mutator != OvsdbOperation::INSERT &&
            mutator != OvsdbOperation::DELETE) {
            throw TransactionError("not supported",
                                   std::string("mutator ") +
                                   OvsdbMessage::toString(mutator));
        }

        auto it = row.find(col);
        bool mapColumn = arg.getType() == Dtype::MAP ||
            (it != row.end() && it->second.getType() == Dtype::MAP);
        if (mapColumn) {
            std::map<std::string, std::string> current;
            if (it != row.end())
                current = it->second.getCollectionValue();
            if (arg.getType() == Dtype::MAP) {
                for (auto& kv : arg.getCollectionValue()) {
                    if (mutator == OvsdbOperation::INSERT) {
                        // keys already present keep their value
                        current.insert(kv);
                    } else {
                        auto c = current.find(kv.first);
                        if (c != current.end() && c->second == kv.second)
                            current.erase(c);
                    }
                }
            } else if (mutator == OvsdbOperation::DELETE) {
                for (auto& key : OvsdbState::getMembers(arg))
                    current.erase(key);
            } else {
                throw TransactionError("constraint violation",
                                       "cannot insert a set into map column " +
                                       col);
            }
            row[col] = OvsdbValue(Dtype::MAP, "", current);
            continue;
        }

        std::map<std::string, std::string> members;
        std::string atomKey = arg.getKey();
        if (it != row.end()) {
            for (auto& mem : OvsdbState::getMembers(it->second))
                members[mem] = "";
            if (atomKey.empty())
                atomKey = it->second.getKey();
        }
        for (auto& mem : OvsdbState::getMembers(arg)) {
            if (mutator == OvsdbOperation::INSERT)
                members[mem] = "";
            else
                members.erase(mem);
        }
        row[col] = OvsdbValue(Dtype::SET, atomKey, members);
    }
}

void MemoryNorthboundStore::collectGarbage(OvsdbState& working) {
    bool changed = true;
    while (changed) {
        changed = false;
        std::set<std::pair<OvsdbTable, std::string>> referenced;
        for (auto& ts : schema()) {
            for (auto& row : working.getTable(ts.first)) {
                for (auto& ref : ts.second.refs) {
                    if (!ref.strong) continue;
                    auto c = row.second.find(ref.column);
                    if (c == row.second.end()) continue;
                    for (auto& mem : OvsdbState::getMembers(c->second))
                        referenced.emplace(ref.target, mem);
                }
            }
        }
        for (auto& ts : schema()) {
            if (ts.second.root) continue;
            std::vector<std::string> orphans;
            for (auto& row : working.getTable(ts.first)) {
                if (referenced.find(std::make_pair(ts.first, row.first)) ==
                    referenced.end())
                    orphans.push_back(row.first);
            }
            for (auto& uuid : orphans) {
                LOG(DEBUG) << "Removing unreferenced "
                           << OvsdbMessage::toString(ts.first)
                           << " row " << uuid;
                working.deleteRow(ts.first, uuid);
                changed = true;
            }
        }
    }

    // weak references to deleted rows disappear
    for (auto& ts : schema()) {
        std::vector<std::string> uuids;
        for (auto& row : working.getTable(ts.first))
            uuids.push_back(row.first);
        for (auto& ref : ts.second.refs) {
            if (ref.strong) continue;
            for (auto& uuid : uuids) {
                OvsdbRowDetails* row = working.getRow(ts.first, uuid);
                auto c = row->find(ref.column);
                if (c == row->end()) continue;
                std::map<std::string, std::string> kept;
                for (auto& mem : OvsdbState::getMembers(c->second)) {
                    if (working.getRow(ref.target, mem) != nullptr)
                        kept[mem] = "";
                }
                std::string atomKey = c->second.getKey();
                c->second = OvsdbValue(Dtype::SET, atomKey, kept);
            }
        }
    }
}

void MemoryNorthboundStore::checkConstraints(const OvsdbState& working) {
    for (auto& ts : schema()) {
        const char* tableName = OvsdbMessage::toString(ts.first);
        for (auto& row : working.getTable(ts.first)) {
            for (auto& ref : ts.second.refs) {
                if (!ref.strong) continue;
                auto c = row.second.find(ref.column);
                if (c == row.second.end()) continue;
                for (auto& mem : OvsdbState::getMembers(c->second)) {
                    if (working.getRow(ref.target, mem) == nullptr) {
                        throw TransactionError("referential integrity violation",
                                               std::string(tableName) + " row " +
                                               row.first + " column " +
                                               ref.column + " refers to missing " +
                                               OvsdbMessage::toString(ref.target) +
                                               " row " + mem);
                    }
                }
            }
        }
        for (auto& index : ts.second.indexes) {
            std::set<std::string> seen;
            for (auto& row : working.getTable(ts.first)) {
                auto c = row.second.find(index);
                if (c == row.second.end()) continue;
                if (!seen.insert(c->second.getStringValue()).second) {
                    throw TransactionError("constraint violation",
                                           std::string("duplicate ") +
                                           tableName + " " + index + " \"" +
                                           c->second.getStringValue() + "\"");
                }
            }
        }
    }
}

} /* namespace ovnpolicy */
