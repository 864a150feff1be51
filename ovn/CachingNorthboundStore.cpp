/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the northbound read cache
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "CachingNorthboundStore.h"
#include <ovnpolicy/logging.h>

#include <mutex>
#include <stdexcept>

namespace ovnpolicy {

static const OvsdbTable CACHED_TABLES[] = {
    OvsdbTable::LOGICAL_SWITCH,
    OvsdbTable::LOGICAL_SWITCH_PORT,
    OvsdbTable::LOGICAL_ROUTER,
    OvsdbTable::ACL,
};

CachingNorthboundStore::
CachingNorthboundStore(std::unique_ptr<NorthboundStore> inner_,
                       std::chrono::milliseconds ttl_)
    : inner(std::move(inner_)), ttl(ttl_), hits(0) {
    if (!inner)
        throw std::invalid_argument("Cached store must not be null");
}

bool CachingNorthboundStore::isCached(OvsdbTable table) {
    for (auto cached : CACHED_TABLES) {
        if (cached == table)
            return true;
    }
    return false;
}

std::string CachingNorthboundStore::
cacheKey(OvsdbTable table, const OvsdbConditions& conditions) {
    rapidjson::StringBuffer buffer;
    OvsdbWriter writer(buffer);
    writer.StartArray();
    writer.String(OvsdbMessage::toString(table));
    for (auto& cond : conditions) {
        writer.String(cond.column.c_str());
        writer.String(OvsdbMessage::toString(cond.function));
        writeValue(writer, cond.value);
    }
    writer.EndArray();
    return buffer.GetString();
}

bool CachingNorthboundStore::isConnected() const {
    return inner->isConnected();
}

void CachingNorthboundStore::close() {
    invalidateAll();
    inner->close();
}

void CachingNorthboundStore::invalidateAll() {
    std::unique_lock<std::shared_timed_mutex> guard(cacheMutex);
    clearEntries();
}

void CachingNorthboundStore::clearEntries() {
    entries.clear();
    // reads in flight on any cached table must not store their result
    for (auto table : CACHED_TABLES)
        generation[table] += 1;
}

uint64_t CachingNorthboundStore::getHits() const {
    std::shared_lock<std::shared_timed_mutex> guard(cacheMutex);
    return hits;
}

void CachingNorthboundStore::
transact(const std::list<OvsdbTransactMessage>& operations) {
    std::set<OvsdbTable> touched;
    for (auto& op : operations) {
        if (op.getOperation() != OvsdbOperation::SELECT)
            touched.insert(op.getTable());
    }
    // deletes cascade into non-root tables that are cached too
    if (touched.count(OvsdbTable::LOGICAL_SWITCH) ||
        touched.count(OvsdbTable::PORT_GROUP)) {
        touched.insert(OvsdbTable::LOGICAL_SWITCH_PORT);
        touched.insert(OvsdbTable::ACL);
    }
    // weak references to a deleted balancer are pruned from its owners
    if (touched.count(OvsdbTable::LOAD_BALANCER)) {
        touched.insert(OvsdbTable::LOGICAL_SWITCH);
        touched.insert(OvsdbTable::LOGICAL_ROUTER);
    }

    try {
        inner->transact(operations);
    } catch (const std::exception&) {
        // a failed write may have been partially seen by the server
        std::unique_lock<std::shared_timed_mutex> guard(cacheMutex);
        clearEntries();
        throw;
    }

    std::unique_lock<std::shared_timed_mutex> guard(cacheMutex);
    for (auto table : touched) {
        if (!isCached(table)) continue;
        generation[table] += 1;
        std::string prefix = cacheKey(table, OvsdbConditions());
        prefix.pop_back();
        for (auto it = entries.begin(); it != entries.end(); ) {
            if (it->first.compare(0, prefix.size(), prefix) == 0)
                it = entries.erase(it);
            else
                ++it;
        }
    }
}

void CachingNorthboundStore::
select(OvsdbTable table, const OvsdbConditions& conditions,
       OvsdbTableDetails& rows) {
    if (!isCached(table)) {
        inner->select(table, conditions, rows);
        return;
    }

    std::string key = cacheKey(table, conditions);
    uint64_t startGen;
    {
        std::shared_lock<std::shared_timed_mutex> guard(cacheMutex);
        auto it = entries.find(key);
        if (it != entries.end() &&
            it->second.expires > std::chrono::steady_clock::now()) {
            rows = it->second.rows;
            guard.unlock();
            std::unique_lock<std::shared_timed_mutex> wguard(cacheMutex);
            hits += 1;
            return;
        }
        auto git = generation.find(table);
        startGen = git == generation.end() ? 0 : git->second;
    }

    OvsdbTableDetails fresh;
    inner->select(table, conditions, fresh);

    {
        std::unique_lock<std::shared_timed_mutex> guard(cacheMutex);
        // a write that landed during the read makes the result stale
        if (generation[table] == startGen) {
            Entry& entry = entries[key];
            entry.rows = fresh;
            entry.expires = std::chrono::steady_clock::now() + ttl;
        } else {
            LOG(DEBUG) << "Not caching " << OvsdbMessage::toString(table)
                       << " read raced with a write";
        }
    }
    rows = std::move(fresh);
}

} /* namespace ovnpolicy */
