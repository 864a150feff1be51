/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file CachingNorthboundStore.h
 * @brief Read cache in front of a northbound backend
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_CACHINGNORTHBOUNDSTORE_H
#define OVNPOLICY_CACHINGNORTHBOUNDSTORE_H

#include "NorthboundStore.h"

#include <chrono>
#include <memory>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace ovnpolicy {

/**
 * Caches select results for the logical switch, logical switch port,
 * logical router and ACL tables.  Entries expire after a fixed time to
 * live, and any transaction that touches a table drops that table's
 * entries.
 */
class CachingNorthboundStore : public NorthboundStore {
public:
    /**
     * @param inner the backend being cached
     * @param ttl time to live of an entry
     */
    CachingNorthboundStore(std::unique_ptr<NorthboundStore> inner,
                           std::chrono::milliseconds ttl);

    virtual ~CachingNorthboundStore() {}

    virtual bool isConnected() const override;
    virtual void transact(const std::list<OvsdbTransactMessage>& operations) override;
    virtual void select(OvsdbTable table, const OvsdbConditions& conditions,
                        OvsdbTableDetails& rows) override;
    virtual void close() override;

    /**
     * Drop all cached entries
     */
    void invalidateAll();

    /**
     * Check whether a table's reads are cached
     */
    static bool isCached(OvsdbTable table);

    /**
     * Number of select calls answered from the cache
     */
    uint64_t getHits() const;

private:
    struct Entry {
        OvsdbTableDetails rows;
        std::chrono::steady_clock::time_point expires;
    };

    static std::string cacheKey(OvsdbTable table,
                                const OvsdbConditions& conditions);

    // caller holds cacheMutex exclusively
    void clearEntries();

    std::unique_ptr<NorthboundStore> inner;
    std::chrono::milliseconds ttl;

    mutable std::shared_timed_mutex cacheMutex;
    std::unordered_map<std::string, Entry> entries;
    std::unordered_map<OvsdbTable, uint64_t> generation;
    uint64_t hits;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_CACHINGNORTHBOUNDSTORE_H
