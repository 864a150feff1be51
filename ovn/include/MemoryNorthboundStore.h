/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file MemoryNorthboundStore.h
 * @brief In-memory northbound database
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_MEMORYNORTHBOUNDSTORE_H
#define OVNPOLICY_MEMORYNORTHBOUNDSTORE_H

#include "NorthboundStore.h"
#include <ovnpolicy/IdGenerator.h>

#include <atomic>
#include <memory>
#include <shared_mutex>

namespace ovnpolicy {

/**
 * A northbound database held in memory.  Enforces the constraints a
 * real server would: unique row ids, unique names on indexed tables,
 * strong references to existing rows, removal of unreferenced
 * non-root rows and of dangling weak references.
 */
class MemoryNorthboundStore : public NorthboundStore {
public:
    /**
     * @param idGenerator source of row ids for inserts that do not
     * name their uuid
     */
    explicit MemoryNorthboundStore(std::shared_ptr<IdGenerator> idGenerator =
                                   std::make_shared<RandomIdGenerator>());

    virtual ~MemoryNorthboundStore() {}

    virtual bool isConnected() const override;
    virtual void transact(const std::list<OvsdbTransactMessage>& operations) override;
    virtual void select(OvsdbTable table, const OvsdbConditions& conditions,
                        OvsdbTableDetails& rows) override;
    virtual void close() override;

private:
    void apply(OvsdbState& working, const OvsdbTransactMessage& op);
    void mutate(OvsdbRowDetails& row, const OvsdbTransactMessage& op);
    void collectGarbage(OvsdbState& working);
    void checkConstraints(const OvsdbState& working);

    std::shared_ptr<IdGenerator> idGenerator;
    OvsdbState state;
    mutable std::shared_timed_mutex stateMutex;
    std::atomic<bool> open;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_MEMORYNORTHBOUNDSTORE_H
