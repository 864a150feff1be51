/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NorthboundStore.h
 * @brief Interface to a northbound database backend
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NORTHBOUNDSTORE_H
#define OVNPOLICY_NORTHBOUNDSTORE_H

#include "OvsdbState.h"
#include "OvsdbTransactMessage.h"

#include <boost/noncopyable.hpp>

#include <list>

namespace ovnpolicy {

/**
 * A northbound database backend: a live OVSDB server, an in-memory
 * database or a decorator over either
 */
class NorthboundStore : private boost::noncopyable {
public:
    virtual ~NorthboundStore() {}

    /**
     * Check whether the backend is usable
     */
    virtual bool isConnected() const = 0;

    /**
     * Apply a list of operations atomically.  Either all operations
     * take effect or none do.
     *
     * @param operations the operations in order
     * @throws TransactionError if the database rejects the transaction
     * @throws ConnectionError if the backend cannot be reached
     */
    virtual void transact(const std::list<OvsdbTransactMessage>& operations) = 0;

    /**
     * Read the rows of a table that match all conditions
     *
     * @param table the table
     * @param conditions conditions, empty to read the whole table
     * @param rows receives matching rows keyed by uuid
     * @throws ConnectionError if the backend cannot be reached
     */
    virtual void select(OvsdbTable table, const OvsdbConditions& conditions,
                        OvsdbTableDetails& rows) = 0;

    /**
     * Release the backend.  Further calls fail with ConnectionError.
     */
    virtual void close() = 0;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_NORTHBOUNDSTORE_H
