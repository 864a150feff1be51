/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file OvsdbNorthboundStore.h
 * @brief Northbound backend over a live OVSDB server
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_OVSDBNORTHBOUNDSTORE_H
#define OVNPOLICY_OVSDBNORTHBOUNDSTORE_H

#include "NorthboundStore.h"
#include "OvsdbConnection.h"

#include <rapidjson/document.h>

namespace ovnpolicy {

/**
 * Northbound backend that sends transactions to an OVSDB server
 */
class OvsdbNorthboundStore : public NorthboundStore {
public:
    /**
     * Connect to the server named in the configuration
     *
     * @param config connection settings
     * @throws ConnectionError if the first connection attempt fails
     */
    explicit OvsdbNorthboundStore(const NorthboundConfig& config);

    virtual ~OvsdbNorthboundStore() {}

    virtual bool isConnected() const override;
    virtual void transact(const std::list<OvsdbTransactMessage>& operations) override;
    virtual void select(OvsdbTable table, const OvsdbConditions& conditions,
                        OvsdbTableDetails& rows) override;
    virtual void close() override;

    /**
     * Decode a row object of a select result
     *
     * @param value the row object
     * @param row receives the decoded columns
     */
    static void decodeRow(const rapidjson::Value& value, OvsdbRowDetails& row);

    /**
     * Check a transact reply for errors
     *
     * @param reply the reply
     * @throws TransactionError if the reply or any operation failed
     */
    static void checkReply(const rapidjson::Document& reply);

private:
    OvsdbConnection connection;
    bool closed;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_OVSDBNORTHBOUNDSTORE_H
