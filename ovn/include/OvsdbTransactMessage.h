/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file OvsdbTransactMessage.h
 * @brief Interface definition for OVSDB transact messages
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_OVSDBTRANSACTMESSAGE_H
#define OVNPOLICY_OVSDBTRANSACTMESSAGE_H

#include "OvsdbMessage.h"

#include <list>
#include <set>
#include <unordered_map>

namespace ovnpolicy {

/**
 * A single operation of an OVSDB transaction
 */
class OvsdbTransactMessage {
public:
    /**
     * Construct a transact message
     * @param operation_ the operation
     * @param table_ the target table
     */
    OvsdbTransactMessage(OvsdbOperation operation_, OvsdbTable table_)
        : operation(operation_), table(table_) {}

    /**
     * Serialize the operation object members
     *
     * @param writer the writer to serialize to
     */
    void serializePayload(OvsdbWriter& writer) const;

    /**
     * Get the operation
     */
    OvsdbOperation getOperation() const {
        return operation;
    }

    /**
     * Get the table
     */
    OvsdbTable getTable() const {
        return table;
    }

    /**
     * conditions of the "where" clause
     */
    OvsdbConditions conditions;

    /**
     * columns to select, empty for all
     */
    std::set<std::string> columns;

    /**
     * row data for insert and update
     */
    std::unordered_map<std::string, OvsdbValue> rowData;

    /**
     * mutations keyed by column; the operation is INSERT or DELETE
     */
    std::unordered_map<std::string,
                       std::pair<OvsdbOperation, OvsdbValue>> mutateRowData;

    /**
     * external key for an insert, typically {"uuid", <uuid>}
     */
    std::pair<std::string, std::string> externalKey;

private:
    OvsdbOperation operation;
    OvsdbTable table;
};

/**
 * A transact request over the northbound database
 */
class TransactReq : public OvsdbMessage {
public:
    /**
     * Construct a transact request
     * @param tl the operations, applied atomically
     * @param reqId request ID
     */
    TransactReq(const std::list<OvsdbTransactMessage>& tl, uint64_t reqId)
        : OvsdbMessage("transact", reqId), transList(tl) {
    }

    virtual ~TransactReq() {}

    virtual bool operator()(OvsdbWriter& writer) const;

private:
    std::list<OvsdbTransactMessage> transList;
};

/**
 * A reply to an echo request from the server
 */
class EchoReply {
public:
    /**
     * @param id_ the request ID being echoed, serialized JSON
     * @param params_ the request params, serialized JSON
     */
    EchoReply(std::string id_, std::string params_)
        : id(std::move(id_)), params(std::move(params_)) {}

    /**
     * Serialize to a string
     */
    std::string toString() const;

private:
    std::string id;
    std::string params;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_OVSDBTRANSACTMESSAGE_H
