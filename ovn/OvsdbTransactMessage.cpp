/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of JSON-RPC transact messages
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "OvsdbTransactMessage.h"

namespace ovnpolicy {

void OvsdbTransactMessage::serializePayload(OvsdbWriter& writer) const {
    if (!externalKey.first.empty()) {
        writer.Key(externalKey.first.c_str());
        writer.String(externalKey.second.c_str());
    }
    if (getOperation() != OvsdbOperation::INSERT) {
        writer.Key("where");
        writer.StartArray();
        for (auto& elem : conditions) {
            writer.StartArray();
            writer.String(elem.column.c_str());
            writer.String(OvsdbMessage::toString(elem.function));
            writeValue(writer, elem.value);
            writer.EndArray();
        }
        writer.EndArray();
    }
    writer.Key("table");
    writer.String(OvsdbMessage::toString(getTable()));
    writer.Key("op");
    writer.String(OvsdbMessage::toString(getOperation()));
    if (!columns.empty()) {
        writer.Key("columns");
        writer.StartArray();
        for (auto& tmp : columns) {
            writer.String(tmp.c_str());
        }
        writer.EndArray();
    }

    if (getOperation() == OvsdbOperation::INSERT ||
        getOperation() == OvsdbOperation::UPDATE) {
        writer.Key("row");
        writer.StartObject();
        for (auto& rowEntry : rowData) {
            writer.Key(rowEntry.first.c_str());
            writeValue(writer, rowEntry.second);
        }
        writer.EndObject();
    }
    if (getOperation() == OvsdbOperation::MUTATE) {
        writer.Key("mutations");
        writer.StartArray();
        for (auto& rowEntry : mutateRowData) {
            writer.StartArray();
            writer.String(rowEntry.first.c_str());
            writer.String(OvsdbMessage::toString(rowEntry.second.first));
            writeValue(writer, rowEntry.second.second);
            writer.EndArray();
        }
        writer.EndArray();
    }
}

bool TransactReq::operator()(OvsdbWriter& writer) const {
    writer.StartArray();
    writer.String(OVN_NORTHBOUND.c_str());
    for (auto& tr : transList) {
        writer.StartObject();
        tr.serializePayload(writer);
        writer.EndObject();
    }
    writer.EndArray();
    return true;
}

std::string EchoReply::toString() const {
    return "{\"result\":" + params + ",\"error\":null,\"id\":" + id + "}";
}

} /* namespace ovnpolicy */
