/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the OVSDB northbound backend
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "OvsdbNorthboundStore.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/logging.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace ovnpolicy {

using rapidjson::Value;

namespace {

std::string toJson(const Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return buffer.GetString();
}

/**
 * Decode an atom, returning its type tag ("uuid" for references)
 */
std::string decodeAtom(const Value& value, std::string& atom) {
    if (value.IsString()) {
        atom = value.GetString();
    } else if (value.IsArray() && value.Size() == 2 && value[0].IsString() &&
               value[1].IsString()) {
        atom = value[1].GetString();
        return value[0].GetString();
    } else if (value.IsInt64()) {
        atom = std::to_string(value.GetInt64());
    } else if (value.IsBool()) {
        atom = value.GetBool() ? "true" : "false";
    } else if (value.IsDouble()) {
        atom = std::to_string(value.GetDouble());
    } else {
        LOG(WARNING) << "Unexpected atom " << toJson(value);
    }
    return "";
}

} /* anonymous namespace */

OvsdbNorthboundStore::OvsdbNorthboundStore(const NorthboundConfig& config)
    : connection(config), closed(false) {
    connection.connect();
}

bool OvsdbNorthboundStore::isConnected() const {
    return !closed && connection.isConnected();
}

void OvsdbNorthboundStore::close() {
    closed = true;
    connection.disconnect();
}

void OvsdbNorthboundStore::decodeRow(const Value& value,
                                     OvsdbRowDetails& row) {
    if (!value.IsObject())
        return;
    for (Value::ConstMemberIterator itr = value.MemberBegin();
         itr != value.MemberEnd(); ++itr) {
        if (!itr->name.IsString())
            continue;
        const std::string column = itr->name.GetString();
        const Value& v = itr->value;
        if (v.IsString()) {
            row[column] = OvsdbValue(std::string(v.GetString()));
        } else if (v.IsBool()) {
            row[column] = OvsdbValue(v.GetBool());
        } else if (v.IsInt()) {
            row[column] = OvsdbValue(v.GetInt());
        } else if (v.IsArray() && v.Size() == 2 && v[0].IsString()) {
            const std::string arrayType = v[0].GetString();
            if (arrayType == "uuid" && v[1].IsString()) {
                row[column] = OvsdbValue("uuid", v[1].GetString());
            } else if (arrayType == "set" && v[1].IsArray()) {
                std::map<std::string, std::string> members;
                std::string atomKey;
                for (auto& m : v[1].GetArray()) {
                    std::string atom;
                    std::string key = decodeAtom(m, atom);
                    if (!key.empty())
                        atomKey = key;
                    members[atom];
                }
                row[column] = OvsdbValue(Dtype::SET, atomKey, members);
            } else if (arrayType == "map" && v[1].IsArray()) {
                std::map<std::string, std::string> items;
                for (auto& m : v[1].GetArray()) {
                    if (!m.IsArray() || m.Size() != 2)
                        continue;
                    std::string key, val;
                    decodeAtom(m[0], key);
                    decodeAtom(m[1], val);
                    items[key] = val;
                }
                row[column] = OvsdbValue(Dtype::MAP, "", items);
            } else {
                LOG(WARNING) << "Unexpected array type of " << arrayType
                             << " in column " << column;
            }
        } else {
            LOG(WARNING) << "Unexpected value in column " << column << ": "
                         << toJson(v);
        }
    }
}

void OvsdbNorthboundStore::checkReply(const rapidjson::Document& reply) {
    if (reply.HasMember("error") && !reply["error"].IsNull()) {
        const Value& error = reply["error"];
        if (error.IsString())
            throw TransactionError(error.GetString(), "");
        if (error.IsObject() && error.HasMember("error") &&
            error["error"].IsString()) {
            std::string details;
            if (error.HasMember("details") && error["details"].IsString())
                details = error["details"].GetString();
            throw TransactionError(error["error"].GetString(), details);
        }
        throw TransactionError(toJson(error), "");
    }
    if (!reply.HasMember("result") || !reply["result"].IsArray())
        throw TransactionError("malformed reply", toJson(reply));
    for (auto& res : reply["result"].GetArray()) {
        if (!res.IsObject() || !res.HasMember("error") ||
            res["error"].IsNull())
            continue;
        std::string details;
        if (res.HasMember("details") && res["details"].IsString())
            details = res["details"].GetString();
        std::string error = res["error"].IsString()
            ? res["error"].GetString() : toJson(res["error"]);
        throw TransactionError(error, details);
    }
}

void OvsdbNorthboundStore::
transact(const std::list<OvsdbTransactMessage>& operations) {
    if (closed)
        throw ConnectionError("Northbound store is closed");
    if (operations.empty())
        return;
    TransactReq req(operations, connection.getNextId());
    rapidjson::Document reply;
    connection.sendRequest(req, reply);
    try {
        checkReply(reply);
    } catch (const TransactionError& e) {
        LOG(ERROR) << "Transaction " << req.getReqId() << " failed: "
                   << e.what();
        throw;
    }
}

void OvsdbNorthboundStore::
select(OvsdbTable table, const OvsdbConditions& conditions,
       OvsdbTableDetails& rows) {
    if (closed)
        throw ConnectionError("Northbound store is closed");
    OvsdbTransactMessage msg(OvsdbOperation::SELECT, table);
    msg.conditions = conditions;
    TransactReq req({msg}, connection.getNextId());
    rapidjson::Document reply;
    connection.sendRequest(req, reply);
    checkReply(reply);

    const Value& result = reply["result"];
    if (result.Size() == 0 || !result[0].IsObject() ||
        !result[0].HasMember("rows") || !result[0]["rows"].IsArray())
        throw TransactionError("malformed reply", toJson(reply));
    for (auto& r : result[0]["rows"].GetArray()) {
        OvsdbRowDetails row;
        decodeRow(r, row);
        auto uit = row.find(UUID_COLUMN);
        if (uit == row.end()) {
            LOG(WARNING) << "Ignoring " << OvsdbMessage::toString(table)
                         << " row without _uuid";
            continue;
        }
        rows[uit->second.getStringValue()] = row;
    }
}

} /* namespace ovnpolicy */
