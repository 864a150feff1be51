/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of abstract OVSDB messages
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "OvsdbMessage.h"

namespace ovnpolicy {

void OvsdbMessage::serialize(OvsdbWriter& writer) const {
    writer.StartObject();
    writer.Key("method");
    writer.String(method.c_str());
    writer.Key("params");
    (*this)(writer);
    writer.Key("id");
    writer.Uint64(reqId);
    writer.EndObject();
}

std::string OvsdbMessage::toString() const {
    rapidjson::StringBuffer buffer;
    OvsdbWriter writer(buffer);
    serialize(writer);
    return buffer.GetString();
}

static const char* OvsdbOperationStrings[] = {"select", "insert", "update", "mutate", "delete"};

const char* OvsdbMessage::toString(OvsdbOperation operation) {
    return OvsdbOperationStrings[static_cast<uint32_t>(operation)];
}

static const char* OvsdbTableStrings[] = {"Logical_Switch", "Logical_Switch_Port", "Logical_Router",
                                          "Logical_Router_Port", "ACL", "Address_Set", "Port_Group",
                                          "DHCP_Options", "NAT", "Load_Balancer"};

const char* OvsdbMessage::toString(OvsdbTable table) {
    return OvsdbTableStrings[static_cast<uint32_t>(table)];
}

static const char* OvsdbFunctionStrings[] = {"==", "includes"};

const char* OvsdbMessage::toString(OvsdbFunction function) {
    return OvsdbFunctionStrings[static_cast<uint32_t>(function)];
}

void writeValue(OvsdbWriter& writer, const OvsdbValue& value) {
    if (value.getType() == Dtype::INTEGER) {
        writer.Int(value.getIntValue());
    } else if (value.getType() == Dtype::STRING) {
        if (!value.getKey().empty()) {
            writer.StartArray();
            writer.String(value.getKey().c_str());
        }
        writer.String(value.getStringValue().c_str());
        if (!value.getKey().empty()) {
            writer.EndArray();
        }
    } else if (value.getType() == Dtype::BOOL) {
        writer.Bool(value.getBoolValue());
    } else if (value.getType() == Dtype::MAP) {
        writer.StartArray();
        writer.String("map");
        writer.StartArray();
        for (auto& it : value.getCollectionValue()) {
            writer.StartArray();
            writer.String(it.first.c_str());
            writer.String(it.second.c_str());
            writer.EndArray();
        }
        writer.EndArray();
        writer.EndArray();
    } else if (value.getType() == Dtype::SET) {
        // members of a set of references carry the atom type as the key
        writer.StartArray();
        writer.String("set");
        writer.StartArray();
        for (auto& it : value.getCollectionValue()) {
            if (value.getKey().empty()) {
                writer.String(it.first.c_str());
            } else {
                writer.StartArray();
                writer.String(value.getKey().c_str());
                writer.String(it.first.c_str());
                writer.EndArray();
            }
        }
        writer.EndArray();
        writer.EndArray();
    }
}

} /* namespace ovnpolicy */
