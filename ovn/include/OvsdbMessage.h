/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file OvsdbMessage.h
 * @brief Interface definition for OVSDB JSON-RPC messages and values
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_OVSDBMESSAGE_H
#define OVNPOLICY_OVSDBMESSAGE_H

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ovnpolicy {

/**
 * Writer used to serialize OVSDB messages
 */
typedef rapidjson::Writer<rapidjson::StringBuffer> OvsdbWriter;

/**
 * OVSDB operations.  INSERT and DELETE double as the set/map mutators.
 */
enum class OvsdbOperation {SELECT, INSERT, UPDATE, MUTATE, DELETE};

/**
 * OVN northbound tables
 */
enum class OvsdbTable {LOGICAL_SWITCH, LOGICAL_SWITCH_PORT, LOGICAL_ROUTER,
                       LOGICAL_ROUTER_PORT, ACL, ADDRESS_SET, PORT_GROUP,
                       DHCP_OPTIONS, NAT, LOAD_BALANCER};

/**
 * OVSDB functions
 */
enum class OvsdbFunction {EQ, INCLUDES};

/**
 * Name of the northbound database schema
 */
const std::string OVN_NORTHBOUND("OVN_Northbound");

/**
 * Abstract OVSDB message
 */
class OvsdbMessage {
public:

    /**
     * Construct an OVSDB message
     *
     * @param method_ the method for the message
     * @param reqId_ request ID
     */
    OvsdbMessage(const std::string& method_, uint64_t reqId_ = 0) :
        method(method_), reqId(reqId_) {
    }

    /**
     * Destructor
     */
    virtual ~OvsdbMessage() = default;

    /**
     * Get request ID
     * @return request ID
     */
    uint64_t getReqId() const {
        return reqId;
    }

    /**
     * Get the method
     */
    const std::string& getMethod() const {
        return method;
    }

    /**
     * Serialize the complete request {"method", "params", "id"}
     * @param writer writer
     */
    void serialize(OvsdbWriter& writer) const;

    /**
     * Serialize the request to a string
     */
    std::string toString() const;

    /**
     * Operator to serialize the params array to a writer
     * @param writer the writer to serialize to
     */
    virtual bool operator()(OvsdbWriter& writer) const = 0;

    /**
     * Convert table to string
     * @param table OVSDB table
     * @return table as string
     */
    static const char* toString(OvsdbTable table);

    /**
     * Convert operation to string
     * @param operation OVSDB operation
     * @return operation as string
     */
    static const char* toString(OvsdbOperation operation);

    /**
     * Convert function to string
     * @param function OVSDB function
     * @return function as string
     */
    static const char* toString(OvsdbFunction function);

private:
    std::string method;
    uint64_t reqId;
};

/**
 * enum for data types to be sent over JSON/RPC
 */
enum class Dtype {STRING, INTEGER, BOOL, SET, MAP};

/**
 * Class to represent an OVSDB value.  A STRING value with a key is
 * written as a pair, e.g. ["uuid", "..."] or a map entry.  SET values
 * keep their members as the keys of the collection.
 */
class OvsdbValue {
public:
    /** Default constructor */
    OvsdbValue() : type(Dtype::STRING), iVal(-1), bVal(false) {}

    /**
     * constructor
     * @param val value
     */
    explicit OvsdbValue(std::string val) : type(Dtype::STRING), sVal(std::move(val)), iVal(-1), bVal(false) {}

    /**
     * constructor
     * @param key_ the key string
     * @param val value
     */
    OvsdbValue(std::string key_, std::string val) : key(std::move(key_)), type(Dtype::STRING), sVal(std::move(val)), iVal(-1), bVal(false) {}

    /**
     * constructor
     * @param val value
     */
    explicit OvsdbValue(bool val) : type(Dtype::BOOL), iVal(-1), bVal(val) {}

    /**
     * constructor
     * @param val value
     */
    explicit OvsdbValue(int val) : type(Dtype::INTEGER), iVal(val), bVal(false) {}

    /**
     * constructor
     * @param type_ type of collection
     * @param key_ the key string
     * @param val value
     */
    OvsdbValue(Dtype type_, std::string key_, std::map<std::string, std::string> val) : key(std::move(key_)), type(type_), iVal(-1), bVal(false), collection(std::move(val)) {}

    /**
     * Copy constructor
     *
     * @param copy Object to copy from
     */
    OvsdbValue(const OvsdbValue& copy) = default;

    /**
     * Assignment operator
     */
    OvsdbValue& operator=(const OvsdbValue& rhs) = default;

    /**
     * Move operator
     */
    OvsdbValue& operator=(OvsdbValue&&) = default;

    /**
     * Destructor
     */
    virtual ~OvsdbValue() = default;

    /** Get key */
    const std::string& getKey() const {
        return key;
    }

    /**
     * get the data type
     * @return enum Dtype
     */
    Dtype getType() const {
        return type;
    }

    /**
     * Get the value when set to string type
     */
    const std::string& getStringValue() const {
        return sVal;
    }

    /**
     * Get the value when set to bool type
     */
    bool getBoolValue() const {
        return bVal;
    }

    /**
     * Get the value when set to int type
     */
    int getIntValue() const {
        return iVal;
    }

    /**
     * Get the value when set to a collection type
     */
    const std::map<std::string, std::string>& getCollectionValue() const {
        return collection;
    }

    /**
     * Equality over type and contents
     */
    bool operator==(const OvsdbValue& rhs) const {
        return type == rhs.type && key == rhs.key && sVal == rhs.sVal &&
            iVal == rhs.iVal && bVal == rhs.bVal &&
            collection == rhs.collection;
    }

private:
    std::string key;
    Dtype type;
    std::string sVal;
    int iVal;
    bool bVal;
    std::map<std::string, std::string> collection;
};

/**
 * A clause of a "where" array: column, function and value
 */
struct OvsdbCondition {
    /**
     * @param column_ the column the clause tests
     * @param function_ the comparison
     * @param value_ the right hand side
     */
    OvsdbCondition(std::string column_, OvsdbFunction function_,
                   OvsdbValue value_)
        : column(std::move(column_)), function(function_),
          value(std::move(value_)) {}

    /** column name, "_uuid" for the row id */
    std::string column;
    /** comparison function */
    OvsdbFunction function;
    /** right hand side */
    OvsdbValue value;
};

/**
 * A conjunction of conditions
 */
typedef std::vector<OvsdbCondition> OvsdbConditions;

/**
 * Write a single value in OVSDB notation
 *
 * @param writer the writer
 * @param value the value
 */
void writeValue(OvsdbWriter& writer, const OvsdbValue& value);

} /* namespace ovnpolicy */
#endif //OVNPOLICY_OVSDBMESSAGE_H
