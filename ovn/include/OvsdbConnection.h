/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file OvsdbConnection.h
 * @brief JSON-RPC connection to an OVSDB server
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_OVSDBCONNECTION_H
#define OVNPOLICY_OVSDBCONNECTION_H

#include "JsonRpcFramer.h"
#include "OvsdbMessage.h"
#include <ovnpolicy/NorthboundConfig.h>

#include <boost/asio.hpp>
#include <boost/noncopyable.hpp>
#include <rapidjson/document.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace ovnpolicy {

/**
 * A parsed OVSDB remote, "tcp:<host>:<port>" or "unix:<path>"
 */
struct OvsdbAddress {
    /** true for a unix domain socket */
    bool unixSocket = false;
    /** host for tcp */
    std::string host;
    /** port for tcp */
    std::string port;
    /** socket path for unix */
    std::string path;

    /**
     * Parse a remote address
     *
     * @param address the address
     * @return the parsed address
     * @throws ConnectionError if the address is empty, malformed or
     * names an unsupported transport
     */
    static OvsdbAddress parse(const std::string& address);
};

/**
 * Synchronous JSON-RPC connection to an OVSDB server.  One request is
 * outstanding at a time; echo requests from the server are answered
 * while waiting for a reply.
 */
class OvsdbConnection : private boost::noncopyable {
public:
    /**
     * @param config connection settings
     * @throws ConnectionError if the address is invalid
     */
    explicit OvsdbConnection(const NorthboundConfig& config);

    ~OvsdbConnection();

    /**
     * Make a single connection attempt bounded by the connect timeout
     * @throws ConnectionError on failure
     */
    void connect();

    /**
     * Close the socket
     */
    void disconnect();

    /**
     * Check whether the socket is up
     */
    bool isConnected() const {
        return connected;
    }

    /**
     * Send a request and wait for its reply, bounded by the request
     * timeout.  A connection that is already down is re-established
     * first, trying up to the configured number of attempts.
     *
     * @param msg the request
     * @param reply receives the reply object
     * @throws ConnectionError if the server cannot be reached, the
     * request times out or the connection drops
     */
    void sendRequest(const OvsdbMessage& msg, rapidjson::Document& reply);

    /**
     * Get the next request ID
     */
    uint64_t getNextId() { return ++id; }

    /**
     * Get the remote address
     */
    const std::string& getRemote() const { return remote; }

private:
    typedef std::chrono::steady_clock::time_point deadline_t;

    void connectOnce();
    void reconnect();
    void closeSocket();
    void runUntil(deadline_t deadline, const bool& done,
                  const std::string& what);
    void writeAll(const std::string& data, deadline_t deadline);
    std::string readMessage(deadline_t deadline);
    void handleServerRequest(const rapidjson::Document& request,
                             deadline_t deadline);

    std::string remote;
    OvsdbAddress address;
    std::chrono::milliseconds connectTimeout;
    std::chrono::milliseconds requestTimeout;
    std::chrono::milliseconds reconnectInterval;
    uint32_t maxReconnectAttempts;

    boost::asio::io_service io;
    std::unique_ptr<boost::asio::generic::stream_protocol::socket> socket;
    JsonRpcFramer framer;
    std::mutex connMutex;
    std::atomic<bool> connected;
    std::atomic<uint64_t> id;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_OVSDBCONNECTION_H
