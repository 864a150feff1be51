/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the OVSDB JSON-RPC connection
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "OvsdbConnection.h"
#include "OvsdbTransactMessage.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/logging.h>

#include <boost/algorithm/string/predicate.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cctype>
#include <thread>
#include <vector>

namespace ovnpolicy {

using boost::asio::generic::stream_protocol;
using boost::system::error_code;

namespace {

std::string toJson(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return buffer.GetString();
}

} /* anonymous namespace */

OvsdbAddress OvsdbAddress::parse(const std::string& address) {
    OvsdbAddress result;
    if (address.empty())
        throw ConnectionError("Northbound address is empty");
    if (boost::starts_with(address, "ssl:"))
        throw ConnectionError("SSL northbound connections are not supported: " +
                              address);
    if (boost::starts_with(address, "unix:")) {
        result.unixSocket = true;
        result.path = address.substr(5);
        if (result.path.empty())
            throw ConnectionError("Missing socket path in " + address);
        return result;
    }
    if (boost::starts_with(address, "tcp:")) {
        std::string rest = address.substr(4);
        size_t colon = rest.rfind(':');
        if (colon == std::string::npos || colon == 0 ||
            colon + 1 == rest.size())
            throw ConnectionError("Invalid northbound address " + address);
        result.host = rest.substr(0, colon);
        result.port = rest.substr(colon + 1);
        // bracketed IPv6 literal
        if (result.host.size() > 2 && result.host.front() == '[' &&
            result.host.back() == ']')
            result.host = result.host.substr(1, result.host.size() - 2);
        if (result.port.size() > 5 ||
            !std::all_of(result.port.begin(), result.port.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            std::stoul(result.port) > 65535)
            throw ConnectionError("Invalid port in northbound address " +
                                  address);
        return result;
    }
    throw ConnectionError("Unsupported northbound address " + address);
}

OvsdbConnection::OvsdbConnection(const NorthboundConfig& config)
    : remote(config.getAddress()),
      address(OvsdbAddress::parse(config.getAddress())),
      connectTimeout(config.getConnectTimeout()),
      requestTimeout(config.getRequestTimeout()),
      reconnectInterval(config.getReconnectInterval()),
      maxReconnectAttempts(config.getMaxReconnectAttempts()),
      connected(false), id(0) {
}

OvsdbConnection::~OvsdbConnection() {
    disconnect();
}

void OvsdbConnection::connect() {
    std::unique_lock<std::mutex> lock(connMutex);
    connectOnce();
}

void OvsdbConnection::disconnect() {
    std::unique_lock<std::mutex> lock(connMutex);
    if (connected)
        LOG(INFO) << "Disconnecting from northbound database at " << remote;
    closeSocket();
}

void OvsdbConnection::closeSocket() {
    if (socket) {
        error_code ec;
        socket->close(ec);
        if (ec)
            LOG(DEBUG) << "Error closing socket: " << ec.message();
        socket.reset();
    }
    connected = false;
    framer.reset();
}

void OvsdbConnection::runUntil(deadline_t deadline, const bool& done,
                               const std::string& what) {
    io.restart();
    auto now = std::chrono::steady_clock::now();
    if (deadline > now)
        io.run_for(deadline - now);
    if (!done) {
        // cancel and let the aborted handler run before its state goes away
        error_code ec;
        socket->close(ec);
        io.restart();
        io.run();
        throw ConnectionError("Timed out " + what);
    }
}

void OvsdbConnection::connectOnce() {
    closeSocket();
    deadline_t deadline = std::chrono::steady_clock::now() + connectTimeout;

    std::vector<stream_protocol::endpoint> endpoints;
    if (address.unixSocket) {
        endpoints.emplace_back(
            boost::asio::local::stream_protocol::endpoint(address.path));
    } else {
        boost::asio::ip::tcp::resolver resolver(io);
        error_code ec;
        auto results = resolver.resolve(address.host, address.port, ec);
        if (ec)
            throw ConnectionError("Could not resolve " + address.host + ": " +
                                  ec.message());
        for (auto& r : results)
            endpoints.emplace_back(r.endpoint());
    }

    error_code last = boost::asio::error::host_not_found;
    for (auto& ep : endpoints) {
        socket.reset(new stream_protocol::socket(io));
        bool done = false;
        error_code result;
        socket->async_connect(ep, [&](const error_code& ec) {
                done = true;
                result = ec;
            });
        runUntil(deadline, done, "connecting to " + remote);
        if (!result) {
            connected = true;
            LOG(INFO) << "Connected to northbound database at " << remote;
            return;
        }
        last = result;
    }
    closeSocket();
    throw ConnectionError("Could not connect to " + remote + ": " +
                          last.message());
}

void OvsdbConnection::reconnect() {
    uint32_t attempts = std::max<uint32_t>(1, maxReconnectAttempts);
    for (uint32_t i = 1; ; ++i) {
        try {
            connectOnce();
            return;
        } catch (const ConnectionError& e) {
            LOG(WARNING) << "Reconnect attempt " << i << " of " << attempts
                         << " failed: " << e.what();
            if (i >= attempts)
                throw;
        }
        std::this_thread::sleep_for(reconnectInterval);
    }
}

void OvsdbConnection::writeAll(const std::string& data, deadline_t deadline) {
    bool done = false;
    error_code result;
    boost::asio::async_write(*socket, boost::asio::buffer(data),
                             [&](const error_code& ec, std::size_t) {
                                 done = true;
                                 result = ec;
                             });
    runUntil(deadline, done, "writing to " + remote);
    if (result)
        throw ConnectionError("Write to " + remote + " failed: " +
                              result.message());
}

std::string OvsdbConnection::readMessage(deadline_t deadline) {
    char buf[8192];
    while (!framer.hasMessage()) {
        bool done = false;
        error_code result;
        std::size_t count = 0;
        socket->async_read_some(boost::asio::buffer(buf),
                                [&](const error_code& ec, std::size_t n) {
                                    done = true;
                                    result = ec;
                                    count = n;
                                });
        runUntil(deadline, done, "waiting for reply from " + remote);
        if (result == boost::asio::error::eof)
            throw ConnectionError("Connection closed by " + remote);
        if (result)
            throw ConnectionError("Read from " + remote + " failed: " +
                                  result.message());
        try {
            framer.feed(buf, count);
        } catch (const std::runtime_error& e) {
            throw ConnectionError(e.what());
        }
    }
    return framer.nextMessage();
}

void OvsdbConnection::handleServerRequest(const rapidjson::Document& request,
                                          deadline_t deadline) {
    const std::string method = request["method"].GetString();
    if (method != "echo") {
        LOG(DEBUG) << "Ignoring " << method << " from " << remote;
        return;
    }
    if (!request.HasMember("id") || request["id"].IsNull())
        return;
    std::string params = request.HasMember("params")
        ? toJson(request["params"]) : std::string("[]");
    EchoReply echo(toJson(request["id"]), params);
    writeAll(echo.toString(), deadline);
}

void OvsdbConnection::sendRequest(const OvsdbMessage& msg,
                                  rapidjson::Document& reply) {
    std::unique_lock<std::mutex> lock(connMutex);
    if (!connected)
        reconnect();

    deadline_t deadline = std::chrono::steady_clock::now() + requestTimeout;
    try {
        std::string payload = msg.toString();
        LOG(DEBUG) << "Sending " << msg.getMethod() << " request "
                   << msg.getReqId();
        writeAll(payload, deadline);
        while (true) {
            std::string text = readMessage(deadline);
            rapidjson::Document doc;
            doc.Parse(text.c_str());
            if (doc.HasParseError() || !doc.IsObject())
                throw ConnectionError("Malformed JSON-RPC message from " +
                                      remote);
            if (doc.HasMember("method") && doc["method"].IsString()) {
                handleServerRequest(doc, deadline);
                continue;
            }
            if (doc.HasMember("id") && doc["id"].IsUint64() &&
                doc["id"].GetUint64() == msg.getReqId()) {
                reply.Swap(doc);
                return;
            }
            LOG(DEBUG) << "Ignoring unexpected message from " << remote;
        }
    } catch (const ConnectionError& e) {
        LOG(ERROR) << "Request to " << remote << " failed: " << e.what();
        closeSocket();
        throw;
    }
}

} /* namespace ovnpolicy */
