/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NorthboundConfig.h
 * @brief Settings for the northbound client
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_NORTHBOUNDCONFIG_H
#define OVNPOLICY_NORTHBOUNDCONFIG_H

#include <boost/property_tree/ptree_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace ovnpolicy {

/**
 * Connection, retry, cache and logging settings.  Defaults apply to
 * anything not present in the property tree.
 */
class NorthboundConfig {
public:
    /**
     * Construct a configuration holding the defaults
     */
    NorthboundConfig();

    /**
     * Apply settings from a property tree.  Settings not present keep
     * their current value.
     *
     * @param properties the configuration tree
     * @throws ConfigError on invalid values
     */
    void setProperties(const boost::property_tree::ptree& properties);

    /** Address of the northbound database, "tcp:host:port" or
        "unix:path" */
    const std::string& getAddress() const { return address; }
    /** Set the northbound address */
    void setAddress(const std::string& address_) { address = address_; }

    /** Bound on establishing a connection */
    std::chrono::milliseconds getConnectTimeout() const {
        return connectTimeout;
    }
    /** Set the connect timeout */
    void setConnectTimeout(std::chrono::milliseconds timeout) {
        connectTimeout = timeout;
    }

    /** Bound on a single request/reply exchange */
    std::chrono::milliseconds getRequestTimeout() const {
        return requestTimeout;
    }
    /** Set the request timeout */
    void setRequestTimeout(std::chrono::milliseconds timeout) {
        requestTimeout = timeout;
    }

    /** Delay between reconnect attempts */
    std::chrono::milliseconds getReconnectInterval() const {
        return reconnectInterval;
    }
    /** Set the reconnect interval */
    void setReconnectInterval(std::chrono::milliseconds interval) {
        reconnectInterval = interval;
    }

    /** Reconnect attempts before a request fails */
    uint32_t getMaxReconnectAttempts() const { return maxReconnectAttempts; }
    /** Set the maximum number of reconnect attempts */
    void setMaxReconnectAttempts(uint32_t attempts) {
        maxReconnectAttempts = attempts;
    }

    /** Use the in-memory store if the database is unreachable */
    bool getUseMockOnFailure() const { return useMockOnFailure; }
    /** Enable or disable fallback to the in-memory store */
    void setUseMockOnFailure(bool use) { useMockOnFailure = use; }

    /** Cache switch, port, router and ACL reads */
    bool isCacheEnabled() const { return cacheEnabled; }
    /** Enable or disable the read cache */
    void setCacheEnabled(bool enabled) { cacheEnabled = enabled; }

    /** Lifetime of a cached read */
    std::chrono::milliseconds getCacheTtl() const { return cacheTtl; }
    /** Set the cache lifetime */
    void setCacheTtl(std::chrono::milliseconds ttl) { cacheTtl = ttl; }

    /** Log level name */
    const std::string& getLogLevel() const { return logLevel; }
    /** Log file, empty for the console */
    const std::string& getLogFile() const { return logFile; }
    /** Whether to log to syslog */
    bool getLogToSyslog() const { return logToSyslog; }

private:
    std::string address;
    std::chrono::milliseconds connectTimeout;
    std::chrono::milliseconds requestTimeout;
    std::chrono::milliseconds reconnectInterval;
    uint32_t maxReconnectAttempts;
    bool useMockOnFailure;
    bool cacheEnabled;
    std::chrono::milliseconds cacheTtl;
    std::string logLevel;
    std::string logFile;
    bool logToSyslog;
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_NORTHBOUNDCONFIG_H */
