/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NorthboundConfig class.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/NorthboundConfig.h>
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/logging.h>

#include <boost/property_tree/ptree.hpp>

namespace ovnpolicy {

using boost::property_tree::ptree;
using boost::optional;
using std::chrono::milliseconds;

NorthboundConfig::NorthboundConfig()
    : address("tcp:127.0.0.1:6641"),
      connectTimeout(10000), requestTimeout(10000),
      reconnectInterval(5000), maxReconnectAttempts(10),
      useMockOnFailure(true), cacheEnabled(true), cacheTtl(30000),
      logLevel("info"), logToSyslog(false) {
}

static milliseconds getDuration(const ptree& properties,
                                const std::string& key,
                                milliseconds current) {
    optional<long> value = properties.get_optional<long>(key);
    if (!value)
        return current;
    if (value.get() < 0)
        throw ConfigError("Invalid negative duration for " + key + ": " +
                          std::to_string(value.get()));
    return milliseconds(value.get());
}

void NorthboundConfig::setProperties(const ptree& properties) {
    static const std::string NB_ADDRESS("northbound.address");
    static const std::string NB_CONNECT_TIMEOUT("northbound.connect-timeout");
    static const std::string NB_REQUEST_TIMEOUT("northbound.request-timeout");
    static const std::string NB_RECONNECT_INTERVAL("northbound.reconnect-interval");
    static const std::string NB_MAX_RECONNECT("northbound.max-reconnect-attempts");
    static const std::string NB_USE_MOCK("northbound.use-mock-on-failure");
    static const std::string NB_CACHE_ENABLED("northbound.cache.enabled");
    static const std::string NB_CACHE_TTL("northbound.cache.ttl");
    static const std::string LOG_LEVEL("log.level");
    static const std::string LOG_FILE("log.file");
    static const std::string LOG_SYSLOG("log.syslog");

    optional<std::string> addr =
        properties.get_optional<std::string>(NB_ADDRESS);
    if (addr) address = addr.get();

    connectTimeout = getDuration(properties, NB_CONNECT_TIMEOUT,
                                 connectTimeout);
    requestTimeout = getDuration(properties, NB_REQUEST_TIMEOUT,
                                 requestTimeout);
    reconnectInterval = getDuration(properties, NB_RECONNECT_INTERVAL,
                                    reconnectInterval);
    cacheTtl = getDuration(properties, NB_CACHE_TTL, cacheTtl);

    optional<long> maxAttempts = properties.get_optional<long>(NB_MAX_RECONNECT);
    if (maxAttempts) {
        if (maxAttempts.get() < 0)
            throw ConfigError("Invalid value for " + NB_MAX_RECONNECT + ": " +
                              std::to_string(maxAttempts.get()));
        maxReconnectAttempts = static_cast<uint32_t>(maxAttempts.get());
    }

    useMockOnFailure = properties.get<bool>(NB_USE_MOCK, useMockOnFailure);
    cacheEnabled = properties.get<bool>(NB_CACHE_ENABLED, cacheEnabled);

    logLevel = properties.get<std::string>(LOG_LEVEL, logLevel);
    logFile = properties.get<std::string>(LOG_FILE, logFile);
    logToSyslog = properties.get<bool>(LOG_SYSLOG, logToSyslog);

    LOG(DEBUG) << "Northbound address " << address
               << ", connect timeout " << connectTimeout.count() << " ms"
               << ", cache " << (cacheEnabled ? "enabled" : "disabled")
               << " (ttl " << cacheTtl.count() << " ms)"
               << ", mock fallback "
               << (useMockOnFailure ? "enabled" : "disabled");
}

} /* namespace ovnpolicy */
