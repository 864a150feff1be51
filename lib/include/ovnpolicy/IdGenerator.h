/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file IdGenerator.h
 * @brief Sources of object identifiers and MAC addresses
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_IDGENERATOR_H
#define OVNPOLICY_IDGENERATOR_H

#include <boost/noncopyable.hpp>

#include <mutex>
#include <random>
#include <string>

namespace ovnpolicy {

/**
 * Allocates identifiers for new northbound rows
 */
class IdGenerator : private boost::noncopyable {
public:
    virtual ~IdGenerator() {}

    /**
     * Generate a row UUID in canonical 8-4-4-4-12 form
     */
    virtual std::string generateUuid() = 0;

    /**
     * Generate a unicast, locally administered MAC address in
     * "xx:xx:xx:xx:xx:xx" form
     */
    virtual std::string generateMac() = 0;
};

/**
 * Random identifiers seeded from std::random_device
 */
class RandomIdGenerator : public IdGenerator {
public:
    RandomIdGenerator();

    virtual std::string generateUuid();
    virtual std::string generateMac();

private:
    std::mutex mutex;
    std::mt19937 urng;
};

/**
 * Format six bytes as a MAC address, forcing the locally administered
 * bit on and the multicast bit off in the first octet
 *
 * @param bytes the six address bytes
 * @return the formatted address
 */
std::string formatLocalMac(const unsigned char bytes[6]);

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_IDGENERATOR_H */
