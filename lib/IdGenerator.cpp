/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for random identifier generation
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/IdGenerator.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/random_generator.hpp>

#include <cstdio>

namespace ovnpolicy {

RandomIdGenerator::RandomIdGenerator() {
    std::random_device rng;
    urng.seed(rng());
}

std::string RandomIdGenerator::generateUuid() {
    std::lock_guard<std::mutex> guard(mutex);
    return boost::uuids::to_string(
        boost::uuids::basic_random_generator<std::mt19937>(urng)());
}

std::string RandomIdGenerator::generateMac() {
    unsigned char bytes[6];
    {
        std::lock_guard<std::mutex> guard(mutex);
        std::uniform_int_distribution<int> dist(0, 255);
        for (int i = 0; i < 6; ++i)
            bytes[i] = static_cast<unsigned char>(dist(urng));
    }
    return formatLocalMac(bytes);
}

std::string formatLocalMac(const unsigned char bytes[6]) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  (bytes[0] | 0x02) & 0xfe, bytes[1], bytes[2],
                  bytes[3], bytes[4], bytes[5]);
    return buf;
}

} /* namespace ovnpolicy */
