/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for base fixture
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_TEST_BASEFIXTURE_H
#define OVNPOLICY_TEST_BASEFIXTURE_H

#include <ovnpolicy/IdGenerator.h>
#include <ovnpolicy/logging.h>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <memory>
#include <mutex>

#include <unistd.h>

namespace ovnpolicy {

/**
 * Deterministic identifiers: UUIDs and MACs built from a counter
 */
class SequentialIdGenerator : public IdGenerator {
public:
    SequentialIdGenerator() : next(1) {}

    virtual std::string generateUuid() {
        std::lock_guard<std::mutex> guard(mutex);
        char buf[37];
        std::snprintf(buf, sizeof(buf),
                      "00000000-0000-0000-0000-%012llx",
                      static_cast<unsigned long long>(next++));
        return buf;
    }

    virtual std::string generateMac() {
        std::lock_guard<std::mutex> guard(mutex);
        uint64_t n = next++;
        unsigned char bytes[6] = {0x0a, 0, 0,
                                  static_cast<unsigned char>(n >> 16),
                                  static_cast<unsigned char>(n >> 8),
                                  static_cast<unsigned char>(n)};
        return formatLocalMac(bytes);
    }

private:
    std::mutex mutex;
    uint64_t next;
};

/**
 * A fixture with logging and a deterministic id generator
 */
class BaseFixture {
public:
    BaseFixture() : idGen(std::make_shared<SequentialIdGenerator>()) {
        initLogging("debug", false, "");
    }

    virtual ~BaseFixture() {}

    /**
     * Id generator shared by the objects under test
     */
    std::shared_ptr<SequentialIdGenerator> idGen;
};

/**
 * A simple guard for creating temporary files for testing
 */
class TempGuard {
public:
    TempGuard() :
        temp_dir(boost::filesystem::temp_directory_path() /
                 boost::filesystem::unique_path()) {
        boost::filesystem::create_directory(temp_dir);
    }

    ~TempGuard() {
        boost::filesystem::remove_all(temp_dir);
    }

    /**
     * the temporary path
     */
    boost::filesystem::path temp_dir;
};

// wait for a condition to become true because of an event in another
// thread
#define WAIT_FOR(condition, count)                         \
    {                                                      \
        int _c = 0;                                        \
        while (_c < count) {                               \
            if (condition) break;                          \
            _c += 1;                                       \
            usleep(1000);                                  \
        }                                                  \
        BOOST_CHECK((condition));                          \
    }

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_TEST_BASEFIXTURE_H */
