/*
 * Test main for the policy compiler library.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#define BOOST_TEST_MODULE "ovnpolicy"
#include <boost/test/unit_test.hpp>

#include <ovnpolicy/logging.h>

class LogInitializer {
public:
    LogInitializer() {
        ovnpolicy::initLogging("info", false, "");
    }
};

BOOST_GLOBAL_FIXTURE(LogInitializer);
