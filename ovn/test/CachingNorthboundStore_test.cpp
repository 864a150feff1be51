/*
 * Test suite for class CachingNorthboundStore
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include "CachingNorthboundStore.h"
#include "MemoryNorthboundStore.h"
#include "NbRowCodec.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/test/BaseFixture.h>

#include <functional>
#include <thread>

namespace ovnpolicy {

using std::string;
using std::chrono::milliseconds;

BOOST_AUTO_TEST_SUITE(CachingNorthboundStore_test)

/**
 * Memory store that counts the reads reaching it
 */
class CountingStore : public MemoryNorthboundStore {
public:
    CountingStore(const std::shared_ptr<IdGenerator>& idGen)
        : MemoryNorthboundStore(idGen), selects(0), failNext(false) {}

    virtual void transact(const std::list<OvsdbTransactMessage>& operations)
        override {
        if (failNext) {
            failNext = false;
            throw TransactionError("constraint violation", "injected");
        }
        MemoryNorthboundStore::transact(operations);
    }

    virtual void select(OvsdbTable table, const OvsdbConditions& conditions,
                        OvsdbTableDetails& rows) override {
        selects += 1;
        std::function<void()> hook;
        hook.swap(duringSelect);
        if (hook)
            hook();
        MemoryNorthboundStore::select(table, conditions, rows);
    }

    int selects;
    bool failNext;
    // runs once, inside the next read
    std::function<void()> duringSelect;
};

class CacheFixture : public BaseFixture {
public:
    CacheFixture(milliseconds ttl = milliseconds(60000))
        : BaseFixture(), backend(new CountingStore(idGen)),
          store(std::unique_ptr<NorthboundStore>(backend), ttl) {}

    void addSwitch(const string& name) {
        OvsdbTransactMessage msg(OvsdbOperation::INSERT,
                                 OvsdbTable::LOGICAL_SWITCH);
        msg.rowData["name"] = OvsdbValue(name);
        store.transact({msg});
    }

    size_t countSwitches(const string& name) {
        OvsdbTableDetails rows;
        store.select(OvsdbTable::LOGICAL_SWITCH,
                     {OvsdbCondition("name", OvsdbFunction::EQ,
                                     OvsdbValue(name))}, rows);
        return rows.size();
    }

    // owned by store
    CountingStore* backend;
    CachingNorthboundStore store;
};

class ShortTtlFixture : public CacheFixture {
public:
    ShortTtlFixture() : CacheFixture(milliseconds(20)) {}
};

BOOST_FIXTURE_TEST_CASE(hit, CacheFixture) {
    addSwitch("ls-a");
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(1, backend->selects);
    BOOST_CHECK_EQUAL(1, store.getHits());

    // different conditions are a different entry
    BOOST_CHECK_EQUAL(0, countSwitches("ls-b"));
    BOOST_CHECK_EQUAL(2, backend->selects);
}

BOOST_FIXTURE_TEST_CASE(invalidate_on_write, CacheFixture) {
    BOOST_CHECK_EQUAL(0, countSwitches("ls-a"));
    addSwitch("ls-a");
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(2, backend->selects);

    store.invalidateAll();
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(3, backend->selects);
}

BOOST_FIXTURE_TEST_CASE(failed_write, CacheFixture) {
    addSwitch("ls-a");
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    backend->failNext = true;
    BOOST_CHECK_THROW(addSwitch("ls-b"), TransactionError);
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(2, backend->selects);
}

BOOST_FIXTURE_TEST_CASE(failed_write_during_read, CacheFixture) {
    backend->duringSelect = [this]() {
        backend->failNext = true;
        BOOST_CHECK_THROW(addSwitch("ls-b"), TransactionError);
    };
    BOOST_CHECK_EQUAL(0, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(1, backend->selects);

    // the read raced the failed write, so it was not cached
    BOOST_CHECK_EQUAL(0, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(2, backend->selects);
    BOOST_CHECK_EQUAL(0, store.getHits());
}

BOOST_FIXTURE_TEST_CASE(expiry, ShortTtlFixture) {
    addSwitch("ls-a");
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    std::this_thread::sleep_for(milliseconds(50));
    BOOST_CHECK_EQUAL(1, countSwitches("ls-a"));
    BOOST_CHECK_EQUAL(2, backend->selects);
    BOOST_CHECK_EQUAL(0, store.getHits());
}

BOOST_FIXTURE_TEST_CASE(uncached_tables, CacheFixture) {
    BOOST_CHECK(CachingNorthboundStore::isCached(OvsdbTable::ACL));
    BOOST_CHECK(!CachingNorthboundStore::isCached(OvsdbTable::PORT_GROUP));

    OvsdbTableDetails rows;
    store.select(OvsdbTable::PORT_GROUP, OvsdbConditions(), rows);
    store.select(OvsdbTable::PORT_GROUP, OvsdbConditions(), rows);
    BOOST_CHECK_EQUAL(2, backend->selects);
    BOOST_CHECK_EQUAL(0, store.getHits());
}

BOOST_AUTO_TEST_CASE(null_backend) {
    BOOST_CHECK_THROW(CachingNorthboundStore(nullptr, milliseconds(10)),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace ovnpolicy */
