/*
 * Test suite for class MemoryNorthboundStore
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include "MemoryNorthboundStore.h"
#include "NbRowCodec.h"
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/test/BaseFixture.h>

namespace ovnpolicy {

using std::string;
using std::list;

BOOST_AUTO_TEST_SUITE(MemoryNorthboundStore_test)

class MemoryStoreFixture : public BaseFixture {
public:
    MemoryStoreFixture() : BaseFixture(), store(idGen) {}

    static OvsdbTransactMessage insert(OvsdbTable table, const string& uuid,
                                       const OvsdbRowData& row) {
        OvsdbTransactMessage msg(OvsdbOperation::INSERT, table);
        msg.externalKey = std::make_pair("uuid", uuid);
        msg.rowData = row;
        return msg;
    }

    static OvsdbTransactMessage addRef(OvsdbTable table, const string& uuid,
                                       const string& column,
                                       const string& ref,
                                       OvsdbOperation mutator =
                                       OvsdbOperation::INSERT) {
        OvsdbTransactMessage msg(OvsdbOperation::MUTATE, table);
        msg.conditions.emplace_back(UUID_COLUMN, OvsdbFunction::EQ,
                                    uuidRef(uuid));
        msg.mutateRowData[column] = std::make_pair(mutator, uuidSet({ref}));
        return msg;
    }

    static OvsdbTransactMessage remove(OvsdbTable table, const string& name) {
        OvsdbTransactMessage msg(OvsdbOperation::DELETE, table);
        msg.conditions.emplace_back("name", OvsdbFunction::EQ,
                                    OvsdbValue(name));
        return msg;
    }

    static OvsdbRowData named(const string& name) {
        OvsdbRowData row;
        row["name"] = OvsdbValue(name);
        return row;
    }

    size_t count(OvsdbTable table) {
        OvsdbTableDetails rows;
        store.select(table, OvsdbConditions(), rows);
        return rows.size();
    }

    MemoryNorthboundStore store;
};

BOOST_FIXTURE_TEST_CASE(insert_select, MemoryStoreFixture) {
    store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1", named("ls-a")),
                    insert(OvsdbTable::LOGICAL_SWITCH, "ls2", named("ls-b"))});

    OvsdbTableDetails rows;
    store.select(OvsdbTable::LOGICAL_SWITCH,
                 {OvsdbCondition("name", OvsdbFunction::EQ,
                                 OvsdbValue(string("ls-b")))}, rows);
    BOOST_REQUIRE_EQUAL(1, rows.size());
    BOOST_CHECK_EQUAL("ls2", getString(rows.begin()->second, UUID_COLUMN));

    rows.clear();
    store.select(OvsdbTable::LOGICAL_SWITCH,
                 {OvsdbCondition(UUID_COLUMN, OvsdbFunction::EQ,
                                 uuidRef("ls1"))}, rows);
    BOOST_REQUIRE_EQUAL(1, rows.size());
    BOOST_CHECK_EQUAL("ls-a", getString(rows.begin()->second, "name"));

    // insert without a uuid draws one from the generator
    OvsdbTransactMessage anon(OvsdbOperation::INSERT,
                              OvsdbTable::LOAD_BALANCER);
    anon.rowData = named("lb-1");
    store.transact({anon});
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::LOAD_BALANCER));
}

BOOST_FIXTURE_TEST_CASE(garbage_collection, MemoryStoreFixture) {
    store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1", named("ls-a")),
                    insert(OvsdbTable::LOGICAL_SWITCH_PORT, "p1",
                           named("lsp-1")),
                    addRef(OvsdbTable::LOGICAL_SWITCH, "ls1", "ports", "p1")});
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::LOGICAL_SWITCH_PORT));

    // an unreferenced ACL does not survive the transaction
    store.transact({insert(OvsdbTable::ACL, "a1", OvsdbRowData())});
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::ACL));

    store.transact({remove(OvsdbTable::LOGICAL_SWITCH, "ls-a")});
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH));
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH_PORT));
}

BOOST_FIXTURE_TEST_CASE(weak_references, MemoryStoreFixture) {
    OvsdbRowData pg = named("pg_sg_1");
    pg["ports"] = uuidSet({"p1"});
    store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1", named("ls-a")),
                    insert(OvsdbTable::LOGICAL_SWITCH_PORT, "p1",
                           named("lsp-1")),
                    addRef(OvsdbTable::LOGICAL_SWITCH, "ls1", "ports", "p1"),
                    insert(OvsdbTable::PORT_GROUP, "pg1", pg)});

    OvsdbTableDetails rows;
    store.select(OvsdbTable::PORT_GROUP, OvsdbConditions(), rows);
    BOOST_CHECK_EQUAL(1, getSet(rows["pg1"], "ports").size());

    store.transact({addRef(OvsdbTable::LOGICAL_SWITCH, "ls1", "ports", "p1",
                           OvsdbOperation::DELETE)});
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH_PORT));
    rows.clear();
    store.select(OvsdbTable::PORT_GROUP, OvsdbConditions(), rows);
    BOOST_CHECK(getSet(rows["pg1"], "ports").empty());
}

BOOST_FIXTURE_TEST_CASE(referential_integrity, MemoryStoreFixture) {
    OvsdbRowData ls = named("ls-a");
    ls["ports"] = uuidSet({"missing"});
    try {
        store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1", ls)});
        BOOST_FAIL("Expected TransactionError");
    } catch (const TransactionError& e) {
        BOOST_CHECK_EQUAL("referential integrity violation", e.getError());
    }
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH));
}

BOOST_FIXTURE_TEST_CASE(constraints_are_atomic, MemoryStoreFixture) {
    store.transact({insert(OvsdbTable::ADDRESS_SET, "as1", named("as_sg_1"))});

    try {
        store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1",
                               named("ls-a")),
                        insert(OvsdbTable::ADDRESS_SET, "as2",
                               named("as_sg_1"))});
        BOOST_FAIL("Expected TransactionError");
    } catch (const TransactionError& e) {
        BOOST_CHECK_EQUAL("constraint violation", e.getError());
    }
    // the switch insert was rolled back with the failing insert
    BOOST_CHECK_EQUAL(0, count(OvsdbTable::LOGICAL_SWITCH));
    BOOST_CHECK_EQUAL(1, count(OvsdbTable::ADDRESS_SET));

    BOOST_CHECK_THROW(store.transact({insert(OvsdbTable::ADDRESS_SET, "as1",
                                             named("as_sg_2"))}),
                      TransactionError);
}

BOOST_FIXTURE_TEST_CASE(map_mutations, MemoryStoreFixture) {
    OvsdbRowData ls = named("ls-a");
    ls["external_ids"] = stringMap({{"a", "1"}, {"b", "2"}});
    store.transact({insert(OvsdbTable::LOGICAL_SWITCH, "ls1", ls)});

    OvsdbTransactMessage add(OvsdbOperation::MUTATE,
                             OvsdbTable::LOGICAL_SWITCH);
    add.conditions.emplace_back(UUID_COLUMN, OvsdbFunction::EQ,
                                uuidRef("ls1"));
    add.mutateRowData["external_ids"] =
        std::make_pair(OvsdbOperation::INSERT,
                       stringMap({{"a", "changed"}, {"c", "3"}}));
    OvsdbTransactMessage del(OvsdbOperation::MUTATE,
                             OvsdbTable::LOGICAL_SWITCH);
    del.conditions = add.conditions;
    del.mutateRowData["external_ids"] =
        std::make_pair(OvsdbOperation::DELETE, stringSet({"b"}));
    store.transact({add, del});

    OvsdbTableDetails rows;
    store.select(OvsdbTable::LOGICAL_SWITCH,
                 {OvsdbCondition("external_ids", OvsdbFunction::INCLUDES,
                                 mapEntry("c", "3"))}, rows);
    BOOST_REQUIRE_EQUAL(1, rows.size());
    StringMap ids = getMap(rows.begin()->second, "external_ids");
    StringMap expected{{"a", "1"}, {"c", "3"}};
    BOOST_CHECK(expected == ids);
}

BOOST_FIXTURE_TEST_CASE(closed, MemoryStoreFixture) {
    BOOST_CHECK(store.isConnected());
    store.close();
    BOOST_CHECK(!store.isConnected());
    OvsdbTableDetails rows;
    BOOST_CHECK_THROW(store.select(OvsdbTable::ACL, OvsdbConditions(), rows),
                      ConnectionError);
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace ovnpolicy */
