#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <kitties/ledger/engine.hpp>
#include <kitties/storage/sqlite_store.hpp>

using namespace kitties;
using namespace kitties::storage;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteKittyStore store;

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

// ===========================================
// Core database operations
// ===========================================

TEST_CASE("Database lifecycle") {
    TestDB db("test_kitties_lifecycle");

    SUBCASE("Open and close") {
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.isOpen());
        db.store.close();
        CHECK_FALSE(db.store.isOpen());
    }

    SUBCASE("Schema initialization is idempotent") {
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.getSchemaVersion() == 0);
        REQUIRE(db.store.initializeSchema().is_ok());
        CHECK(db.store.getSchemaVersion() == 1);
        REQUIRE(db.store.initializeSchema().is_ok());
        CHECK(db.store.getSchemaVersion() == 1);

        auto check = db.store.quickCheck();
        REQUIRE(check.is_ok());
        CHECK(check.value());
    }

    SUBCASE("Closed database rejects operations") {
        CHECK(db.store.initializeSchema().is_err());
        auto result = db.store.insert("alice", 0, Kitty(genomeFilled(0x01)));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORE_NOT_OPEN);
    }
}

TEST_CASE("Kitty rows") {
    TestDB db("test_kitties_rows");
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());

    REQUIRE(db.store.insert("alice", 2, Kitty(genomeFilled(0x12))).is_ok());
    REQUIRE(db.store.insert("alice", 0, Kitty(genomeFilled(0x10))).is_ok());
    REQUIRE(db.store.insert("bob", 1, Kitty(genomeFilled(0x11))).is_ok());

    SUBCASE("Lookup is scoped by owner") {
        auto kitty = db.store.get("bob", 1);
        REQUIRE(kitty.has_value());
        CHECK(*kitty == Kitty(genomeFilled(0x11)));
        CHECK_FALSE(db.store.get("alice", 1).has_value());
    }

    SUBCASE("Listing is ordered by id") {
        auto entries = db.store.kittiesOf("alice");
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].id == 0);
        CHECK(entries[1].id == 2);
        CHECK(db.store.count() == 3);
    }

    SUBCASE("Counter defaults to zero and updates") {
        CHECK(db.store.nextId().value() == 0);
        REQUIRE(db.store.setNextId(3).is_ok());
        CHECK(db.store.nextId().value() == 3);
    }
}

TEST_CASE("Transactions") {
    TestDB db("test_kitties_tx");
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());

    SUBCASE("Rollback on scope exit") {
        {
            auto tx = db.store.beginTransaction();
            REQUIRE(db.store.insert("alice", 0, Kitty(genomeFilled(0x10))).is_ok());
            REQUIRE(db.store.setNextId(1).is_ok());
        }
        CHECK(db.store.count() == 0);
        CHECK(db.store.nextId().value() == 0);
    }

    SUBCASE("Commit persists") {
        auto tx = db.store.beginTransaction();
        REQUIRE(db.store.insert("alice", 0, Kitty(genomeFilled(0x10))).is_ok());
        REQUIRE(db.store.setNextId(1).is_ok());
        REQUIRE(tx->commit().is_ok());
        CHECK(db.store.count() == 1);
        CHECK(db.store.nextId().value() == 1);
    }
}

TEST_CASE("Engine persistence across reopen") {
    TestDB db("test_kitties_engine");
    auto entropy = std::make_shared<FixedEntropySource>(
        std::vector<Genome>{genomeFilled(0x00), genomeFilled(0x01), genomeFilled(0xFF)});

    {
        auto store = std::make_shared<SqliteKittyStore>();
        REQUIRE(store->open(db.path).is_ok());
        REQUIRE(store->initializeSchema().is_ok());
        KittyEngine engine(store, entropy);
        REQUIRE(engine.initialize().is_ok());
        REQUIRE(engine.create("alice").is_ok());
        REQUIRE(engine.create("alice").is_ok());
        REQUIRE(engine.breed("alice", 0, 1).is_ok());
    }

    auto store = std::make_shared<SqliteKittyStore>();
    REQUIRE(store->open(db.path).is_ok());
    REQUIRE(store->initializeSchema().is_ok());
    KittyEngine engine(store, entropy);
    REQUIRE(engine.initialize().is_ok());

    CHECK(engine.nextKittyId() == 3);
    auto child = engine.lookup("alice", 2);
    REQUIRE(child.has_value());
    CHECK(*child == Kitty(genomeFilled(0x01)));
    CHECK(engine.kittyCount() == 3);
}

TEST_CASE("Transaction that cannot begin blocks the write") {
    TestDB db("test_kitties_begin_fail");
    auto store = std::make_shared<SqliteKittyStore>();
    REQUIRE(store->open(db.path).is_ok());
    REQUIRE(store->initializeSchema().is_ok());

    SUBCASE("Guard reports the failed BEGIN") {
        auto outer = store->beginTransaction();
        REQUIRE(outer->status().is_ok());

        auto inner = store->beginTransaction();
        auto status = inner->status();
        REQUIRE(status.is_err());
        CHECK(status.error().code == ERR_STORE_FAILED);
        CHECK(inner->commit().is_err());
    }

    SUBCASE("Engine aborts before writing") {
        auto entropy = std::make_shared<FixedEntropySource>(std::vector<Genome>{genomeFilled(0x01)});
        auto events = std::make_shared<EventLog>();
        KittyEngine engine(store, entropy, events);
        REQUIRE(engine.initialize().is_ok());

        {
            auto outer = store->beginTransaction();
            auto failed = engine.create("alice");
            REQUIRE(failed.is_err());
            CHECK(failed.error().code == ERR_STORE_FAILED);
            CHECK(engine.nextKittyId() == 0);
            CHECK(events->size() == 0);
            REQUIRE(outer->commit().is_ok());
        }

        CHECK(store->count() == 0);
        CHECK(store->nextId().value() == 0);

        auto created = engine.create("alice");
        REQUIRE(created.is_ok());
        CHECK(created.value().getKittyId() == 0);
        CHECK(store->count() == 1);
    }

    SUBCASE("Closed store refuses to begin") {
        store->close();
        auto tx = store->beginTransaction();
        auto status = tx->status();
        REQUIRE(status.is_err());
        CHECK(status.error().code == ERR_STORE_NOT_OPEN);
    }
}
