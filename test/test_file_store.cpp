#include <doctest/doctest.h>

#include <filesystem>
#include <kitties/ledger/engine.hpp>
#include <kitties/storage/file_store.hpp>

using namespace kitties;
using namespace kitties::storage;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileKittyStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

// ===========================================
// Lifecycle
// ===========================================

TEST_CASE("File store lifecycle") {
    TestStore ts("test_kitty_lifecycle");

    SUBCASE("Open creates the data files") {
        auto result = ts.store.open(dp::String(ts.path.c_str()));
        REQUIRE(result.is_ok());
        CHECK(ts.store.isOpen());
        CHECK(std::filesystem::exists(ts.path + "/kitties.dat"));

        auto check = ts.store.quickCheck();
        REQUIRE(check.is_ok());
        CHECK(check.value());
    }

    SUBCASE("Closed store rejects writes") {
        CHECK_FALSE(ts.store.isOpen());
        auto result = ts.store.insert("alice", 0, Kitty(genomeFilled(0x01)));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORE_NOT_OPEN);
        CHECK(ts.store.nextId().is_err());
    }

    SUBCASE("Fresh store starts at id zero") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        auto next_id = ts.store.nextId();
        REQUIRE(next_id.is_ok());
        CHECK(next_id.value() == 0);
        CHECK(ts.store.count() == 0);
    }
}

// ===========================================
// Kitty operations
// ===========================================

TEST_CASE("File store kitty operations") {
    TestStore ts("test_kitty_ops");
    REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());

    REQUIRE(ts.store.insert("alice", 0, Kitty(genomeFilled(0x10))).is_ok());
    REQUIRE(ts.store.insert("bob", 1, Kitty(genomeFilled(0x11))).is_ok());
    REQUIRE(ts.store.insert("alice", 2, Kitty(genomeFilled(0x12))).is_ok());

    SUBCASE("Lookup is scoped by owner") {
        auto kitty = ts.store.get("alice", 0);
        REQUIRE(kitty.has_value());
        CHECK(*kitty == Kitty(genomeFilled(0x10)));
        CHECK_FALSE(ts.store.get("bob", 0).has_value());
    }

    SUBCASE("Listing is ordered by id") {
        auto entries = ts.store.kittiesOf("alice");
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].id == 0);
        CHECK(entries[1].id == 2);
        CHECK(ts.store.count() == 3);
    }

    SUBCASE("Transaction rollback discards writes") {
        {
            auto tx = ts.store.beginTransaction();
            REQUIRE(ts.store.insert("carol", 3, Kitty(genomeFilled(0x13))).is_ok());
            REQUIRE(ts.store.setNextId(4).is_ok());
        }
        CHECK_FALSE(ts.store.get("carol", 3).has_value());
        CHECK(ts.store.count() == 3);
    }

    SUBCASE("Transaction commit applies writes") {
        auto tx = ts.store.beginTransaction();
        REQUIRE(ts.store.insert("carol", 3, Kitty(genomeFilled(0x13))).is_ok());
        REQUIRE(ts.store.setNextId(4).is_ok());
        CHECK_FALSE(ts.store.get("carol", 3).has_value());

        REQUIRE(tx->commit().is_ok());
        CHECK(ts.store.get("carol", 3).has_value());
        CHECK(ts.store.nextId().value() == 4);
    }
}

// ===========================================
// Persistence
// ===========================================

TEST_CASE("File store persistence") {
    TestStore ts("test_kitty_persist");

    {
        FileKittyStore store;
        REQUIRE(store.open(dp::String(ts.path.c_str())).is_ok());
        REQUIRE(store.insert("alice", 0, Kitty(genomeFilled(0x20))).is_ok());
        REQUIRE(store.setNextId(1).is_ok());
        store.close();
    }

    SUBCASE("Kitties and counter survive reopen") {
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        auto kitty = ts.store.get("alice", 0);
        REQUIRE(kitty.has_value());
        CHECK(*kitty == Kitty(genomeFilled(0x20)));
        CHECK(ts.store.nextId().value() == 1);
    }

    SUBCASE("Counter never trails stored ids") {
        {
            FileKittyStore store;
            REQUIRE(store.open(dp::String(ts.path.c_str())).is_ok());
            // Kitty written without the matching counter update
            REQUIRE(store.insert("alice", 5, Kitty(genomeFilled(0x21))).is_ok());
            store.close();
        }
        REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(ts.store.nextId().value() == 6);
    }
}

TEST_CASE("Engine over a file store continues numbering after restart") {
    TestStore ts("test_kitty_engine");
    auto entropy = std::make_shared<SeededEntropySource>(std::vector<uint8_t>(32, 0x42));

    {
        auto store = std::make_shared<FileKittyStore>();
        REQUIRE(store->open(dp::String(ts.path.c_str())).is_ok());
        KittyEngine engine(store, entropy);
        REQUIRE(engine.initialize().is_ok());
        REQUIRE(engine.create("alice").is_ok());
        REQUIRE(engine.create("alice").is_ok());
    }

    auto store = std::make_shared<FileKittyStore>();
    REQUIRE(store->open(dp::String(ts.path.c_str())).is_ok());
    KittyEngine engine(store, entropy);
    REQUIRE(engine.initialize().is_ok());
    CHECK(engine.nextKittyId() == 2);
    CHECK(engine.kittiesOf("alice").size() == 2);

    auto created = engine.create("alice");
    REQUIRE(created.is_ok());
    CHECK(created.value().getKittyId() == 2);
}

TEST_CASE("Failed commit leaves the file store unchanged") {
    TestStore ts("test_kitty_failed_commit");
    auto store = std::make_shared<FileKittyStore>();
    REQUIRE(store->open(dp::String(ts.path.c_str())).is_ok());
    auto events = std::make_shared<EventLog>();
    KittyEngine engine(store, std::make_shared<SeededEntropySource>(std::vector<uint8_t>(32, 0x17)), events);
    REQUIRE(engine.initialize().is_ok());

    auto log_size = std::filesystem::file_size(ts.path + "/kitties.dat");

    // A directory in place of the temporary meta file makes the counter write fail
    std::filesystem::create_directory(ts.path + "/meta.dat.tmp");

    auto failed = engine.create("alice");
    REQUIRE(failed.is_err());
    CHECK(failed.error().code == ERR_STORE_FAILED);
    CHECK(engine.nextKittyId() == 0);
    CHECK_FALSE(store->get("alice", 0).has_value());
    CHECK(store->count() == 0);
    CHECK(std::filesystem::file_size(ts.path + "/kitties.dat") == log_size);
    CHECK(events->size() == 0);

    std::filesystem::remove(ts.path + "/meta.dat.tmp");

    auto created = engine.create("bob");
    REQUIRE(created.is_ok());
    CHECK(created.value().getKittyId() == 0);
    CHECK(store->get("bob", 0).has_value());
    CHECK_FALSE(store->get("alice", 0).has_value());
    CHECK(store->count() == 1);

    SUBCASE("Reopened store agrees") {
        store->close();
        FileKittyStore reopened;
        REQUIRE(reopened.open(dp::String(ts.path.c_str())).is_ok());
        CHECK(reopened.count() == 1);
        CHECK(reopened.nextId().value() == 1);
        CHECK_FALSE(reopened.get("alice", 0).has_value());
    }
}

TEST_CASE("Owners containing NUL bytes are rejected") {
    TestStore ts("test_kitty_nul_owner");
    REQUIRE(ts.store.open(dp::String(ts.path.c_str())).is_ok());

    const AccountId owner("al\0ice", 6);
    auto result = ts.store.insert(owner, 0, Kitty(genomeFilled(0x01)));
    CHECK(result.is_err());
    CHECK(ts.store.count() == 0);
    CHECK_FALSE(ts.store.get("al", 0).has_value());
}
