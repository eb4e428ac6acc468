#include "kitties.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace kitties;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void reportError(const std::string &what, const dp::Error &error) {
    std::cerr << "   " << what << " failed: " << error.message.c_str() << std::endl;
}

void demonstrateInMemoryKitties() {
    printSeparator("IN-MEMORY KITTIES");

    auto store = std::make_shared<storage::MemoryKittyStore>();
    auto entropy = std::make_shared<SeededEntropySource>(SeededEntropySource::randomSeed());
    auto sink = std::make_shared<ConsoleEventSink>();

    KittyEngine engine(store, entropy, sink);
    auto init = engine.initialize();
    if (!init.is_ok()) {
        reportError("initialize", init.error());
        return;
    }

    // Create kitties until alice holds one of each gender
    dp::Optional<KittyId> male_id;
    dp::Optional<KittyId> female_id;
    for (int attempt = 0; attempt < 16 && !(male_id.has_value() && female_id.has_value()); ++attempt) {
        auto created = engine.create("alice");
        if (!created.is_ok()) {
            reportError("create", created.error());
            return;
        }
        const auto &event = created.value();
        if (event.getKitty().gender() == KittyGender::Male)
            male_id = dp::Optional<KittyId>(event.getKittyId());
        else
            female_id = dp::Optional<KittyId>(event.getKittyId());
    }

    auto bob_kitty = engine.create("bob");
    if (!bob_kitty.is_ok())
        reportError("create", bob_kitty.error());

    if (male_id.has_value() && female_id.has_value()) {
        std::cout << "\nBreeding #" << *male_id << " with #" << *female_id << std::endl;
        auto bred = engine.breed("alice", *male_id, *female_id);
        if (!bred.is_ok())
            reportError("breed", bred.error());
    }

    // Bob cannot breed alice's kitties
    auto rejected = engine.breed("bob", 0, 1);
    if (!rejected.is_ok() && isKittyNotFound(rejected.error()))
        std::cout << "Cross-owner breeding rejected as expected" << std::endl;

    std::cout << std::endl;
    engine.printSummary({"alice", "bob"});
}

void demonstratePersistentKitties() {
    printSeparator("PERSISTENT KITTIES (SQLite)");

    const std::string db_path = "kitties_demo.db";
    std::filesystem::remove(db_path);

    auto entropy = std::make_shared<SeededEntropySource>(SeededEntropySource::randomSeed());

    {
        auto store = std::make_shared<storage::SqliteKittyStore>();
        if (!store->open(db_path).is_ok() || !store->initializeSchema().is_ok()) {
            std::cerr << "   Could not open " << db_path << std::endl;
            return;
        }

        KittyEngine engine(store, entropy, std::make_shared<ConsoleEventSink>());
        if (!engine.initialize().is_ok())
            return;
        for (int i = 0; i < 2; ++i) {
            auto created = engine.create("carol");
            if (!created.is_ok()) {
                reportError("create", created.error());
                return;
            }
        }
        std::cout << "Session 1 next id: " << engine.nextKittyId() << std::endl;
    }

    {
        auto store = std::make_shared<storage::SqliteKittyStore>();
        if (!store->open(db_path).is_ok() || !store->initializeSchema().is_ok())
            return;

        KittyEngine engine(store, entropy, std::make_shared<ConsoleEventSink>());
        if (!engine.initialize().is_ok())
            return;
        std::cout << "Session 2 resumes at id: " << engine.nextKittyId() << std::endl;
        auto created = engine.create("carol");
        if (!created.is_ok())
            reportError("create", created.error());
        engine.printSummary({"carol"});
    }

    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
}

int main() {
    std::cout << "Kitties ledger demo" << std::endl;

    demonstrateInMemoryKitties();
    demonstratePersistentKitties();

    return 0;
}
