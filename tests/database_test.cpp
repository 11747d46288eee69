#include "common/clock.hpp"
#include "common/errors.hpp"
#include "database/database.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace funtable {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base_dir_ = fs::temp_directory_path() /
                    ("funtable_db_test_" + std::string(info->name()));
        fs::remove_all(base_dir_);
        open();
    }

    void TearDown() override {
        db_.reset();
        std::error_code ec;
        fs::remove_all(base_dir_, ec);
    }

    void open() {
        DatabaseOptions options;
        options.clock = clock_;
        db_ = std::make_unique<Database>(base_dir_, std::move(options));
    }

    // Re-open the registry on the same directory (for persistence tests).
    void reopen() {
        db_.reset();
        open();
    }

    static StoreValue value(int n) {
        return StoreValue::from_data({{"n", n}});
    }

    fs::path base_dir_;
    std::shared_ptr<MockClock> clock_ = std::make_shared<MockClock>();
    std::unique_ptr<Database> db_;
};

// ── Construction ──────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, CreatesBaseDirectoryAndRegistryFile) {
    EXPECT_TRUE(fs::is_directory(base_dir_));
    EXPECT_TRUE(fs::exists(base_dir_ / Database::kTableInfoFile));
    EXPECT_EQ(db_->base_dir(), base_dir_);
}

TEST_F(DatabaseTest, EmptyRegistryListsNothing) {
    EXPECT_TRUE(db_->list_tables().empty());
}

// ── create_*_table() ──────────────────────────────────────────────────────────

TEST_F(DatabaseTest, CreateKvTableRegistersType) {
    db_->create_kv_table("orders");
    auto tables = db_->list_tables();
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables.at("orders"), TableType::Kv);
    EXPECT_EQ(to_string(tables.at("orders")), "kv");
}

TEST_F(DatabaseTest, CreateKkvTableRegistersType) {
    db_->create_kkv_table("events");
    EXPECT_EQ(db_->list_tables().at("events"), TableType::Kkv);
}

TEST_F(DatabaseTest, CreateMakesBackingFile) {
    db_->create_kv_table("orders");
    EXPECT_EQ(db_->table_path("orders"), base_dir_ / "orders.db");
    EXPECT_TRUE(fs::exists(base_dir_ / "orders.db"));
}

TEST_F(DatabaseTest, CreateTwiceThrowsTableExists) {
    db_->create_kv_table("orders");
    EXPECT_THROW(db_->create_kv_table("orders"), TableExistsError);
    EXPECT_THROW(db_->create_kkv_table("orders"), TableExistsError);
    EXPECT_EQ(db_->list_tables().at("orders"), TableType::Kv);
}

TEST_F(DatabaseTest, CreateTwiceKeepsExistingData) {
    db_->create_kv_table("orders");
    db_->get_kv_table("orders")->set("o1", value(1));
    EXPECT_THROW(db_->create_kv_table("orders"), TableExistsError);
    EXPECT_TRUE(db_->get_kv_table("orders")->get("o1").has_value());
}

TEST_F(DatabaseTest, InvalidNamesThrowTableNameError) {
    EXPECT_THROW(db_->create_kv_table("1bad"), TableNameError);
    EXPECT_THROW(db_->create_kv_table("bad name"), TableNameError);
    EXPECT_THROW(db_->create_kkv_table("bad-name"), TableNameError);
    EXPECT_THROW(db_->create_kkv_table(""), TableNameError);
    EXPECT_TRUE(db_->list_tables().empty());
}

TEST_F(DatabaseTest, ReservedNameIsRejected) {
    EXPECT_THROW(db_->create_kv_table(Database::kTableInfoTable), TableExistsError);
    EXPECT_THROW(db_->create_kkv_table("_table_info"), StoreError);
    EXPECT_TRUE(db_->list_tables().empty());
}

TEST_F(DatabaseTest, CreateReplacesStaleUnregisteredFile) {
    // Debris from an interrupted drop: a file with no registry record.
    fs::create_directories(base_dir_ / "orders.db");
    std::ofstream(base_dir_ / "orders.db" / "junk") << "junk";

    db_->create_kv_table("orders");
    EXPECT_FALSE(fs::exists(base_dir_ / "orders.db" / "junk"));
    EXPECT_TRUE(db_->get_kv_table("orders")->list_keys().empty());
}

// ── get_table() ───────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, GetTableDispatchesOnType) {
    db_->create_kv_table("kvt");
    db_->create_kkv_table("kkvt");

    auto kv = db_->get_table("kvt");
    auto kkv = db_->get_table("kkvt");
    EXPECT_TRUE(std::holds_alternative<std::shared_ptr<KvTable>>(kv));
    EXPECT_TRUE(std::holds_alternative<std::shared_ptr<KkvTable>>(kkv));
    EXPECT_EQ(std::get<std::shared_ptr<KvTable>>(kv)->name(), "kvt");
    EXPECT_EQ(std::get<std::shared_ptr<KkvTable>>(kkv)->name(), "kkvt");
}

TEST_F(DatabaseTest, GetUnknownTableThrowsNotFound) {
    EXPECT_THROW((void)db_->get_table("missing"), TableNotFoundError);
    EXPECT_THROW((void)db_->get_table(Database::kTableInfoTable), TableNotFoundError);
}

TEST_F(DatabaseTest, GetTableWithMissingFileThrowsNotFound) {
    db_->create_kv_table("orders");
    fs::remove_all(base_dir_ / "orders.db");
    EXPECT_THROW((void)db_->get_table("orders"), TableNotFoundError);
    EXPECT_TRUE(db_->has_table("orders"));
}

TEST_F(DatabaseTest, TypedAccessorsCheckType) {
    db_->create_kv_table("kvt");
    db_->create_kkv_table("kkvt");
    EXPECT_NE(db_->get_kv_table("kvt"), nullptr);
    EXPECT_NE(db_->get_kkv_table("kkvt"), nullptr);
    EXPECT_THROW((void)db_->get_kv_table("kkvt"), TableTypeError);
    EXPECT_THROW((void)db_->get_kkv_table("kvt"), TableTypeError);
    EXPECT_THROW((void)db_->get_kv_table("missing"), TableNotFoundError);
}

TEST_F(DatabaseTest, EachGetReturnsNewObjectOverSameData) {
    db_->create_kv_table("orders");
    auto a = db_->get_kv_table("orders");
    auto b = db_->get_kv_table("orders");
    EXPECT_NE(a.get(), b.get());

    a->set("o1", value(1));
    auto got = b->get("o1");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->data.at("n"), 1);
}

TEST_F(DatabaseTest, TablesHaveSeparateData) {
    db_->create_kv_table("a");
    db_->create_kv_table("b");
    db_->get_kv_table("a")->set("k", value(1));
    EXPECT_FALSE(db_->get_kv_table("b")->get("k").has_value());
}

TEST_F(DatabaseTest, KvTablesUseConfiguredCacheTtl) {
    db_->create_kv_table("orders");
    auto reader = db_->get_kv_table("orders");
    auto writer = db_->get_kv_table("orders");

    reader->set("k", value(1));
    writer->set("k", value(2));
    EXPECT_EQ(reader->get("k")->data.at("n"), 1);

    clock_->advance(300s);
    EXPECT_EQ(reader->get("k")->data.at("n"), 2);
}

// ── table_info() ──────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, TableInfoCarriesTypeAndTimestamps) {
    const double before = unix_now();
    db_->create_kkv_table("events");
    auto info = db_->table_info("events");
    EXPECT_EQ(info.name, "events");
    EXPECT_EQ(info.type, TableType::Kkv);
    EXPECT_GE(info.created_at, before);
    EXPECT_GE(info.updated_at, info.created_at);
}

TEST_F(DatabaseTest, TableInfoOfUnknownTableThrows) {
    EXPECT_THROW((void)db_->table_info("missing"), TableNotFoundError);
    EXPECT_FALSE(db_->has_table("missing"));
}

TEST_F(DatabaseTest, NonNumericTimestampInRegistryIsStoreError) {
    DatabaseOptions options;
    options.connections = std::make_shared<ConnectionManager>();
    const auto dir = base_dir_ / "corrupt";
    Database db{dir, options};

    options.connections->acquire(dir / Database::kTableInfoFile)->upsert(
        Database::kTableInfoTable,
        Document{{"name", "broken"}, {"type", "kv"}, {"created_at", "yesterday"}},
        Query::where("name", "broken"));

    EXPECT_THROW((void)db.table_info("broken"), StoreError);
    EXPECT_THROW((void)db.list_tables(), StoreError);
}

// ── drop_table() ──────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, DropRemovesTableAndFile) {
    db_->create_kv_table("orders");
    db_->drop_table("orders");

    EXPECT_FALSE(fs::exists(base_dir_ / "orders.db"));
    EXPECT_TRUE(db_->list_tables().empty());
    EXPECT_THROW((void)db_->get_table("orders"), TableNotFoundError);
}

TEST_F(DatabaseTest, DropUnknownTableThrowsNotFound) {
    EXPECT_THROW(db_->drop_table("missing"), TableNotFoundError);
}

TEST_F(DatabaseTest, DropToleratesMissingFile) {
    db_->create_kv_table("orders");
    fs::remove_all(base_dir_ / "orders.db");
    EXPECT_NO_THROW(db_->drop_table("orders"));
    EXPECT_FALSE(db_->has_table("orders"));
}

TEST_F(DatabaseTest, DropLeavesOtherTablesIntact) {
    db_->create_kv_table("a");
    db_->create_kkv_table("b");
    db_->get_kkv_table("b")->set("p", "s", value(1));

    db_->drop_table("a");
    auto tables = db_->list_tables();
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables.at("b"), TableType::Kkv);
    EXPECT_TRUE(db_->get_kkv_table("b")->get("p", "s").has_value());
}

TEST_F(DatabaseTest, HandleFromBeforeDropFailsWithNotFound) {
    db_->create_kv_table("orders");
    auto table = db_->get_kv_table("orders");
    table->set("o1", value(1));

    db_->drop_table("orders");
    EXPECT_THROW((void)table->list_keys(), TableNotFoundError);
    EXPECT_THROW(table->set("o2", value(2)), TableNotFoundError);
}

TEST_F(DatabaseTest, RecreatedTableStartsEmpty) {
    db_->create_kv_table("orders");
    db_->get_kv_table("orders")->set("o1", value(1));
    db_->drop_table("orders");

    db_->create_kkv_table("orders");
    EXPECT_EQ(db_->list_tables().at("orders"), TableType::Kkv);
    EXPECT_TRUE(db_->get_kkv_table("orders")->list_all().empty());
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, RegistryAndDataSurviveReopen) {
    db_->create_kv_table("orders");
    db_->create_kkv_table("events");
    db_->get_kv_table("orders")->set("o1", value(1));
    db_->get_kkv_table("events")->set("day1", "e1", value(2));

    reopen();

    auto tables = db_->list_tables();
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables.at("orders"), TableType::Kv);
    EXPECT_EQ(tables.at("events"), TableType::Kkv);
    EXPECT_EQ(db_->get_kv_table("orders")->get("o1")->data.at("n"), 1);
    EXPECT_EQ(db_->get_kkv_table("events")->get("day1", "e1")->data.at("n"), 2);
}

TEST_F(DatabaseTest, SharedConnectionManagerServesTwoDatabases) {
    auto connections = std::make_shared<ConnectionManager>();
    const auto dir = base_dir_ / "shared";

    DatabaseOptions options;
    options.connections = connections;
    Database first{dir, options};
    Database second{dir, options};

    first.create_kv_table("orders");
    EXPECT_TRUE(second.has_table("orders"));
    first.get_kv_table("orders")->set("o1", value(1));
    EXPECT_TRUE(second.get_kv_table("orders")->get("o1").has_value());
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, ConcurrentCreatesOfSameNameSucceedOnce) {
    constexpr int kThreads = 6;
    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            try {
                db_->create_kv_table("orders");
                ++created;
            } catch (const TableExistsError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(db_->list_tables().size(), 1u);
}

TEST_F(DatabaseTest, ConcurrentCreatesAcrossDatabasesSucceedOnce) {
    DatabaseOptions options;
    options.connections = std::make_shared<ConnectionManager>();
    const auto dir = base_dir_ / "shared";
    Database first{dir, options};
    Database second{dir, options};

    for (int round = 0; round < 10; ++round) {
        const std::string name = "t" + std::to_string(round);
        std::atomic<bool> kv_created{false};
        std::atomic<bool> kkv_created{false};

        std::thread kv_creator{[&] {
            try {
                first.create_kv_table(name);
                kv_created = true;
            } catch (const TableExistsError&) {
            }
        }};
        std::thread kkv_creator{[&] {
            try {
                second.create_kkv_table(name);
                kkv_created = true;
            } catch (const TableExistsError&) {
            }
        }};
        kv_creator.join();
        kkv_creator.join();

        ASSERT_NE(kv_created.load(), kkv_created.load()) << "table " << name;
        const TableType expected = kv_created ? TableType::Kv : TableType::Kkv;
        EXPECT_EQ(first.table_info(name).type, expected);
        EXPECT_EQ(second.list_tables().at(name), expected);
        EXPECT_TRUE(fs::exists(dir / (name + Database::kTableFileExtension)));
        EXPECT_NO_THROW((void)second.get_table(name));
    }
}

TEST_F(DatabaseTest, GetDuringDropSeesWholeTableOrNotFound) {
    db_->create_kv_table("orders");
    db_->get_kv_table("orders")->set("o1", value(1));

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::thread reader{[&] {
        while (!done) {
            try {
                auto table = db_->get_kv_table("orders");
                (void)table->list_keys();
            } catch (const TableNotFoundError&) {
                // Dropped between (or during) the two calls.
            } catch (const StoreError&) {
                ++inconsistent;
            }
        }
    }};

    std::this_thread::sleep_for(10ms);
    db_->drop_table("orders");
    done = true;
    reader.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_FALSE(db_->has_table("orders"));
    EXPECT_FALSE(fs::exists(base_dir_ / "orders.db"));
}

TEST_F(DatabaseTest, ConcurrentWritersThroughSeparateHandles) {
    db_->create_kv_table("orders");
    constexpr int kThreads = 4;
    constexpr int kKeys    = 25;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            auto table = db_->get_kv_table("orders");
            for (int i = 0; i < kKeys; ++i) {
                table->set("t" + std::to_string(t) + "_" + std::to_string(i), value(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(db_->get_kv_table("orders")->list_keys().size(),
              static_cast<std::size_t>(kThreads * kKeys));
}

} // namespace funtable
