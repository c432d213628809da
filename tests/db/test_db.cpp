// STELLEND - Database Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/db/database.h"
#include "stellend/db/leveldb.h"

#include <filesystem>
#include <random>

using namespace stellend::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stellend_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, database] = OpenDatabase(testDir_ / "state");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(database);
    }
};

// ============================================================================
// Slice Tests
// ============================================================================

TEST(SliceTest, Basics) {
    Slice empty;
    EXPECT_TRUE(empty.empty());

    std::string s = "hello";
    Slice a(s);
    EXPECT_EQ(a.size(), 5u);
    EXPECT_EQ(a.ToString(), "hello");
    EXPECT_EQ(a, Slice("hello"));
    EXPECT_NE(a, Slice("hellp"));
}

// ============================================================================
// WriteBatch Tests
// ============================================================================

TEST(WriteBatchTest, KeepsInsertionOrder) {
    WriteBatch batch;
    EXPECT_TRUE(batch.Empty());
    batch.Put("a", "1");
    batch.Delete("b");
    batch.Put("c", "3");
    EXPECT_EQ(batch.Count(), 3u);

    std::vector<std::string> seen;
    batch.Iterate([&seen](const std::string& key, const std::optional<std::string>& value) {
        seen.push_back(key + (value ? "=" + *value : "-"));
    });
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "a=1");
    EXPECT_EQ(seen[1], "b-");
    EXPECT_EQ(seen[2], "c=3");

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    auto database = OpenMemoryDatabase();
    std::string value;

    EXPECT_TRUE(database->Get("k", &value).IsNotFound());
    ASSERT_TRUE(database->Put("k", "v").ok());
    ASSERT_TRUE(database->Get("k", &value).ok());
    EXPECT_EQ(value, "v");
    EXPECT_TRUE(database->Exists("k"));

    ASSERT_TRUE(database->Delete("k").ok());
    EXPECT_FALSE(database->Exists("k"));
}

TEST(MemoryDatabaseTest, BatchWrite) {
    MemoryDatabase database;
    ASSERT_TRUE(database.Put(WriteOptions(), "old", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("old");
    ASSERT_TRUE(database.Write(WriteOptions(), &batch).ok());

    EXPECT_EQ(database.Size(), 2u);
    std::string value;
    EXPECT_TRUE(database.Get("a", &value).ok());
    EXPECT_EQ(value, "1");
    EXPECT_TRUE(database.Get("old", &value).IsNotFound());
}

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndReadWrite) {
    auto database = Open();
    ASSERT_NE(database, nullptr);

    ASSERT_TRUE(database->Put("gov_counter", "value").ok());
    std::string value;
    ASSERT_TRUE(database->Get("gov_counter", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_TRUE(database->Get("missing", &value).IsNotFound());
}

TEST_F(DatabaseTest, BatchIsApplied) {
    auto database = Open();
    ASSERT_NE(database, nullptr);
    ASSERT_TRUE(database->Put("gone", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", std::string("\x00\x01", 2));
    batch.Delete("gone");
    ASSERT_TRUE(database->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(database->Get("b", &value).ok());
    EXPECT_EQ(value, std::string("\x00\x01", 2));
    EXPECT_FALSE(database->Exists("gone"));
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto database = Open();
        ASSERT_NE(database, nullptr);
        ASSERT_TRUE(database->Put("admin", "abc").ok());
    }
    auto database = Open();
    ASSERT_NE(database, nullptr);
    std::string value;
    ASSERT_TRUE(database->Get("admin", &value).ok());
    EXPECT_EQ(value, "abc");
}

TEST_F(DatabaseTest, Destroy) {
    {
        auto database = Open();
        ASSERT_NE(database, nullptr);
        ASSERT_TRUE(database->Put("k", "v").ok());
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "state").ok());

    auto database = Open();
    ASSERT_NE(database, nullptr);
    std::string value;
    EXPECT_TRUE(database->Get("k", &value).IsNotFound());
}

TEST(DatabaseStatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("x").ToString(), "NotFound: x");
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
}
