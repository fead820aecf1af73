// NeuroShield - Database Tests
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include <gtest/gtest.h>
#include "neuroshield/db/database.h"
#include "neuroshield/db/leveldb.h"
#include <filesystem>
#include <random>

using namespace neuroshield;
using namespace neuroshield::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::TestWithParam<std::string> {
protected:
    std::filesystem::path testDir_;
    std::unique_ptr<Database> db_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("neuroshield_db_test_" + std::to_string(dis(gen)));
        db_ = Open();
        ASSERT_NE(db_, nullptr);
    }

    void TearDown() override {
        db_.reset();
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        if (GetParam() == "memory") {
            return OpenMemoryDatabase();
        }
        auto [status, db] = OpenDatabase(testDir_);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_P(DatabaseTest, PutGetDelete) {
    EXPECT_STREQ(db_->Name(), GetParam().c_str());

    ASSERT_TRUE(db_->Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(db_->Get("key", &value).ok());
    EXPECT_EQ(value, "value");

    ASSERT_TRUE(db_->Delete("key").ok());
    Status s = db_->Get("key", &value);
    EXPECT_TRUE(s.IsNotFound());
}

TEST_P(DatabaseTest, BinaryKeysAndValues) {
    std::string key = MakeKey(prefix::JOURNAL, 1);
    std::string payload("\x00\x01\x02", 3);
    ASSERT_TRUE(db_->Put(key, payload).ok());

    std::string value;
    ASSERT_TRUE(db_->Get(key, &value).ok());
    EXPECT_EQ(value, payload);
}

TEST_P(DatabaseTest, WriteBatchIsApplied) {
    ASSERT_TRUE(db_->Put("stale", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("stale");
    EXPECT_EQ(batch.Count(), 3u);

    WriteOptions options;
    options.sync = true;
    ASSERT_TRUE(db_->Write(options, &batch).ok());

    std::string value;
    EXPECT_TRUE(db_->Get("a", &value).ok());
    EXPECT_EQ(value, "1");
    EXPECT_TRUE(db_->Get("b", &value).ok());
    EXPECT_TRUE(db_->Get("stale", &value).IsNotFound());
}

TEST_P(DatabaseTest, IteratorOrderAndSeek) {
    for (uint64_t seq : {3, 1, 2, 300}) {
        ASSERT_TRUE(db_->Put(MakeKey(prefix::JOURNAL, seq), std::to_string(seq)).ok());
    }
    ASSERT_TRUE(db_->Put(MakeKey(prefix::JOURNAL_HEAD), "head").ok());

    auto it = db_->NewIterator();
    std::vector<std::string> seen;
    std::string journalPrefix = MakeKey(prefix::JOURNAL);
    for (it->Seek(journalPrefix); it->Valid() && it->key().starts_with(journalPrefix); it->Next()) {
        seen.push_back(it->value().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3", "300"}));

    it->SeekToFirst();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "h");
}

TEST_P(DatabaseTest, ReopenKeepsData) {
    if (GetParam() == "memory") {
        GTEST_SKIP() << "memory backend is not persistent";
    }
    ASSERT_TRUE(db_->Put(MakeKey(prefix::VERSION), "1").ok());
    db_.reset();

    db_ = Open();
    ASSERT_NE(db_, nullptr);
    std::string value;
    ASSERT_TRUE(db_->Get(MakeKey(prefix::VERSION), &value).ok());
    EXPECT_EQ(value, "1");
}

INSTANTIATE_TEST_SUITE_P(Backends, DatabaseTest, ::testing::Values("memory", "leveldb"));

// ============================================================================
// Helpers
// ============================================================================

TEST(DatabaseHelpersTest, MakeKeySortsNumerically) {
    EXPECT_EQ(MakeKey(prefix::JOURNAL, 1).size(), 9u);
    EXPECT_LT(MakeKey(prefix::JOURNAL, 255), MakeKey(prefix::JOURNAL, 256));
    EXPECT_LT(MakeKey(prefix::JOURNAL, 1), MakeKey(prefix::JOURNAL, 1ULL << 40));
}

TEST(DatabaseHelpersTest, SerializeHelpers) {
    std::string encoded = SerializeToString(std::string("escrow"));
    std::string decoded;
    ASSERT_TRUE(DeserializeFromString(encoded, decoded));
    EXPECT_EQ(decoded, "escrow");

    EXPECT_FALSE(DeserializeFromString(encoded + "x", decoded));
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, 3), decoded));
}

TEST(DatabaseHelpersTest, StatusToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::Corruption("bad hash").ToString(), "Corruption: bad hash");
    EXPECT_TRUE(Status::IOError().IsIOError());
    EXPECT_FALSE(Status::NotSupported().ok());
}

TEST(DatabaseHelpersTest, SliceComparison) {
    Slice a("abc");
    EXPECT_TRUE(a.starts_with("ab"));
    EXPECT_FALSE(a.starts_with("abcd"));
    EXPECT_EQ(a, Slice(std::string("abc")));
    EXPECT_TRUE(Slice().empty());
}
