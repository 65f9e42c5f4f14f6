/**
 * @file test_engine.cpp
 * @author Ashot Vardanian
 * @date 2022-07-06
 *
 * @brief Transactional contract shared by all engines.
 * Compiled once per engine. Persistent engines get a directory
 * through `USTASH_TEST_PATH`.
 */

#include <filesystem>
#include <optional>

#include "fixtures.hpp"

using namespace unum::ustash;
using namespace unum::ustash::test;
using namespace unum;

namespace fs = std::filesystem;

namespace {

class engine_test : public ::testing::Test {
  protected:
    std::string config = config_for(path());
    database_t db;

    void SetUp() override {
        status_t status = db.open(config.c_str());
        ASSERT_TRUE(status) << engine_name() << ": " << status.message();
    }

    /** @brief Creates an empty bucket, removing leftovers of previous runs. */
    void fresh(std::string const& bucket) {
        status_t status = db.update([&](transaction_t& txn) -> status_t {
            status_t dropped = txn.drop(bucket);
            return_if_error_m(dropped);
            return txn.ensure(bucket);
        });
        ASSERT_TRUE(status) << status.message();
    }

    bool exists(std::string const& bucket) {
        bool result = false;
        status_t status = db.view([&](transaction_t& txn) -> status_t {
            auto contains = txn.contains(bucket);
            if (!contains)
                return contains.release_status();
            result = *contains;
            return {};
        });
        EXPECT_TRUE(status) << status.message();
        return result;
    }

    std::optional<std::string> read(std::string const& bucket, std::string const& key) {
        bool found = false;
        buffer_t value;
        status_t status = db.view([&](transaction_t& txn) { return txn.read(bucket, key, found, value); });
        EXPECT_TRUE(status) << status.message();
        if (!found)
            return std::nullopt;
        return value;
    }

    std::vector<std::string> keys(std::string const& bucket) {
        std::vector<std::string> result;
        status_t status = db.view([&](transaction_t& txn) {
            return txn.scan(bucket, [&](value_view_t key, value_view_t, bool&) -> status_t {
                result.push_back(key.str());
                return {};
            });
        });
        EXPECT_TRUE(status) << status.message();
        return result;
    }
};

} // namespace

TEST_F(engine_test, commit) {
    fresh("commit");
    status_t status = db.update([](transaction_t& txn) -> status_t {
        status_t written = txn.write("commit", "key", "value");
        return_if_error_m(written);
        return txn.write("commit", "empty", "");
    });
    EXPECT_TRUE(status) << status.message();
    EXPECT_EQ(read("commit", "key"), "value");
    EXPECT_EQ(read("commit", "empty"), "");
    EXPECT_EQ(read("commit", "missing"), std::nullopt);

    status = db.update([](transaction_t& txn) { return txn.remove("commit", "key"); });
    EXPECT_TRUE(status);
    EXPECT_EQ(read("commit", "key"), std::nullopt);
}

TEST_F(engine_test, rollback) {
    fresh("rollback");
    EXPECT_TRUE(db.update([](transaction_t& txn) { return txn.write("rollback", "kept", "1"); }));
    {
        auto txn = db.transact();
        ASSERT_TRUE(txn);
        EXPECT_TRUE(txn->write("rollback", "dropped", "2"));
        EXPECT_TRUE(txn->remove("rollback", "kept"));
        EXPECT_TRUE(txn->ensure("rollback_created"));
    }
    EXPECT_EQ(read("rollback", "kept"), "1");
    EXPECT_EQ(read("rollback", "dropped"), std::nullopt);
    EXPECT_FALSE(exists("rollback_created"));

    // Failing bodies are rolled back as well.
    status_t status = db.update([](transaction_t& txn) -> status_t {
        status_t written = txn.write("rollback", "dropped", "3");
        return_if_error_m(written);
        return {args_wrong_k, "Give up"};
    });
    EXPECT_TRUE(status.is(args_wrong_k));
    EXPECT_EQ(read("rollback", "dropped"), std::nullopt);
}

TEST_F(engine_test, rollback_restores_removed) {
    std::string parent = "restored";
    std::string child = parent + bucket_separator_k + "nested";
    fresh(parent);
    fresh(child);
    std::string long_value(1000, 'x');
    EXPECT_TRUE(db.update([&](transaction_t& txn) -> status_t {
        status_t written = txn.write(parent, "a", long_value);
        return_if_error_m(written);
        written = txn.write(parent, "b", "2");
        return_if_error_m(written);
        return txn.write(child, "c", "3");
    }));

    status_t status = db.update([&](transaction_t& txn) -> status_t {
        status_t removed = txn.remove(parent, "a");
        return_if_error_m(removed);
        status_t dropped = txn.drop(parent);
        return_if_error_m(dropped);
        return {args_wrong_k, "Give up"};
    });
    EXPECT_TRUE(status.is(args_wrong_k));
    EXPECT_TRUE(exists(parent));
    EXPECT_TRUE(exists(child));
    EXPECT_EQ(read(parent, "a"), long_value);
    EXPECT_EQ(read(parent, "b"), "2");
    EXPECT_EQ(read(child, "c"), "3");
    EXPECT_EQ(keys(parent), (std::vector<std::string> {"a", "b"}));
}

TEST_F(engine_test, read_only) {
    fresh("read_only");
    auto txn = db.transact(txn_mode_t::read_k);
    ASSERT_TRUE(txn);
    EXPECT_TRUE(txn->write("read_only", "key", "value").is(args_wrong_k));
    EXPECT_TRUE(txn->remove("read_only", "key").is(args_wrong_k));
    EXPECT_TRUE(txn->ensure("read_only_other").is(args_wrong_k));
    EXPECT_TRUE(txn->drop("read_only").is(args_wrong_k));
}

TEST_F(engine_test, empty_bucket_names) {
    auto txn = db.transact();
    ASSERT_TRUE(txn);
    EXPECT_TRUE(txn->ensure("").is(args_wrong_k));
}

TEST_F(engine_test, missing_buckets) {
    EXPECT_TRUE(db.update([](transaction_t& txn) { return txn.drop("missing"); }));
    EXPECT_FALSE(exists("missing"));

    status_t status = db.update([](transaction_t& txn) { return txn.write("missing", "key", "value"); });
    EXPECT_TRUE(status.is(not_found_k));
    EXPECT_EQ(read("missing", "key"), std::nullopt);
    EXPECT_TRUE(keys("missing").empty());
    EXPECT_TRUE(db.update([](transaction_t& txn) { return txn.remove("missing", "key"); }));
    EXPECT_FALSE(exists("missing"));
}

TEST_F(engine_test, recursive_drop) {
    std::string parent = "drop";
    std::string child = parent + bucket_separator_k + "nested";
    std::string sibling = "dropped";
    fresh(parent);
    fresh(child);
    fresh(sibling);
    EXPECT_TRUE(db.update([&](transaction_t& txn) -> status_t {
        for (auto const& bucket : {parent, child, sibling}) {
            status_t status = txn.write(bucket, "key", bucket);
            return_if_error_m(status);
        }
        return {};
    }));
    EXPECT_EQ(keys(parent), std::vector<std::string> {"key"});

    EXPECT_TRUE(db.update([&](transaction_t& txn) { return txn.drop(parent); }));
    EXPECT_FALSE(exists(parent));
    EXPECT_FALSE(exists(child));
    EXPECT_TRUE(exists(sibling));
    EXPECT_EQ(read(child, "key"), std::nullopt);
    EXPECT_EQ(read(sibling, "key"), sibling);
}

TEST_F(engine_test, scans) {
    fresh("scans");
    EXPECT_TRUE(db.update([](transaction_t& txn) -> status_t {
        for (char const* key : {"c", "a", "b", "ab"}) {
            status_t status = txn.write("scans", key, key);
            return_if_error_m(status);
        }
        return {};
    }));
    EXPECT_EQ(keys("scans"), (std::vector<std::string> {"a", "ab", "b", "c"}));

    std::vector<std::string> values;
    status_t status = db.view([&](transaction_t& txn) {
        return txn.scan("scans", [&](value_view_t, value_view_t value, bool& proceed) -> status_t {
            values.push_back(value.str());
            proceed = values.size() < 2;
            return {};
        });
    });
    EXPECT_TRUE(status);
    EXPECT_EQ(values, (std::vector<std::string> {"a", "ab"}));

    status = db.view([&](transaction_t& txn) {
        return txn.scan("scans", [&](value_view_t, value_view_t, bool&) -> status_t {
            return {unmarshal_k, "Stop"};
        });
    });
    EXPECT_TRUE(status.is(unmarshal_k));
}

TEST_F(engine_test, persistence) {
    if (!path())
        GTEST_SKIP() << engine_name() << " runs in memory";

    fresh("persistence");
    EXPECT_TRUE(db.update([](transaction_t& txn) { return txn.write("persistence", "key", "value"); }));
    db.close();
    ASSERT_TRUE(db.open(config.c_str()));
    EXPECT_TRUE(exists("persistence"));
    EXPECT_EQ(read("persistence", "key"), "value");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    if (path()) {
        std::error_code error;
        fs::create_directories(path(), error);
        if (error) {
            fmt::print(stderr, "Failed to create {}: {}\n", path(), error.message());
            return 1;
        }
    }
    return RUN_ALL_TESTS();
}
