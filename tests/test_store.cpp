/**
 * @file test_store.cpp
 * @author Ashot Vardanian
 * @date 2022-07-06
 *
 * @brief Typed stores over buckets of the in-memory engine.
 */

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

#include "fixtures.hpp"

using namespace unum::ustash;
using namespace unum::ustash::test;
using namespace unum;

namespace fs = std::filesystem;

namespace {

primed_codec_ptr_t people_codec() {
    return *primer_t(std::make_shared<binary_codec_t>()).sample<person_t>().sample<address_t>().build();
}

class store_test : public ::testing::Test {
  protected:
    database_t db;

    void SetUp() override { db.open().throw_unhandled(); }
};

} // namespace

TEST_F(store_test, put_and_get) {
    for (auto const& codec : all_codecs()) {
        store_t people {db, "people", codec};
        EXPECT_TRUE(people.put("alice", make_person("Alice", 31)));
        person_t person;
        EXPECT_TRUE(people.get("alice", person));
        EXPECT_EQ(person, make_person("Alice", 31));

        EXPECT_TRUE(people.put("alice", make_person("Alice", 32)));
        EXPECT_TRUE(people.get(std::string("alice"), person));
        EXPECT_EQ(person.age, 32u);
        EXPECT_TRUE(people.delete_all());
    }
}

TEST_F(store_test, primed_people) {
    store_t people {db, "people", people_codec()};
    EXPECT_TRUE(people.put("a", person_t {"X"}));
    person_t person;
    EXPECT_TRUE(people.get("a", person));
    EXPECT_EQ(person.name, "X");
    EXPECT_EQ(person.age, 0u);
    EXPECT_TRUE(person.tags.empty());
}

TEST_F(store_test, missing_keys) {
    store_t people {db, "people", std::make_shared<json_codec_t>()};
    person_t person;
    status_t status = people.get("ghost", person);
    EXPECT_TRUE(status.is(not_found_k));

    EXPECT_TRUE(people.put("alice", make_person("Alice")));
    status = people.get("ghost", person);
    EXPECT_TRUE(status.is(not_found_k));
    status = people.pull("ghost", person);
    EXPECT_TRUE(status.is(not_found_k));
    EXPECT_TRUE(people.remove("ghost"));

    store_t nobody {db, "nobody", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(nobody.remove("ghost"));
}

TEST_F(store_test, pull) {
    store_t people {db, "people", std::make_shared<binary_codec_t>()};
    EXPECT_TRUE(people.put("alice", make_person("Alice")));
    person_t person;
    EXPECT_TRUE(people.pull("alice", person));
    EXPECT_EQ(person, make_person("Alice"));

    status_t status = people.get("alice", person);
    EXPECT_TRUE(status.is(not_found_k));
    status = people.pull("alice", person);
    EXPECT_TRUE(status.is(not_found_k));
}

TEST_F(store_test, concurrent_pulls) {
    constexpr std::size_t keys_count_k = 500;
    constexpr std::size_t threads_count_k = 8;
    store_t numbers {db, "numbers", std::make_shared<binary_codec_t>()};
    for (std::size_t i = 0; i != keys_count_k; ++i)
        ASSERT_TRUE(numbers.put(fmt::format("{:04}", i), std::uint64_t(i)));

    // Every thread tries to pull every key, but each key has a single winner.
    std::vector<std::vector<std::size_t>> pulled(threads_count_k);
    std::vector<std::size_t> failures(threads_count_k, 0);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t != threads_count_k; ++t)
        threads.emplace_back([&, t] {
            for (std::size_t i = 0; i != keys_count_k; ++i) {
                std::uint64_t value = 0;
                status_t status = numbers.pull(fmt::format("{:04}", i), value);
                if (status)
                    pulled[t].push_back(value);
                else if (!status.is(not_found_k))
                    ++failures[t];
            }
        });
    for (auto& thread : threads)
        thread.join();

    std::vector<std::size_t> hits(keys_count_k, 0);
    std::size_t total = 0;
    for (std::size_t t = 0; t != threads_count_k; ++t) {
        EXPECT_EQ(failures[t], 0u);
        total += pulled[t].size();
        for (std::size_t value : pulled[t]) {
            ASSERT_LT(value, keys_count_k);
            ++hits[value];
        }
    }
    EXPECT_EQ(total, keys_count_k);
    for (std::size_t i = 0; i != keys_count_k; ++i)
        EXPECT_EQ(hits[i], 1u) << i;

    std::size_t left = 0;
    EXPECT_TRUE(numbers.for_each([&](std::uint64_t) { ++left; }));
    EXPECT_EQ(left, 0u);
}

TEST_F(store_test, remove) {
    store_t people {db, "people", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(people.put("alice", make_person("Alice")));
    EXPECT_TRUE(people.put("bob", make_person("Bob")));
    EXPECT_TRUE(people.remove("alice"));
    EXPECT_TRUE(people.remove("alice"));

    person_t person;
    EXPECT_TRUE(people.get("alice", person).is(not_found_k));
    EXPECT_TRUE(people.get("bob", person));
}

TEST_F(store_test, delete_all) {
    store_t people {db, "people", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(people.put("alice", make_person("Alice")));
    EXPECT_TRUE(people.put("bob", make_person("Bob")));
    EXPECT_TRUE(people.delete_all());
    EXPECT_TRUE(people.delete_all());

    person_t person;
    EXPECT_TRUE(people.get("alice", person).is(not_found_k));
    EXPECT_TRUE(people.pull("alice", person).is(not_found_k));
    EXPECT_TRUE(people.pull("ghost", person).is(not_found_k));
    std::size_t calls = 0;
    EXPECT_TRUE(people.for_each([&](person_t const&) { ++calls; }));
    EXPECT_EQ(calls, 0u);

    // The bucket is usable again.
    EXPECT_TRUE(people.put("carol", make_person("Carol")));
    EXPECT_TRUE(people.get("carol", person));
}

TEST_F(store_test, nested) {
    store_t people {db, "people", std::make_shared<json_codec_t>()};
    auto friends = people.nested("friends");
    ASSERT_TRUE(friends);
    EXPECT_EQ(friends->codec(), people.codec());
    auto close_friends = friends->nested("close");
    ASSERT_TRUE(close_friends);

    EXPECT_TRUE(people.put("alice", make_person("Alice")));
    EXPECT_TRUE(friends->put("alice", make_person("Alice's friend")));
    EXPECT_TRUE(close_friends->put("alice", make_person("Alice's close friend")));

    person_t person;
    EXPECT_TRUE(people.get("alice", person));
    EXPECT_EQ(person.name, "Alice");
    EXPECT_TRUE(friends->get("alice", person));
    EXPECT_EQ(person.name, "Alice's friend");

    // Parent scans don't see nested records.
    std::size_t calls = 0;
    EXPECT_TRUE(people.for_each([&](person_t const&) { ++calls; }));
    EXPECT_EQ(calls, 1u);

    // Siblings with common prefixes stay untouched.
    store_t peoples {db, "peoples", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(peoples.put("alice", make_person("Alice")));

    EXPECT_TRUE(people.delete_all());
    EXPECT_TRUE(friends->get("alice", person).is(not_found_k));
    EXPECT_TRUE(close_friends->get("alice", person).is(not_found_k));
    EXPECT_TRUE(peoples.get("alice", person));
}

TEST_F(store_test, nested_names) {
    store_t people {db, "people", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(people.nested("").status().is(args_wrong_k));
    EXPECT_TRUE(people.nested(std::string_view("a\0b", 3)).status().is(args_wrong_k));
    EXPECT_TRUE(store_t {}.nested("friends").status().is(uninitialized_state_k));
}

TEST_F(store_test, encoded_keys) {
    store_t homes {db, "homes", std::make_shared<binary_codec_t>()};
    address_t address {"Yerevan", "Abovyan", 2};
    EXPECT_TRUE(homes.put(address, make_person("Ann")));
    EXPECT_TRUE(homes.put(std::int64_t(42), make_person("Ben")));

    person_t person;
    EXPECT_TRUE(homes.get(address, person));
    EXPECT_EQ(person.name, "Ann");
    EXPECT_TRUE(homes.get(std::int64_t(42), person));
    EXPECT_EQ(person.name, "Ben");
    EXPECT_TRUE(homes.get(address_t {"Yerevan", "Abovyan", 3}, person).is(not_found_k));
}

TEST_F(store_test, pinned_codecs) {
    store_t people {db, "people", people_codec()};
    EXPECT_TRUE(people.pin_codec());
    EXPECT_TRUE(people.pin_codec());
    EXPECT_TRUE(store_t(db, "people", people_codec()).pin_codec());

    auto reordered = primer_t(std::make_shared<binary_codec_t>()).sample<address_t>().sample<person_t>().build();
    ASSERT_TRUE(reordered);
    status_t status = store_t(db, "people", *reordered).pin_codec();
    EXPECT_TRUE(status.is(unmarshal_k));
    status = store_t(db, "people", std::make_shared<json_codec_t>()).pin_codec();
    EXPECT_TRUE(status.is(unmarshal_k));

    // Every bucket gets its own pin.
    EXPECT_TRUE(store_t(db, "other", std::make_shared<json_codec_t>()).pin_codec());
}

TEST_F(store_test, pinned_text_codecs) {
    store_t plain {db, "people", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(plain.pin_codec());
    EXPECT_TRUE(plain.put("a", make_person("A")));

    // Text formats read the same, whether primed, pooled or neither.
    auto primed = primer_t(std::make_shared<json_codec_t>()).sample<person_t>().build();
    ASSERT_TRUE(primed);
    store_t primed_store {db, "people", *primed};
    status_t status = primed_store.pin_codec();
    EXPECT_TRUE(status) << status.message();
    person_t person;
    EXPECT_TRUE(primed_store.get("a", person));
    EXPECT_EQ(person, make_person("A"));

    store_t pooled_store {db, "people", make_pooled(*primed)};
    EXPECT_TRUE(pooled_store.pin_codec());
    EXPECT_TRUE(store_t(db, "people", std::make_shared<xml_codec_t>()).pin_codec().is(unmarshal_k));
}

TEST_F(store_test, uninitialized) {
    store_t nothing;
    person_t person;
    EXPECT_TRUE(nothing.put("a", person).is(uninitialized_state_k));
    EXPECT_TRUE(nothing.get("a", person).is(uninitialized_state_k));
    EXPECT_TRUE(nothing.remove("a").is(uninitialized_state_k));
    EXPECT_TRUE(nothing.delete_all().is(uninitialized_state_k));
    EXPECT_TRUE(nothing.for_each([](person_t const&) {}).is(uninitialized_state_k));

    store_t codecless {db, "people", nullptr};
    EXPECT_TRUE(codecless.put("a", person).is(uninitialized_state_k));
}

TEST_F(store_test, encoding_failures) {
    register_shapes();
    store_t shapes {db, "shapes", std::make_shared<binary_codec_t>()};
    std::shared_ptr<shape_t> triangle = std::make_shared<triangle_t>();
    status_t status = shapes.put("t", triangle);
    EXPECT_TRUE(status.is(marshal_k));

    // Nothing was written, not even the bucket.
    bool exists = true;
    status = db.view([&](transaction_t& txn) -> status_t {
        auto contains = txn.contains("shapes");
        if (!contains)
            return contains.release_status();
        exists = *contains;
        return {};
    });
    EXPECT_TRUE(status);
    EXPECT_FALSE(exists);

    std::shared_ptr<shape_t> circle = std::make_shared<circle_t>(2.0);
    EXPECT_TRUE(shapes.put("c", circle));
    std::shared_ptr<shape_t> restored;
    EXPECT_TRUE(shapes.get("c", restored));
    ASSERT_TRUE(restored);
    EXPECT_DOUBLE_EQ(restored->area(), circle->area());
}

TEST(store, persistence) {
    std::string directory = "./tmp/store/";
    fs::remove_all(directory);
    fs::create_directories(directory);
    std::string config = config_for(directory.c_str());

    {
        database_t db;
        db.open(config.c_str()).throw_unhandled();
        store_t people {db, "people", people_codec()};
        EXPECT_TRUE(people.pin_codec());
        EXPECT_TRUE(people.put("alice", make_person("Alice")));
        auto friends = people.nested("friends");
        ASSERT_TRUE(friends);
        EXPECT_TRUE(friends->put("bob", make_person("Bob")));
    }
    {
        database_t db;
        db.open(config.c_str()).throw_unhandled();
        store_t people {db, "people", people_codec()};
        EXPECT_TRUE(people.pin_codec());
        person_t person;
        EXPECT_TRUE(people.get("alice", person));
        EXPECT_EQ(person, make_person("Alice"));
        EXPECT_TRUE(people.nested("friends")->get("bob", person));
        EXPECT_EQ(person, make_person("Bob"));
    }
    fs::remove_all(directory);
}

TEST(store, snapshot_layout) {
    std::string directory = "./tmp/layout/";
    fs::remove_all(directory);
    fs::create_directories(directory);
    std::string config = config_for(directory.c_str());

    {
        database_t db;
        db.open(config.c_str()).throw_unhandled();
        status_t status = db.update([](transaction_t& txn) -> status_t {
            status_t ensured = txn.ensure("abc");
            return_if_error_m(ensured);
            return txn.write("abc", "key", std::string(300, 'v'));
        });
        ASSERT_TRUE(status) << status.message();
    }

    // After the header line, every chunk is prefixed with a little-endian length.
    std::ifstream file(fs::path(directory) / "ustash.stl", std::ios::binary);
    ASSERT_TRUE(file);
    std::string bytes {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    std::size_t header_end = bytes.find('\n');
    ASSERT_NE(header_end, std::string::npos);
    std::string expected;
    expected += std::string("\x03\x00\x00\x00", 4) + "abc";
    expected += std::string("\x01\x00\x00\x00", 4) + "1";
    expected += std::string("\x03\x00\x00\x00", 4) + "key";
    expected += std::string("\x2C\x01\x00\x00", 4) + std::string(300, 'v');
    EXPECT_EQ(bytes.substr(header_end + 1), expected);

    {
        database_t db;
        db.open(config.c_str()).throw_unhandled();
        bool found = false;
        buffer_t value;
        EXPECT_TRUE(db.view([&](transaction_t& txn) { return txn.read("abc", "key", found, value); }));
        EXPECT_TRUE(found);
        EXPECT_EQ(value, std::string(300, 'v'));
    }
    fs::remove_all(directory);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
