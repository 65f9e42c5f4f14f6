/**
 * @file test_dispatch.cpp
 * @author Ashot Vardanian
 * @date 2022-07-06
 *
 * @brief Iterating over stored records with callbacks of different signatures.
 */

#include <map>
#include <stdexcept>

#include "fixtures.hpp"

using namespace unum::ustash;
using namespace unum::ustash::test;
using namespace unum;

static_assert(callable_traits_gt<void(int)>::arity_k == 1);
static_assert(callable_traits_gt<bool (*)(int, float)>::arity_k == 2);
static_assert(std::is_same_v<callable_traits_gt<bool (*)(int, float)>::result_t, bool>);
static_assert(callable_traits_gt<std::function<void(int)>>::callable_k);
static_assert(!callable_traits_gt<int>::callable_k);

namespace {

auto const generic_lambda = [](auto const&) {};
auto const three_args_lambda = [](std::string const&, person_t const&, int) {};
static_assert(!callable_traits_gt<std::decay_t<decltype(generic_lambda)>>::callable_k);
static_assert(dispatcher_gt<std::decay_t<decltype(three_args_lambda)>>::arity_k == 3);
static_assert(!dispatcher_gt<std::decay_t<decltype(three_args_lambda)>>::supported_k);

std::size_t adults_count = 0;

void count_adults(person_t const& person) {
    if (person.age >= 18)
        ++adults_count;
}

class dispatch_test : public ::testing::Test {
  protected:
    database_t db;
    store_t people;

    void SetUp() override {
        db.open().throw_unhandled();
        people = store_t {db, "people", std::make_shared<json_codec_t>()};
        people.put("a", make_person("Ann", 10)).throw_unhandled();
        people.put("b", make_person("Ben", 20)).throw_unhandled();
        people.put("c", make_person("Cid", 30)).throw_unhandled();
    }
};

} // namespace

TEST_F(dispatch_test, rejected_callbacks) {
    status_t status = people.for_each([]() {});
    EXPECT_TRUE(status.is(invalid_callback_k));
    status = people.for_each(three_args_lambda);
    EXPECT_TRUE(status.is(invalid_callback_k));
    status = people.for_each(generic_lambda);
    EXPECT_TRUE(status.is(invalid_callback_k));
}

TEST_F(dispatch_test, value_parameters) {
    std::vector<std::string> names;
    EXPECT_TRUE(people.for_each([&](person_t const& person) { names.push_back(person.name); }));
    EXPECT_TRUE(people.for_each([&](person_t person) { names.push_back(std::move(person.name)); }));
    EXPECT_TRUE(people.for_each([&](person_t& person) { names.push_back(person.name); }));
    EXPECT_TRUE(people.for_each([&](person_t const* person) { names.push_back(person->name); }));
    EXPECT_TRUE(people.for_each([&](person_name_t name) { names.push_back(name.name); }));

    std::vector<std::string> expected;
    for (std::size_t i = 0; i != 5; ++i)
        expected.insert(expected.end(), {"Ann", "Ben", "Cid"});
    EXPECT_EQ(names, expected);
}

TEST_F(dispatch_test, raw_keys) {
    std::string joined;
    EXPECT_TRUE(people.for_each([&](std::string const& key, person_t const&) { joined += key; }));
    EXPECT_TRUE(people.for_each([&](std::string_view key, person_t const&) { joined += key; }));
    EXPECT_TRUE(people.for_each([&](std::vector<std::uint8_t> const& key, person_t const&) {
        joined.append(key.begin(), key.end());
    }));
    EXPECT_EQ(joined, "abcabcabc");
}

TEST_F(dispatch_test, encoded_keys) {
    store_t homes {db, "homes", std::make_shared<json_codec_t>()};
    EXPECT_TRUE(homes.put(address_t {"Yerevan", "Abovyan", 2}, make_person("Ann")));
    EXPECT_TRUE(homes.put(address_t {"Gyumri", "Rustaveli", 1}, make_person("Ben")));

    std::map<address_t, std::string> owners;
    EXPECT_TRUE(homes.for_each([&](address_t const& address, person_t const& person) {
        owners.emplace(address, person.name);
    }));
    ASSERT_EQ(owners.size(), 2u);
    EXPECT_EQ(owners.begin()->second, "Ben");
    EXPECT_EQ(owners.begin()->first.city, "Gyumri");
}

TEST_F(dispatch_test, early_stop) {
    std::size_t calls = 0;
    EXPECT_TRUE(people.for_each([&](person_t const&) { return ++calls < 2; }));
    EXPECT_EQ(calls, 2u);
}

TEST_F(dispatch_test, failing_callbacks) {
    std::size_t calls = 0;
    status_t status = people.for_each([&](person_t const&) -> status_t {
        ++calls;
        return {args_wrong_k, "Enough"};
    });
    EXPECT_TRUE(status.is(args_wrong_k));
    EXPECT_EQ(calls, 1u);

    status = people.for_each([&](person_t const&) { throw std::runtime_error("Bad person"); });
    EXPECT_TRUE(status.is(error_unknown_k));
    EXPECT_NE(std::string(status.message()).find("Bad person"), std::string::npos);

    // Results of other types are ignored.
    calls = 0;
    EXPECT_TRUE(people.for_each([&](person_t const&) { return ++calls; }));
    EXPECT_EQ(calls, 3u);
}

TEST_F(dispatch_test, function_pointers) {
    adults_count = 0;
    EXPECT_TRUE(people.for_each(count_adults));
    EXPECT_TRUE(people.for_each(&count_adults));
    EXPECT_EQ(adults_count, 4u);
}

TEST_F(dispatch_test, decoding_failures) {
    store_t binary_people {db, "people", std::make_shared<binary_codec_t>()};
    std::size_t calls = 0;
    status_t status = binary_people.for_each([&](person_t const&) { ++calls; });
    EXPECT_TRUE(status.is(unmarshal_k));
    EXPECT_EQ(calls, 0u);

    // Structurally incompatible types fail as well.
    status = people.for_each([&](address_t const&) { ++calls; });
    EXPECT_TRUE(status.is(unmarshal_k));
    EXPECT_EQ(calls, 0u);
}

TEST_F(dispatch_test, explicit_types) {
    std::uint32_t total_age = 0;
    EXPECT_TRUE(people.for_each_value<person_t>([&](person_t const& person) { total_age += person.age; }));
    EXPECT_EQ(total_age, 60u);

    std::vector<std::string> keys;
    EXPECT_TRUE((people.for_each_pair<std::string, person_name_t>(
        [&](std::string const& key, person_name_t const&) { keys.push_back(key); })));
    EXPECT_EQ(keys, (std::vector<std::string> {"a", "b", "c"}));
}

TEST_F(dispatch_test, empty_buckets) {
    store_t nobody {db, "nobody", std::make_shared<json_codec_t>()};
    std::size_t calls = 0;
    EXPECT_TRUE(nobody.for_each([&](person_t const&) { ++calls; }));
    EXPECT_EQ(calls, 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
