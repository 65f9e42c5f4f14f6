/**
 * @file fixtures.hpp
 * @author Ashot Vardanian
 * @date 2022-07-06
 *
 * @brief Value types and helpers shared by the test suites.
 */

#pragma once
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <fmt/format.h>

#include "ustash/ustash.hpp"

namespace unum::ustash::test {

struct person_t {
    std::string name;
    std::uint32_t age = 0;
    std::vector<std::string> tags;

    bool operator==(person_t const& other) const noexcept {
        return name == other.name && age == other.age && tags == other.tags;
    }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(person_t, name, age, tags)

/** @brief Shares a single field with `person_t`. */
struct person_name_t {
    std::string name;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(person_name_t, name)

struct address_t {
    std::string city;
    std::string street;
    std::int64_t number = 0;

    bool operator==(address_t const& other) const noexcept {
        return city == other.city && street == other.street && number == other.number;
    }
    bool operator<(address_t const& other) const noexcept { return number < other.number; }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(address_t, city, street, number)

struct shape_t {
    virtual ~shape_t() = default;
    virtual double area() const noexcept = 0;
};

struct circle_t final : public shape_t {
    double radius = 0;
    circle_t() = default;
    explicit circle_t(double r) noexcept : radius(r) {}
    double area() const noexcept override { return 3.14159265358979 * radius * radius; }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(circle_t, radius)

struct square_t final : public shape_t {
    double side = 0;
    square_t() = default;
    explicit square_t(double s) noexcept : side(s) {}
    double area() const noexcept override { return side * side; }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(square_t, side)

/** @brief Never registered. */
struct triangle_t final : public shape_t {
    double base = 0;
    double height = 0;
    double area() const noexcept override { return base * height / 2; }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(triangle_t, base, height)

inline void register_shapes() {
    EXPECT_TRUE((register_type<circle_t, shape_t>("circle")));
    EXPECT_TRUE((register_type<square_t, shape_t>("square")));
}

inline person_t make_person(std::string name, std::uint32_t age = 30) {
    return person_t {std::move(name), age, {"red", "green"}};
}

/**
 * @brief Directory for persistent tests, if any. Taken from the
 * `USTASH_TEST_PATH` environment variable or the compile definition.
 */
inline char const* path() {
    char* path = std::getenv("USTASH_TEST_PATH");
    if (path)
        return std::strlen(path) ? path : nullptr;

#if defined(USTASH_TEST_PATH)
    return USTASH_TEST_PATH;
#else
    return nullptr;
#endif
}

inline std::string config_for(char const* directory) {
    if (!directory)
        return {};
    return fmt::format(R"({{"version": "1.0", "directory": "{}"}})", directory);
}

inline std::vector<codec_ptr_t> all_codecs() {
    return {
        std::make_shared<binary_codec_t>(),
        std::make_shared<json_codec_t>(),
        std::make_shared<xml_codec_t>(),
    };
}

} // namespace unum::ustash::test
