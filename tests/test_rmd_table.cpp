#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "rmd_table.hpp"
#include <sstream>
#include <stdexcept>

using namespace retireplan;
using Catch::Approx;

TEST_CASE("RmdTable default constructor", "[rmd_table]") {
    RmdTable table;
    REQUIRE(table.edition() == "custom");
    REQUIRE_FALSE(table.has_divisor(75));
    REQUIRE(table.required_distribution(100000.0, 75) == 0.0);
}

TEST_CASE("RmdTable set/get divisor", "[rmd_table]") {
    RmdTable table;

    SECTION("Valid ages") {
        table.set_divisor(80, 20.2);
        REQUIRE(table.get_divisor(80) == Approx(20.2));
        REQUIRE(table.has_divisor(80));
    }

    SECTION("Ages above the maximum use the last divisor") {
        table.set_divisor(RmdTable::MAX_AGE, 2.0);
        REQUIRE(table.get_divisor(125) == Approx(2.0));
    }

    SECTION("Out of range age throws") {
        REQUIRE_THROWS_AS(table.set_divisor(121, 2.0), std::out_of_range);
        REQUIRE_THROWS_AS(table.set_divisor(-1, 2.0), std::out_of_range);
        REQUIRE_THROWS_AS(table.get_divisor(-1), std::out_of_range);
    }

    SECTION("Negative divisor throws") {
        REQUIRE_THROWS_AS(table.set_divisor(75, -1.0), std::invalid_argument);
    }
}

TEST_CASE("Uniform Lifetime Table", "[rmd_table]") {
    RmdTable table = RmdTable::uniform_lifetime();

    REQUIRE(table.edition() == "IRS Uniform Lifetime Table (2022)");
    REQUIRE_FALSE(table.has_divisor(71));
    REQUIRE(table.get_divisor(72) == Approx(27.4));
    REQUIRE(table.get_divisor(73) == Approx(26.5));
    REQUIRE(table.get_divisor(75) == Approx(24.6));
    REQUIRE(table.get_divisor(90) == Approx(12.2));
    REQUIRE(table.get_divisor(120) == Approx(2.0));

    SECTION("Divisors shrink with age") {
        for (int age = 73; age <= RmdTable::MAX_AGE; ++age) {
            REQUIRE(table.get_divisor(age) < table.get_divisor(age - 1));
        }
    }
}

TEST_CASE("Required distribution is prior balance over divisor", "[rmd_table]") {
    RmdTable table = RmdTable::uniform_lifetime();

    REQUIRE(table.required_distribution(265000.0, 73) == Approx(10000.0));
    REQUIRE(table.required_distribution(0.0, 73) == 0.0);
    REQUIRE(table.required_distribution(-100.0, 73) == 0.0);
    REQUIRE(table.required_distribution(265000.0, 60) == 0.0);
}

TEST_CASE("RmdTable CSV loading from stream", "[rmd_table]") {
    SECTION("Comments and blank lines are skipped") {
        std::istringstream csv(
            "# Test table\n"
            "age,divisor\n"
            "\n"
            "73,26.5\n"
            "# mid-table comment\n"
            "74,25.5\n"
        );
        RmdTable table = RmdTable::load_from_csv(csv);
        REQUIRE(table.get_divisor(73) == Approx(26.5));
        REQUIRE(table.get_divisor(74) == Approx(25.5));
        REQUIRE_FALSE(table.has_divisor(72));
    }

    SECTION("Header only is rejected") {
        std::istringstream csv("age,divisor\n");
        REQUIRE_THROWS_AS(RmdTable::load_from_csv(csv), std::runtime_error);
    }

    SECTION("Missing column is rejected") {
        std::istringstream csv("age,divisor\n73\n");
        REQUIRE_THROWS_AS(RmdTable::load_from_csv(csv), std::runtime_error);
    }

    SECTION("Non-numeric divisor is rejected") {
        std::istringstream csv("age,divisor\n73,abc\n");
        REQUIRE_THROWS_AS(RmdTable::load_from_csv(csv), std::runtime_error);
    }
}

TEST_CASE("Shipped CSV matches the built-in table", "[rmd_table]") {
    RmdTable loaded = RmdTable::load_from_csv(std::string(RETIREPLAN_DATA_DIR) + "/uniform_lifetime_2022.csv");
    RmdTable builtin = RmdTable::uniform_lifetime();

    for (int age = 0; age <= RmdTable::MAX_AGE; ++age) {
        REQUIRE(loaded.get_divisor(age) == Approx(builtin.get_divisor(age)));
    }
}

TEST_CASE("Missing CSV file throws", "[rmd_table]") {
    REQUIRE_THROWS_AS(RmdTable::load_from_csv(std::string("/nonexistent/rmd.csv")), std::runtime_error);
}
