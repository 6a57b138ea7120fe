// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/util_scope.hpp"

using namespace artifetch;

namespace
{
    auto parse_positive(int value) -> expected_t<int>
    {
        if (value <= 0)
        {
            return make_unexpected("not positive", artifetch_error_code::precondition_violation);
        }
        return value;
    }

    TEST_CASE("artifetch_error", "[artifetch::core]")
    {
        SECTION("Without data")
        {
            const auto error = artifetch_error("boom", artifetch_error_code::io_error);
            CHECK(std::string(error.what()) == "boom");
            CHECK(error.error_code() == artifetch_error_code::io_error);
            CHECK_FALSE(error.data().has_value());
            CHECK(error.status() == nullptr);
        }

        SECTION("With an HTTP status")
        {
            const auto error = artifetch_error(
                "server said no",
                artifetch_error_code::server_error,
                http_status{ 500, "Internal Server Error" }
            );
            REQUIRE(error.status() != nullptr);
            CHECK(error.status()->code == 500);
            CHECK(error.status()->text == "Internal Server Error");
        }
    }

    TEST_CASE("expected_t", "[artifetch::core]")
    {
        SECTION("Value")
        {
            auto res = parse_positive(3);
            REQUIRE(res.has_value());
            CHECK(extract(res) == 3);
        }

        SECTION("Error")
        {
            auto res = parse_positive(-1);
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().error_code() == artifetch_error_code::precondition_violation);
            CHECK_THROWS_AS(extract(res), artifetch_error);

            const tl::expected<long, artifetch_error> forwarded = forward_error(res);
            CHECK(forwarded.error().error_code() == artifetch_error_code::precondition_violation);
        }
    }

    TEST_CASE("on_scope_exit", "[artifetch::core]")
    {
        int calls = 0;
        {
            on_scope_exit guard{ [&calls] { ++calls; } };
            CHECK(calls == 0);
        }
        CHECK(calls == 1);

        // An error in the exit function does not escape.
        CHECK_NOTHROW([] { on_scope_exit guard{ [] { throw std::runtime_error("ignored"); } }; }());
    }
}
