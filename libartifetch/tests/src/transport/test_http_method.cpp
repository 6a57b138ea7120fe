// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/transport/http_method.hpp"

#include "artifetch_tests.hpp"
#include "fake_transport.hpp"

using namespace artifetch;
using namespace artifetch::transport;

namespace
{
    auto make_response(std::shared_ptr<artifetchtests::FakeServer> server, artifetchtests::FakeReply reply)
        -> std::unique_ptr<HttpResponse>
    {
        return std::make_unique<artifetchtests::FakeResponse>(std::move(server), std::move(reply), true);
    }

    TEST_CASE("HTTP verbs", "[artifetch::transport][artifetch::transport::HttpMethod]")
    {
        CHECK(std::string(name_of(HttpVerb::get)) == "GET");
        CHECK(std::string(name_of(HttpVerb::head)) == "HEAD");
        CHECK(std::string(name_of(HttpVerb::put)) == "PUT");

        CHECK(was_successful(200));
        CHECK(was_successful(204));
        CHECK_FALSE(was_successful(199));
        CHECK_FALSE(was_successful(304));
        CHECK_FALSE(was_successful(404));
    }

    TEST_CASE("Request headers", "[artifetch::transport][artifetch::transport::HttpMethod]")
    {
        HttpMethod method(HttpVerb::get, "http://localhost/a.jar");
        method.set_request_header("Accept", "*/*");
        method.set_request_header("accept", "text/html");
        method.set_request_header("Accept-Encoding", "identity");

        REQUIRE(method.request_headers().size() == 2);
        CHECK(method.request_header("ACCEPT") == "text/html");
        CHECK(method.request_header("accept-encoding") == "identity");
        CHECK_FALSE(method.request_header("User-Agent").has_value());
    }

    TEST_CASE("Response of a method", "[artifetch::transport][artifetch::transport::HttpMethod]")
    {
        auto server = std::make_shared<artifetchtests::FakeServer>();
        HttpMethod method(HttpVerb::get, "http://localhost/a.jar");

        SECTION("Not executed")
        {
            CHECK_FALSE(method.is_executed());
            REQUIRE_THROWS_AS(method.status_code(), artifetch_error);
            try
            {
                [[maybe_unused]] auto text = method.status_text();
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::precondition_violation);
            }
        }

        SECTION("Executed")
        {
            method.set_response(make_response(
                server,
                { .status = 201,
                  .status_text = "Created",
                  .body = "hello world",
                  .headers = { { "Content-Type", "text/plain" } } }
            ));
            CHECK(method.is_executed());
            CHECK(method.status_code() == 201);
            CHECK(method.status_text() == "Created");
            CHECK(method.response_content_length() == 11);
            CHECK(method.response_header("content-type") == "text/plain");
            CHECK(method.response_body_as_string() == "hello world");
        }

        SECTION("Released exactly once")
        {
            method.set_response(make_response(server, { .body = "data" }));
            REQUIRE(server->open_responses() == 1);

            method.release_connection();
            method.release_connection();
            CHECK(method.is_released());
            CHECK(server->released_responses == 1);

            REQUIRE_THROWS_AS(method.response_body_as_string(), artifetch_error);
        }

        SECTION("Released on destruction")
        {
            {
                HttpMethod scoped(HttpVerb::get, "http://localhost/b.jar");
                scoped.set_response(make_response(server, { .body = "data" }));
                REQUIRE(server->open_responses() == 1);
            }
            CHECK(server->open_responses() == 0);
        }

        SECTION("Moved methods release once")
        {
            method.set_response(make_response(server, { .body = "data" }));
            {
                HttpMethod moved = std::move(method);
                CHECK(moved.is_executed());
            }
            CHECK(server->released_responses == 1);
            method.release_connection();
            CHECK(server->released_responses == 1);
        }

        SECTION("Read failures are transport failures")
        {
            method.set_response(make_response(server, { .body = "0123456789", .fail_body = true }));
            std::string received;
            try
            {
                method.write_response_body([&](const char* data, std::size_t size)
                                           { received.append(data, size); });
                FAIL("Reading the body should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::transport_failure);
                CHECK(std::string(ex.what()).find("Connection reset by peer") != std::string::npos);
            }
            CHECK(received == "0123");
        }

        SECTION("Errors of the sink are kept")
        {
            method.set_response(make_response(server, { .body = "data" }));
            const auto sink = [](const char*, std::size_t)
            { throw artifetch_error("disk full", artifetch_error_code::io_error); };
            try
            {
                method.write_response_body(sink);
                FAIL("Writing the body should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::io_error);
            }
        }
    }

    TEST_CASE("FileRequestBody", "[artifetch::transport][artifetch::transport::HttpMethod]")
    {
        const auto tmp_dir = artifetchtests::TemporaryDirectory();
        const auto file = tmp_dir.path() / "upload.bin";
        artifetchtests::write_file(file, "0123456789");

        SECTION("Streams the file")
        {
            std::vector<std::size_t> chunks;
            FileRequestBody body(file, [&](std::size_t size) { chunks.push_back(size); });
            CHECK(body.content_length() == 10);
            CHECK(body.content_type() == "application/octet-stream");
            CHECK_FALSE(body.is_repeatable());

            body.open();
            CHECK(body.is_open());
            char buffer[4];
            std::string content;
            for (auto count = body.read(buffer, sizeof(buffer)); count > 0;
                 count = body.read(buffer, sizeof(buffer)))
            {
                content.append(buffer, count);
            }
            body.close();

            CHECK(content == "0123456789");
            CHECK(chunks == std::vector<std::size_t>{ 4, 4, 2 });
            CHECK_FALSE(body.is_open());
        }

        SECTION("Cannot be sent twice")
        {
            FileRequestBody body(file);
            body.open();
            body.close();
            try
            {
                body.open();
                FAIL("Opening the body twice should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::precondition_violation);
            }
        }

        SECTION("Missing file")
        {
            FileRequestBody body(tmp_dir.path() / "missing.bin");
            CHECK(body.content_length() == -1);
            try
            {
                body.open();
                FAIL("Opening a missing file should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::io_error);
            }
        }
    }
}
