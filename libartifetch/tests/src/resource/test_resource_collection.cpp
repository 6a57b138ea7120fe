// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <catch2/catch_all.hpp>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/resource/resource_collection.hpp"
#include "artifetch/version.hpp"

#include "artifetch_tests.hpp"
#include "fake_transport.hpp"

using namespace artifetch;
using namespace artifetch::resource;

namespace
{
    /** Record the kind of every transfer event, with the progress reported. */
    class RecordingListener : public TransferListener
    {
    public:

        std::vector<std::string> events;
        std::vector<std::int64_t> progress;
        std::string failure;

    private:

        void on_transfer_event_impl(const TransferEvent& event) override
        {
            if (const auto* initiated = std::get_if<TransferInitiated>(&event))
            {
                events.push_back(std::string("initiated ") + name_of(initiated->request_type));
            }
            else if (const auto* progressed = std::get_if<TransferProgressed>(&event))
            {
                progress.push_back(progressed->transferred);
            }
            else if (const auto* completed = std::get_if<TransferCompleted>(&event))
            {
                events.push_back(std::string("completed ") + name_of(completed->request_type));
            }
            else if (const auto* failed = std::get_if<TransferFailed>(&event))
            {
                events.push_back(std::string("failed ") + name_of(failed->request_type));
                failure = failed->message;
            }
        }
    };

    struct CollectionFixture
    {
        std::shared_ptr<artifetchtests::FakeServer> server = std::make_shared<artifetchtests::FakeServer>();
        InMemoryArtifactCache cache;
        artifetchtests::TemporaryDirectory tmp_dir;
        HttpResourceCollection collection{ artifetchtests::make_fake_client(server), &cache };
        RecordingListener listener;

        CollectionFixture()
        {
            collection.add_transfer_listener(listener);
        }

        auto cached_artifact(const std::string& name, const std::string& content, const std::string& sha1)
            -> CachedArtifact
        {
            const auto path = tmp_dir.path() / "cache" / name;
            artifetchtests::write_file(path, content);
            return CachedArtifact::from_file(path, sha1);
        }
    };

    TEST_CASE_METHOD(CollectionFixture, "GET resources", "[artifetch::resource][artifetch::resource::HttpResourceCollection]")
    {
        SECTION("Downloaded to the destination")
        {
            server->reply("http://localhost/a/b.jar", { .body = "XYZ" });
            auto resource = collection.get_resource("http://localhost/a/b.jar", std::nullopt);
            REQUIRE(resource.is_remote());
            CHECK(resource.content_length() == 3);

            const auto destination = tmp_dir.path() / "out" / "b.jar";
            collection.download_resource(resource, destination);
            CHECK(artifetchtests::read_file(destination) == "XYZ");

            CHECK(collection.progress().transferred() == 3);
            CHECK_FALSE(collection.progress().total_length().has_value());
            CHECK(listener.events == std::vector<std::string>{ "initiated GET", "completed GET" });
            CHECK(listener.progress.back() == 3);
            CHECK(server->open_responses() == 0);
        }

        SECTION("Missing resource")
        {
            auto resource = collection.get_resource("http://localhost/a/missing.jar", std::nullopt);
            CHECK_FALSE(resource.exists());
            CHECK(resource.get_if<MissingResource>() != nullptr);
            CHECK(server->open_responses() == 0);

            try
            {
                collection.download_resource(resource, tmp_dir.path() / "missing.jar");
                FAIL("Downloading a missing resource should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::precondition_violation);
            }
            CHECK(listener.events == std::vector<std::string>{ "initiated GET", "failed GET" });
            CHECK_FALSE(collection.progress().total_length().has_value());
        }

        SECTION("Server error")
        {
            server->reply("http://localhost/a/b.jar", { .status = 500, .status_text = "Internal Server Error" });
            try
            {
                collection.get_resource("http://localhost/a/b.jar", std::nullopt);
                FAIL("A server error should have been raised");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::server_error);
                REQUIRE(ex.status() != nullptr);
                CHECK(ex.status()->code == 500);
                CHECK(
                    std::string(ex.what())
                    == "Could not GET 'http://localhost/a/b.jar'. Received status code 500 from server: Internal Server Error"
                );
            }
            CHECK(server->open_responses() == 0);
        }

        SECTION("Transport failure")
        {
            server->reply("http://localhost/a/b.jar", { .fail = true });
            try
            {
                collection.get_resource("http://localhost/a/b.jar", std::nullopt);
                FAIL("A transport failure should have been raised");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::transport_failure);
            }
        }

        SECTION("Failure while streaming")
        {
            server->reply("http://localhost/a/b.jar", { .body = "0123456789", .fail_body = true });
            auto resource = collection.get_resource("http://localhost/a/b.jar", std::nullopt);
            CHECK_THROWS_AS(collection.download_resource(resource, tmp_dir.path() / "b.jar"), artifetch_error);
            CHECK(listener.events == std::vector<std::string>{ "initiated GET", "failed GET" });
            CHECK(listener.failure.find("Connection reset by peer") != std::string::npos);
            CHECK_FALSE(collection.progress().total_length().has_value());
            CHECK(server->open_responses() == 0);
        }

        SECTION("Convenience get")
        {
            server->reply("http://localhost/a/b.jar", { .body = "XYZ" });
            collection.get("http://localhost/a/b.jar", tmp_dir.path() / "b.jar");
            CHECK(artifetchtests::read_file(tmp_dir.path() / "b.jar") == "XYZ");
            CHECK_THROWS_AS(collection.get("http://localhost/a/c.jar", tmp_dir.path() / "c.jar"), artifetch_error);
        }
    }

    TEST_CASE_METHOD(CollectionFixture, "HEAD resources", "[artifetch::resource][artifetch::resource::HttpResourceCollection]")
    {
        server->reply("http://localhost/a/b.jar", { .body = "XYZ" });
        server->reply("http://localhost/a/b.jar.sha1", { .body = "abc123" });
        cache.add({ "org:b:1.0" }, cached_artifact("b.jar", "XYZ", "abc123"));

        SECTION("Existing resource")
        {
            auto resource = collection.head_resource("http://localhost/a/b.jar");
            CHECK(resource.is_remote());
            CHECK(resource.content_length() == 3);
            REQUIRE(server->requests.size() == 1);
            CHECK(server->requests.front().verb == transport::HttpVerb::head);
        }

        SECTION("Missing resource")
        {
            auto resource = collection.head_resource("http://localhost/a/missing.jar");
            CHECK_FALSE(resource.exists());
        }

        SECTION("Never served from the cache")
        {
            auto resource = collection.get_resource("http://localhost/a/b.jar", ArtifactIdentity{ "org:b:1.0" }, false);
            CHECK(resource.is_remote());
            CHECK(server->requests_to("http://localhost/a/b.jar.sha1") == 0);
        }

        CHECK(server->open_responses() == 0);
    }

    TEST_CASE_METHOD(CollectionFixture, "Cached resources", "[artifetch::resource][artifetch::resource::HttpResourceCollection]")
    {
        const std::string source = "http://localhost/a/b.jar";
        const std::string checksum = "http://localhost/a/b.jar.sha1";
        const auto identity = ArtifactIdentity{ "org:b:1.0" };
        server->reply(source, { .body = "remote content" });

        SECTION("Checksum match")
        {
            server->reply(checksum, { .body = "abc123  b.jar" });
            cache.add(identity, cached_artifact("b.jar", "cached content", "abc123"));

            auto resource = collection.get_resource(source, identity);
            REQUIRE(resource.is_cached());
            CHECK(resource.get_if<CachedResource>()->artifact().sha1 == "abc123");
            CHECK(resource.content_length() == 14);
            // Only the checksum is fetched.
            CHECK(server->requests_to(checksum) == 1);
            CHECK(server->requests_to(source) == 0);

            collection.download_resource(resource, tmp_dir.path() / "b.jar");
            CHECK(artifetchtests::read_file(tmp_dir.path() / "b.jar") == "cached content");
            CHECK(collection.progress().transferred() == 14);
            CHECK(listener.events == std::vector<std::string>{ "initiated GET", "completed GET" });
        }

        SECTION("Explicit candidates")
        {
            server->reply(checksum, { .body = "abc123" });
            const auto candidates = std::vector<CachedArtifact>{
                cached_artifact("first.jar", "1", "fff000"),
                cached_artifact("second.jar", "22", "abc123"),
            };
            auto resource = collection.get_resource(source, candidates);
            REQUIRE(resource.is_cached());
            CHECK(resource.content_length() == 2);
        }

        SECTION("Checksum mismatch")
        {
            server->reply(checksum, { .body = "0000ff" });
            cache.add(identity, cached_artifact("b.jar", "cached content", "abc123"));

            auto resource = collection.get_resource(source, identity);
            CHECK(resource.is_remote());
            CHECK(server->requests_to(source) == 1);
        }

        SECTION("Missing checksum")
        {
            cache.add(identity, cached_artifact("b.jar", "cached content", "abc123"));
            auto resource = collection.get_resource(source, identity);
            CHECK(resource.is_remote());
        }

        SECTION("Network error on the checksum")
        {
            server->reply(checksum, { .fail = true });
            cache.add(identity, cached_artifact("b.jar", "cached content", "abc123"));

            auto resource = collection.get_resource(source, identity);
            REQUIRE(resource.is_remote());
            collection.download_resource(resource, tmp_dir.path() / "b.jar");
            CHECK(artifetchtests::read_file(tmp_dir.path() / "b.jar") == "remote content");
        }

        SECTION("No candidates")
        {
            auto resource = collection.get_resource(source, ArtifactIdentity{ "org:unknown:1.0" });
            CHECK(resource.is_remote());
            CHECK(server->requests_to(checksum) == 0);
        }

        SECTION("No identity")
        {
            cache.add(identity, cached_artifact("b.jar", "cached content", "abc123"));
            auto resource = collection.get_resource(source, std::nullopt, true);
            CHECK(resource.is_remote());
            CHECK(server->requests_to(checksum) == 0);
        }
    }

    TEST_CASE_METHOD(CollectionFixture, "PUT resources", "[artifetch::resource][artifetch::resource::HttpResourceCollection]")
    {
        const auto source = tmp_dir.path() / "upload" / "b.jar";
        artifetchtests::write_file(source, "0123456789");
        const std::string destination = "http://localhost/a/b.jar";

        SECTION("Created")
        {
            server->reply(destination, { .status = 201, .status_text = "Created" });
            collection.put(source, destination);

            REQUIRE(server->requests.size() == 1);
            const auto& request = server->requests.front();
            CHECK(request.verb == transport::HttpVerb::put);
            CHECK(request.body == "0123456789");
            CHECK(collection.progress().transferred() == 10);
            CHECK(listener.progress.back() == 10);
            CHECK_FALSE(collection.progress().total_length().has_value());
            CHECK(listener.events == std::vector<std::string>{ "initiated PUT", "completed PUT" });
            CHECK(server->open_responses() == 0);
        }

        SECTION("Server error")
        {
            server->reply(destination, { .status = 500, .status_text = "Internal Server Error" });
            try
            {
                collection.put(source, destination);
                FAIL("The upload should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::server_error);
                REQUIRE(ex.status() != nullptr);
                CHECK(ex.status()->code == 500);
                CHECK(std::string(ex.what()).starts_with("Could not PUT 'http://localhost/a/b.jar'."));
            }
            CHECK(listener.events == std::vector<std::string>{ "initiated PUT", "failed PUT" });
            CHECK_FALSE(collection.progress().total_length().has_value());
            CHECK(server->open_responses() == 0);
        }

        SECTION("Not a regular file")
        {
            try
            {
                collection.put(tmp_dir.path() / "upload", destination);
                FAIL("Uploading a directory should have failed");
            }
            catch (const artifetch_error& ex)
            {
                CHECK(ex.error_code() == artifetch_error_code::precondition_violation);
            }
            CHECK(server->requests.empty());
            CHECK(listener.events.empty());
        }
    }

    TEST_CASE_METHOD(CollectionFixture, "Listing and listeners", "[artifetch::resource][artifetch::resource::HttpResourceCollection]")
    {
        SECTION("List a directory")
        {
            server->reply(
                "http://localhost/a/",
                { .body = R"(<h1>Index of /a</h1><a href="b.jar">b.jar</a><a href="c/">c/</a>)" }
            );
            const auto entries = collection.list("http://localhost/a/");
            REQUIRE(entries.has_value());
            CHECK(entries.value() == std::vector<std::string>{ "http://localhost/a/b.jar", "http://localhost/a/c/" });
        }

        SECTION("List a non index page")
        {
            server->reply("http://repo/dir/", { .body = "<html>Hello</html>" });
            CHECK_FALSE(collection.list("http://repo/dir/").has_value());
        }

        SECTION("Removed listener")
        {
            CHECK(collection.has_transfer_listener(listener));
            collection.remove_transfer_listener(listener);
            CHECK_FALSE(collection.has_transfer_listener(listener));

            server->reply("http://localhost/a/b.jar", { .body = "XYZ" });
            collection.get("http://localhost/a/b.jar", tmp_dir.path() / "b.jar");
            CHECK(listener.events.empty());
        }

        SECTION("Client")
        {
            CHECK(collection.client().user_agent() == artifetch::user_agent());
        }
    }
}
