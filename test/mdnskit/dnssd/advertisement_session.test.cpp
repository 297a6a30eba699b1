/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_advertisement_session.hpp"
#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

namespace {

const mdk::dnssd::ServiceType k_http {"http", "tcp"};

}  // namespace

TEST_CASE("mdk::dnssd::AdvertisementSession") {
    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);
    std::vector<tl::expected<std::string, mdk::dnssd::Error>> results;
    const auto handler = [&](tl::expected<std::string, mdk::dnssd::Error> result) {
        results.push_back(std::move(result));
    };

    mdk::dnssd::AdvertisementSession session(transport, "Default Name");

    SECTION("Publishes a service") {
        session.start(k_http, "My App", "local", 8080, mdk::dnssd::TxtRecord {{"version", "1.0"}}, handler);
        REQUIRE(session.is_pending());
        REQUIRE_FALSE(session.is_publishing());

        io_context.run();

        REQUIRE(results.size() == 1);
        REQUIRE(results.front().value() == "My App");
        REQUIRE(session.is_publishing());
        REQUIRE_FALSE(session.is_pending());

        const auto& publication = session.current_publication();
        REQUIRE(publication.has_value());
        REQUIRE(publication->type == "_http._tcp.");
        REQUIRE(publication->domain == "local.");
        REQUIRE(publication->port == 8080);
        REQUIRE(publication->txt == mdk::dnssd::TxtRecord {{"version", "1.0"}});
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App"});
    }

    SECTION("Uses the default name when none is given") {
        session.start(k_http, "  ", "", 8080, std::nullopt, handler);
        io_context.run();

        REQUIRE(results.front().value() == "Default Name");
        REQUIRE(session.current_publication()->domain == "local.");
    }

    SECTION("Reports the name the transport registered") {
        mdk::dnssd::MockTransport::PublishBehavior behavior;
        behavior.final_name = "My App (2)";
        transport.set_publish_behavior(behavior);

        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);
        io_context.run();

        REQUIRE(results.front().value() == "My App (2)");
        REQUIRE(session.current_publication()->name == "My App (2)");
    }

    SECTION("Ports out of range fail validation without touching the transport") {
        session.start(k_http, "My App", "local.", 0, std::nullopt, handler);
        session.start(k_http, "My App", "local.", 70000, std::nullopt, handler);
        session.start(k_http, "My App", "local.", -1, std::nullopt, handler);

        REQUIRE(results.size() == 3);
        for (auto& result : results) {
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().kind == mdk::dnssd::Error::Kind::validation);
        }
        REQUIRE(results.at(0).error().message == "Invalid port: 0");
        REQUIRE(results.at(1).error().message == "Invalid port: 70000");
        REQUIRE(transport.calls().empty());
        REQUIRE_FALSE(session.is_publishing());
    }

    SECTION("A validation failure keeps the current advertisement") {
        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);
        io_context.run();

        session.start(k_http, "My App", "local.", 0, std::nullopt, handler);

        REQUIRE(session.is_publishing());
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App"});
    }

    SECTION("Republishing unpublishes first") {
        session.start(k_http, "First", "local.", 8080, std::nullopt, handler);
        io_context.run();

        io_context.restart();
        session.start(k_http, "Second", "local.", 8081, std::nullopt, handler);
        io_context.run();

        REQUIRE(transport.calls() == std::vector<std::string> {"publish:First", "unpublish", "publish:Second"});
        REQUIRE(results.size() == 2);
        REQUIRE(results.at(1).value() == "Second");
        REQUIRE(session.current_publication()->port == 8081);
    }

    SECTION("A pending start is cancelled when superseded") {
        mdk::dnssd::MockTransport::PublishBehavior behavior;
        behavior.manual = true;
        transport.set_publish_behavior(behavior);

        session.start(k_http, "First", "local.", 8080, std::nullopt, handler);
        session.start(k_http, "Second", "local.", 8081, std::nullopt, handler);

        REQUIRE(results.size() == 1);
        REQUIRE(results.front().error().kind == mdk::dnssd::Error::Kind::cancelled);

        transport.complete_publish(std::string("Second"));
        io_context.run();

        REQUIRE(results.size() == 2);
        REQUIRE(results.at(1).value() == "Second");
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:First", "unpublish", "publish:Second"});
    }

    SECTION("A failed publish leaves the session stopped") {
        mdk::dnssd::MockTransport::PublishBehavior behavior;
        behavior.error = "Name conflict";
        transport.set_publish_behavior(behavior);

        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);
        io_context.run();

        REQUIRE(results.front().error().kind == mdk::dnssd::Error::Kind::publish);
        REQUIRE(results.front().error().message == "Name conflict");
        REQUIRE_FALSE(session.is_publishing());
        REQUIRE_FALSE(session.is_pending());
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App", "unpublish"});

        REQUIRE(session.stop());
        REQUIRE(transport.calls().size() == 2);
    }

    SECTION("A throwing transport is reported as publish error") {
        mdk::dnssd::MockTransport::PublishBehavior behavior;
        behavior.throw_message = "Daemon gone";
        transport.set_publish_behavior(behavior);

        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);

        REQUIRE(results.size() == 1);
        REQUIRE(results.front().error().kind == mdk::dnssd::Error::Kind::publish);
        REQUIRE(results.front().error().message == "Daemon gone");
        REQUIRE_FALSE(session.is_publishing());
    }

    SECTION("Stop is idempotent") {
        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);
        io_context.run();

        REQUIRE(session.stop());
        REQUIRE(session.stop());
        REQUIRE_FALSE(session.is_publishing());
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App", "unpublish"});
    }

    SECTION("Stop without advertisement succeeds") {
        REQUIRE(session.stop());
        REQUIRE(transport.calls().empty());
    }

    SECTION("Stop cancels a pending start") {
        mdk::dnssd::MockTransport::PublishBehavior behavior;
        behavior.delay = std::chrono::milliseconds(10);
        transport.set_publish_behavior(behavior);

        session.start(k_http, "My App", "local.", 8080, std::nullopt, handler);
        REQUIRE(session.stop());
        io_context.run();

        REQUIRE(results.size() == 1);
        REQUIRE(results.front().error().kind == mdk::dnssd::Error::Kind::cancelled);
        REQUIRE_FALSE(session.is_publishing());
        REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App", "unpublish"});
    }
}
