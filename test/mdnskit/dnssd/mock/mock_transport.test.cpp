/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

namespace {

mdk::dnssd::ServiceCandidate make_candidate(const std::string& name, const std::string& type = "_http._tcp.") {
    return {name, type, "local.", 0};
}

mdk::dnssd::ResolvedService make_resolved(const uint16_t port, const std::string& host) {
    mdk::dnssd::ResolvedService resolved;
    resolved.port = port;
    resolved.hosts = {host};
    return resolved;
}

}  // namespace

TEST_CASE("mdk::dnssd::MockTransport") {
    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);

    SECTION("Browse reports mocked services of its type") {
        std::vector<std::string> found;
        mdk::dnssd::Transport::BrowseHandlers handlers;
        handlers.on_found = [&](const mdk::dnssd::ServiceCandidate& candidate) {
            found.push_back(candidate.name);
        };

        transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"));
        transport.mock_service(make_candidate("Speaker", "_raop._tcp."), make_resolved(7000, "10.0.0.6"));
        io_context.run();

        auto browse = transport.browse("_http._tcp.", std::move(handlers));
        REQUIRE(transport.active_browse_count() == 1);

        io_context.restart();
        io_context.run();

        REQUIRE(found == std::vector<std::string> {"Printer"});

        browse.reset();
        REQUIRE(transport.active_browse_count() == 0);
        REQUIRE(transport.calls() == std::vector<std::string> {"browse:_http._tcp."});
    }

    SECTION("Released operations are forgotten") {
        for (int i = 0; i < 10; ++i) {
            auto browse = transport.browse("_http._tcp.", {});
            auto resolve = transport.resolve(make_candidate("Unknown"), std::chrono::milliseconds(100), nullptr);
            REQUIRE(transport.tracked_operation_count() == 2);
        }
        REQUIRE(transport.tracked_operation_count() == 0);
        REQUIRE(transport.active_browse_count() == 0);
        REQUIRE(transport.active_resolve_count() == 0);
    }

    SECTION("Discovering, removing and errors reach running browses") {
        std::vector<std::string> events;
        mdk::dnssd::Transport::BrowseHandlers handlers;
        handlers.on_found = [&](const mdk::dnssd::ServiceCandidate& candidate) {
            events.push_back("found:" + candidate.name);
        };
        handlers.on_lost = [&](const mdk::dnssd::ServiceCandidate& candidate) {
            events.push_back("lost:" + candidate.name);
        };
        handlers.on_error = [&](const std::string& error_message) {
            events.push_back("error:" + error_message);
        };

        auto browse = transport.browse("_http._tcp.", std::move(handlers));
        transport.mock_discovering_service(make_candidate("Printer"));
        transport.mock_removing_service(make_candidate("Printer"));
        transport.mock_browse_error("_http._tcp.", "Network down");
        transport.mock_discovering_service(make_candidate("Speaker", "_raop._tcp."));

        io_context.run();

        REQUIRE(events == std::vector<std::string> {"found:Printer", "lost:Printer", "error:Network down"});
    }

    SECTION("Destroyed browses receive nothing") {
        int count = 0;
        mdk::dnssd::Transport::BrowseHandlers handlers;
        handlers.on_found = [&](const mdk::dnssd::ServiceCandidate&) {
            ++count;
        };

        auto browse = transport.browse("_http._tcp.", std::move(handlers));
        transport.mock_discovering_service(make_candidate("Printer"));
        browse.reset();

        io_context.run();
        REQUIRE(count == 0);
    }

    SECTION("Browse failure throws once") {
        transport.mock_browse_failure("No daemon");
        REQUIRE_THROWS_WITH(transport.browse("_http._tcp.", {}), Catch::Matchers::ContainsSubstring("No daemon"));
        REQUIRE_NOTHROW(transport.browse("_http._tcp.", {}));
    }

    SECTION("Resolve completes with the mocked result") {
        transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), std::chrono::milliseconds(10));
        io_context.run();
        io_context.restart();

        std::optional<tl::expected<mdk::dnssd::ResolvedService, std::string>> result;
        auto resolve = transport.resolve(make_candidate("Printer"), std::chrono::milliseconds(1000), [&](auto r) {
            result = std::move(r);
        });
        REQUIRE(transport.active_resolve_count() == 1);

        io_context.run();

        REQUIRE(result.has_value());
        REQUIRE(result->has_value());
        REQUIRE(result->value().port == 9100);
        REQUIRE(result->value().hosts == std::vector<std::string> {"10.0.0.5"});
        REQUIRE(transport.active_resolve_count() == 0);
    }

    SECTION("Resolve taking longer than the hint times out") {
        transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), std::chrono::milliseconds(500));
        io_context.run();
        io_context.restart();

        std::optional<tl::expected<mdk::dnssd::ResolvedService, std::string>> result;
        auto resolve = transport.resolve(make_candidate("Printer"), std::chrono::milliseconds(10), [&](auto r) {
            result = std::move(r);
        });

        io_context.run();

        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->has_value());
        REQUIRE(result->error() == "Resolve timed out");
    }

    SECTION("Manual resolve completion") {
        int count = 0;
        auto resolve = transport.resolve(make_candidate("Printer"), std::chrono::milliseconds(1000), [&](auto r) {
            REQUIRE(r.has_value());
            ++count;
        });
        transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        io_context.run();

        REQUIRE(count == 1);
    }

    SECTION("Destroyed resolves don't complete") {
        int count = 0;
        auto resolve = transport.resolve(make_candidate("Printer"), std::chrono::milliseconds(1000), [&](auto) {
            ++count;
        });
        resolve.reset();
        transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        io_context.run();

        REQUIRE(count == 0);
    }

    SECTION("Publish reports the requested name") {
        std::optional<tl::expected<std::string, std::string>> result;
        transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, [&](auto r) {
            result = std::move(r);
        });
        io_context.run();

        REQUIRE(result.has_value());
        REQUIRE(result->value() == "My App");
    }

    SECTION("Publish behavior") {
        std::optional<tl::expected<std::string, std::string>> result;
        const auto handler = [&](tl::expected<std::string, std::string> r) {
            result = std::move(r);
        };

        SECTION("Renamed") {
            mdk::dnssd::MockTransport::PublishBehavior behavior;
            behavior.final_name = "My App (2)";
            transport.set_publish_behavior(behavior);
            transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, handler);
            io_context.run();
            REQUIRE(result->value() == "My App (2)");
        }

        SECTION("Error") {
            mdk::dnssd::MockTransport::PublishBehavior behavior;
            behavior.error = "Name conflict";
            transport.set_publish_behavior(behavior);
            transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, handler);
            io_context.run();
            REQUIRE(result->error() == "Name conflict");
        }

        SECTION("Throw") {
            mdk::dnssd::MockTransport::PublishBehavior behavior;
            behavior.throw_message = "Daemon gone";
            transport.set_publish_behavior(behavior);
            REQUIRE_THROWS(transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, handler));
        }

        SECTION("Manual") {
            mdk::dnssd::MockTransport::PublishBehavior behavior;
            behavior.manual = true;
            transport.set_publish_behavior(behavior);
            transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, handler);
            io_context.run();
            REQUIRE_FALSE(result.has_value());

            io_context.restart();
            transport.complete_publish(std::string("Renamed"));
            io_context.run();
            REQUIRE(result->value() == "Renamed");
        }

        SECTION("Unpublish discards a pending completion") {
            mdk::dnssd::MockTransport::PublishBehavior behavior;
            behavior.delay = std::chrono::milliseconds(10);
            transport.set_publish_behavior(behavior);
            transport.publish({"My App", "_http._tcp.", "local.", 8080, {}}, handler);
            transport.unpublish();
            io_context.run();
            REQUIRE_FALSE(result.has_value());
            REQUIRE(transport.calls() == std::vector<std::string> {"publish:My App", "unpublish"});
        }
    }

    SECTION("Txt support can be toggled") {
        REQUIRE(transport.supports_txt_records());
        transport.set_supports_txt_records(false);
        REQUIRE_FALSE(transport.supports_txt_records());
    }
}
