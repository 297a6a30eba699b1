/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/net/timer/asio_timer.hpp"
#include "mdnskit/dnssd/dnssd_discovery_session.hpp"
#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <string>

using namespace std::chrono_literals;

namespace {

mdk::dnssd::ServiceCandidate make_candidate(const std::string& name, const uint32_t interface_index = 0) {
    return {name, "_http._tcp.", "local.", interface_index};
}

mdk::dnssd::ResolvedService
make_resolved(const uint16_t port, const std::string& host, std::optional<mdk::dnssd::TxtRecord> txt = {}) {
    mdk::dnssd::ResolvedService resolved;
    resolved.port = port;
    resolved.hosts = {host};
    resolved.txt = std::move(txt);
    return resolved;
}

mdk::dnssd::DiscoverySession::Options
make_options(const std::chrono::milliseconds timeout, std::optional<std::string> target_name = {}) {
    mdk::dnssd::DiscoverySession::Options options;
    options.type = {"http", "tcp"};
    options.target_name = std::move(target_name);
    options.timeout = timeout;
    return options;
}

struct DiscoveryFixture {
    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport {io_context};
    std::vector<mdk::dnssd::DiscoveryResult> results;

    std::unique_ptr<mdk::dnssd::DiscoverySession> make_session(mdk::dnssd::DiscoverySession::Options options) {
        return std::make_unique<mdk::dnssd::DiscoverySession>(
            io_context, transport, std::move(options),
            [this](mdk::dnssd::DiscoveryResult result) {
                results.push_back(std::move(result));
            }
        );
    }

    [[nodiscard]] size_t resolve_calls(const std::string& name) const {
        const auto calls = transport.calls();
        return static_cast<size_t>(std::count(calls.begin(), calls.end(), "resolve:" + name));
    }
};

}  // namespace

TEST_CASE("mdk::dnssd::DiscoverySession") {
    DiscoveryFixture fixture;

    SECTION("Hard timeout returns what was resolved") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), 50ms);

        auto session = fixture.make_session(make_options(100ms));
        const auto start = std::chrono::steady_clock::now();
        session->start();
        REQUIRE(session->state() == mdk::dnssd::DiscoverySession::State::browsing);

        fixture.io_context.run();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(fixture.results.size() == 1);
        const auto& result = fixture.results.front();
        REQUIRE_FALSE(result.error);
        REQUIRE_FALSE(result.error_message.has_value());
        REQUIRE(result.services_found == 1);
        REQUIRE(result.services.size() == 1);

        mdk::dnssd::ServiceRecord expected;
        expected.name = "Printer";
        expected.type = "_http._tcp.";
        expected.domain = "local.";
        expected.port = 9100;
        expected.hosts = {"10.0.0.5"};
        REQUIRE(result.services.front() == expected);

        REQUIRE(session->state() == mdk::dnssd::DiscoverySession::State::finished);
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::timeout);
        REQUIRE(elapsed >= 100ms);
        REQUIRE(elapsed < 1000ms);
    }

    SECTION("A matching resolve finishes early") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), 50ms);

        auto session = fixture.make_session(make_options(3000ms, "Printer"));
        session->start();

        const auto start = std::chrono::steady_clock::now();
        fixture.io_context.run();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.results.front().services_found == 1);
        REQUIRE(fixture.results.front().services.front().name == "Printer");
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::early_exit);
        REQUIRE(elapsed < 1000ms);
    }

    SECTION("A target matches suffixed and longer names") {
        fixture.transport.mock_service(make_candidate("Printer Office (2)"), make_resolved(9100, "10.0.0.5"), 10ms);

        auto session = fixture.make_session(make_options(3000ms, "Printer"));
        session->start();
        fixture.io_context.run();

        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::early_exit);
        REQUIRE(fixture.results.front().services.front().name == "Printer Office (2)");
    }

    SECTION("Candidates not matching the target are not resolved") {
        fixture.transport.mock_service(make_candidate("Scanner"), make_resolved(9100, "10.0.0.5"));

        auto session = fixture.make_session(make_options(100ms, "Printer"));
        session->start();
        fixture.io_context.run();

        REQUIRE(fixture.resolve_calls("Scanner") == 0);
        REQUIRE(fixture.results.front().services.empty());
    }

    SECTION("Settles when the network is quiet") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), 10ms);

        auto options = make_options(3000ms);
        options.settle_window = 50ms;
        auto session = fixture.make_session(options);
        session->start();

        const auto start = std::chrono::steady_clock::now();
        fixture.io_context.run();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::settled);
        REQUIRE(fixture.results.front().services_found == 1);
        REQUIRE(elapsed < 1000ms);
    }

    SECTION("Nothing found is not an error") {
        auto session = fixture.make_session(make_options(50ms));
        session->start();
        fixture.io_context.run();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE_FALSE(fixture.results.front().error);
        REQUIRE(fixture.results.front().services_found == 0);
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::timeout);
    }

    SECTION("A candidate reported on multiple interfaces is resolved once") {
        auto session = fixture.make_session(make_options(100ms));
        session->start();

        fixture.transport.mock_discovering_service(make_candidate("Printer", 1));
        fixture.transport.mock_discovering_service(make_candidate("Printer", 2));
        fixture.io_context.run();

        REQUIRE(fixture.resolve_calls("Printer") == 1);
    }

    SECTION("A candidate whose resolve failed is resolved again when reported on another interface") {
        auto session = fixture.make_session(make_options(300ms));
        session->start();

        fixture.transport.mock_discovering_service(make_candidate("Printer", 1));
        fixture.io_context.poll();
        fixture.transport.complete_resolve("Printer", tl::unexpected(std::string("Interface down")));
        fixture.io_context.poll();
        REQUIRE(session->pending_resolve_count() == 0);

        fixture.transport.mock_discovering_service(make_candidate("Printer", 2));
        fixture.io_context.poll();
        REQUIRE(session->pending_resolve_count() == 1);
        fixture.transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        fixture.io_context.run();

        REQUIRE(fixture.resolve_calls("Printer") == 2);
        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.results.front().services_found == 1);
        REQUIRE(fixture.results.front().services.front().port == 9100);
    }

    SECTION("A candidate resolved without port is resolved again when reported again") {
        auto session = fixture.make_session(make_options(300ms));
        session->start();

        fixture.transport.mock_discovering_service(make_candidate("Printer", 1));
        fixture.io_context.poll();
        fixture.transport.complete_resolve("Printer", make_resolved(0, "10.0.0.5"));
        fixture.io_context.poll();

        fixture.transport.mock_discovering_service(make_candidate("Printer", 1));
        fixture.io_context.poll();
        REQUIRE(fixture.resolve_calls("Printer") == 2);

        session->cancel();
    }

    SECTION("Keeps to the timeout while the transport keeps reporting new services") {
        size_t reported = 0;
        mdk::AsioTimer reporter(fixture.io_context);
        reporter.start(5ms, [&fixture, &reported] {
            const auto name = "Service " + std::to_string(reported++);
            fixture.transport.mock_service(make_candidate(name), make_resolved(9100, "10.0.0.5"), 1ms);
        });

        auto options = make_options(200ms);
        options.settle_window = 50ms;
        auto session = fixture.make_session(options);
        const auto start = std::chrono::steady_clock::now();
        session->start();

        while (fixture.results.empty() && std::chrono::steady_clock::now() - start < 5s) {
            fixture.io_context.run_one_for(10ms);
        }
        const auto elapsed = std::chrono::steady_clock::now() - start;
        reporter.stop();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::timeout);
        REQUIRE(reported > 5);
        REQUIRE(elapsed >= 200ms);
        REQUIRE(elapsed < 1000ms);
    }

    SECTION("Duplicate records are discarded, the first one wins") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"), 10ms);
        fixture.transport.mock_service(make_candidate("Printer (2)"), make_resolved(9100, "10.0.0.5"), 30ms);
        fixture.transport.mock_service(make_candidate("Printer (3)"), make_resolved(9100, "10.0.0.7"), 40ms);

        auto session = fixture.make_session(make_options(200ms));
        session->start();
        fixture.io_context.run();

        const auto& services = fixture.results.front().services;
        REQUIRE(services.size() == 2);
        REQUIRE(services.at(0).name == "Printer");
        REQUIRE(services.at(1).name == "Printer (3)");
        REQUIRE(fixture.results.front().services_found == 2);
    }

    SECTION("Failed resolves and resolves without port are dropped") {
        fixture.transport.mock_service(make_candidate("Broken"), tl::unexpected(std::string("No such record")));
        fixture.transport.mock_service(make_candidate("Portless"), make_resolved(0, "10.0.0.5"));
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.6"));

        auto session = fixture.make_session(make_options(100ms));
        session->start();
        fixture.io_context.run();

        const auto& result = fixture.results.front();
        REQUIRE_FALSE(result.error);
        REQUIRE(result.services.size() == 1);
        REQUIRE(result.services.front().name == "Printer");
    }

    SECTION("Txt records") {
        fixture.transport.mock_service(
            make_candidate("Printer"), make_resolved(9100, "10.0.0.5", mdk::dnssd::TxtRecord {{"rp", "ipp"}})
        );

        SECTION("Reported when supported") {
            auto session = fixture.make_session(make_options(50ms));
            session->start();
            fixture.io_context.run();
            REQUIRE(fixture.results.front().services.front().txt == mdk::dnssd::TxtRecord {{"rp", "ipp"}});
        }

        SECTION("Absent when not supported") {
            fixture.transport.set_supports_txt_records(false);
            auto session = fixture.make_session(make_options(50ms));
            session->start();
            fixture.io_context.run();
            REQUIRE_FALSE(fixture.results.front().services.front().txt.has_value());
        }
    }

    SECTION("A browse error is reported with the partial results") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"));

        auto session = fixture.make_session(make_options(100ms));
        session->start();
        fixture.transport.mock_browse_error("_http._tcp.", "Network down");
        fixture.transport.mock_browse_error("_http._tcp.", "Still down");
        fixture.io_context.run();

        const auto& result = fixture.results.front();
        REQUIRE(result.error);
        REQUIRE(result.error_message == "Network down");
        REQUIRE(result.services_found == 1);
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::timeout);
    }

    SECTION("A browse which fails to start still finishes on time") {
        fixture.transport.mock_browse_failure("No daemon");

        auto session = fixture.make_session(make_options(50ms));
        session->start();
        fixture.io_context.run();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.results.front().error);
        REQUIRE_THAT(
            fixture.results.front().error_message.value_or(""),
            Catch::Matchers::StartsWith("Failed to start browsing") && Catch::Matchers::ContainsSubstring("No daemon")
        );
    }

    SECTION("Late completions are discarded") {
        auto session = fixture.make_session(make_options(50ms));
        session->start();
        fixture.transport.mock_discovering_service(make_candidate("Printer"));
        fixture.io_context.run();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.results.front().services.empty());
        REQUIRE(fixture.transport.active_resolve_count() == 0);
        REQUIRE(fixture.transport.active_browse_count() == 0);

        fixture.io_context.restart();
        fixture.transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        fixture.transport.mock_discovering_service(make_candidate("Speaker"));
        fixture.io_context.run();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.resolve_calls("Speaker") == 0);
    }

    SECTION("Cancel finishes with the results so far, exactly once") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"));

        auto session = fixture.make_session(make_options(3000ms));
        session->start();
        fixture.io_context.poll();

        session->cancel();
        session->cancel();

        REQUIRE(fixture.results.size() == 1);
        REQUIRE(fixture.results.front().services_found == 1);
        REQUIRE(session->finish_reason() == mdk::dnssd::DiscoverySession::FinishReason::cancelled);
        REQUIRE(session->is_terminated());
        REQUIRE(fixture.transport.active_browse_count() == 0);

        fixture.io_context.run();
        REQUIRE(fixture.results.size() == 1);
    }

    SECTION("Pending resolves are counted") {
        auto session = fixture.make_session(make_options(3000ms));
        session->start();
        fixture.transport.mock_discovering_service(make_candidate("Printer"));
        fixture.transport.mock_discovering_service(make_candidate("Speaker"));
        fixture.io_context.poll();

        REQUIRE(session->pending_resolve_count() == 2);

        fixture.transport.complete_resolve("Printer", make_resolved(9100, "10.0.0.5"));
        fixture.io_context.poll();
        REQUIRE(session->pending_resolve_count() == 1);

        session->cancel();
        REQUIRE(fixture.transport.active_resolve_count() == 0);
    }

    SECTION("Lost services stay in the results") {
        fixture.transport.mock_service(make_candidate("Printer"), make_resolved(9100, "10.0.0.5"));

        auto session = fixture.make_session(make_options(100ms));
        session->start();
        fixture.io_context.poll();
        fixture.transport.mock_removing_service(make_candidate("Printer"));
        fixture.io_context.run();

        REQUIRE(fixture.results.front().services_found == 1);
    }

    SECTION("Negative times are clamped") {
        auto options = make_options(-100ms, std::string());
        options.settle_window = -1ms;
        auto session = fixture.make_session(options);

        REQUIRE(session->options().timeout == 0ms);
        REQUIRE(session->options().settle_window == 0ms);
        REQUIRE_FALSE(session->options().target_name.has_value());

        session->start();
        fixture.io_context.run();
        REQUIRE(fixture.results.size() == 1);
    }

    SECTION("Destroying a running session releases the transport") {
        auto session = fixture.make_session(make_options(3000ms));
        session->start();
        fixture.transport.mock_discovering_service(make_candidate("Printer"));
        fixture.io_context.poll();

        session.reset();
        REQUIRE(fixture.transport.active_browse_count() == 0);
        REQUIRE(fixture.transport.active_resolve_count() == 0);
        REQUIRE(fixture.results.empty());
    }
}

TEST_CASE("mdk::dnssd::DiscoverySession to_string") {
    using mdk::dnssd::DiscoverySession;
    REQUIRE(std::string(mdk::dnssd::to_string(DiscoverySession::State::browsing)) == "browsing");
    REQUIRE(std::string(mdk::dnssd::to_string(DiscoverySession::FinishReason::early_exit)) == "early_exit");
}
