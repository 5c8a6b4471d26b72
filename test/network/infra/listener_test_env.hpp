#pragma once

#include "config/options.hpp"
#include "network/quic_listener.hpp"
#include "network/registry.hpp"
#include "infra/mock_secure_transport.hpp"
#include "infra/mock_stun_client.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace synclink {
namespace network {

// Poll `pred` until it holds or `timeout` elapses
inline bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Shrinks listener timings for the lifetime of a test and restores them after
struct ListenerTimingScope {
    ListenerTimingScope(std::chrono::milliseconds keepalive_unit = std::chrono::milliseconds(20),
                        std::chrono::milliseconds retry = std::chrono::seconds(30),
                        std::chrono::milliseconds disabled_poll = std::chrono::milliseconds(10)) {
        QuicListener::SetKeepaliveUnitForTest(keepalive_unit);
        QuicListener::SetStunRetryIntervalForTest(retry);
        QuicListener::SetDisabledPollIntervalForTest(disabled_poll);
    }
    ~ListenerTimingScope() {
        QuicListener::ResetKeepaliveUnitForTest();
        QuicListener::ResetStunRetryIntervalForTest();
        QuicListener::ResetDisabledPollIntervalForTest();
        QuicListener::ResetStreamAcceptTimeoutForTest();
    }
    ListenerTimingScope(const ListenerTimingScope&) = delete;
    ListenerTimingScope& operator=(const ListenerTimingScope&) = delete;
};

// One listener on 127.0.0.1 with mock collaborators; Serve() runs on a
// background thread and is stopped and joined on destruction
struct ListenerHarness {
    // `stun_clients` replaces the scripted mock STUN client when set
    explicit ListenerHarness(config::Options options = DiscoveryDisabled(),
                             size_t intake_capacity = 8,
                             StunClientFactory stun_clients = nullptr)
        : transport(std::make_shared<MockSecureTransport>()),
          stun(std::make_shared<MockStunScript>()),
          factory(transport, stun_clients ? stun_clients : MockStunClientFactory(stun), registry),
          cfg(std::make_shared<config::ConfigWrapper>(std::move(options))),
          intake(std::make_shared<IntakeChannel>(intake_capacity)) {
        listener = factory.New(*Uri::Parse("quic://127.0.0.1:0"), cfg, nullptr, intake, nullptr);
    }

    ~ListenerHarness() { StopAndJoin(); }

    ListenerHarness(const ListenerHarness&) = delete;
    ListenerHarness& operator=(const ListenerHarness&) = delete;

    static config::Options DiscoveryDisabled() {
        config::Options opts;
        opts.nat_enabled = false;
        opts.stun_servers = {};
        return opts;
    }

    static config::Options WithServers(std::vector<std::string> servers, int keepalive_s = 1) {
        config::Options opts;
        opts.nat_enabled = true;
        opts.stun_keepalive_s = keepalive_s;
        opts.stun_servers = std::move(servers);
        return opts;
    }

    void Start() {
        server = std::thread([this]() { listener->Serve(); });
    }

    // Accept queue once Serve() reached the secure transport
    std::shared_ptr<MockAcceptQueue> Queue() {
        return transport->WaitForListen(std::chrono::seconds(5));
    }

    void StopAndJoin() {
        if (listener) listener->Stop();
        if (server.joinable()) server.join();
    }

    PacketConnRegistry registry;
    std::shared_ptr<MockSecureTransport> transport;
    std::shared_ptr<MockStunScript> stun;
    QuicListenerFactory factory;
    std::shared_ptr<config::ConfigWrapper> cfg;
    std::shared_ptr<IntakeChannel> intake;
    GenericListenerPtr listener;
    std::thread server;
};

} // namespace network
} // namespace synclink
