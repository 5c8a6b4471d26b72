// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/stun.hpp"
#include "network/stun_filter.hpp"
#include "infra/stun_payloads.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace synclink;
using namespace synclink::network;

namespace {
const UdpEndpoint kServer(boost::asio::ip::make_address("192.0.2.1"), 3478);
}

TEST_CASE("STUN payload sniffing", "[stun][network]") {
    SECTION("Well-formed header") {
        auto data = MakeStunPayload(0x07);
        REQUIRE(IsStunPayload(data));
        auto id = StunTransactionIdOf(data);
        for (auto b : id) REQUIRE(b == 0x07);
    }

    SECTION("Too short") {
        auto data = MakeStunPayload(0x07);
        data.resize(19);
        REQUIRE_FALSE(IsStunPayload(data));
    }

    SECTION("Top bits set") {
        auto data = MakeStunPayload(0x07, 0x40);
        REQUIRE_FALSE(IsStunPayload(data));
        data[0] = 0x80;
        REQUIRE_FALSE(IsStunPayload(data));
    }

    SECTION("Wrong magic cookie") {
        auto data = MakeStunPayload(0x07);
        data[7] = 0x43;
        REQUIRE_FALSE(IsStunPayload(data));
    }

    SECTION("QUIC long header is not STUN") {
        std::vector<uint8_t> quic(40, 0);
        quic[0] = 0xC3;
        REQUIRE_FALSE(IsStunPayload(quic));
    }
}

TEST_CASE("StunFilter - Claims only outstanding transactions", "[stun][network]") {
    StunFilter filter;

    REQUIRE_FALSE(filter.ClaimIncoming(MakeStunResponse(0x01), kServer));

    filter.Outgoing(MakeStunPayload(0x01), kServer);
    REQUIRE(filter.TrackedCount() == 1);
    REQUIRE(filter.ClaimIncoming(MakeStunResponse(0x01), kServer));

    // Other transactions and non-STUN data are left alone
    REQUIRE_FALSE(filter.ClaimIncoming(MakeStunResponse(0x02), kServer));
    REQUIRE_FALSE(filter.ClaimIncoming(std::vector<uint8_t>(64, 0xC0), kServer));

    // Non-STUN writes are not tracked
    filter.Outgoing(std::vector<uint8_t>(64, 0xFF), kServer);
    REQUIRE(filter.TrackedCount() == 1);
}

TEST_CASE("StunFilter - Transactions expire", "[stun][network]") {
    util::MockTimeScope scope(1000000);
    StunFilter filter(std::chrono::seconds(60));

    filter.Outgoing(MakeStunPayload(0x0A), kServer);

    util::SetMockTime(1000060);
    REQUIRE(filter.ClaimIncoming(MakeStunResponse(0x0A), kServer));

    util::SetMockTime(1000061);
    REQUIRE_FALSE(filter.ClaimIncoming(MakeStunResponse(0x0A), kServer));
    REQUIRE(filter.TrackedCount() == 0);
}

TEST_CASE("StunFilter - Re-sending refreshes the expiry", "[stun][network]") {
    util::MockTimeScope scope(2000000);
    StunFilter filter(std::chrono::seconds(60));

    filter.Outgoing(MakeStunPayload(0x0B), kServer);
    util::SetMockTime(2000050);
    filter.Outgoing(MakeStunPayload(0x0B), kServer);
    REQUIRE(filter.TrackedCount() == 1);

    util::SetMockTime(2000100);
    REQUIRE(filter.ClaimIncoming(MakeStunResponse(0x0B), kServer));
}

TEST_CASE("StunFilter - Capacity evicts the oldest entry", "[stun][network]") {
    util::MockTimeScope scope(3000000);
    StunFilter filter(std::chrono::seconds(60), 2);

    filter.Outgoing(MakeStunPayload(0x01), kServer);
    util::SetMockTime(3000001);
    filter.Outgoing(MakeStunPayload(0x02), kServer);
    util::SetMockTime(3000002);
    filter.Outgoing(MakeStunPayload(0x03), kServer);

    REQUIRE(filter.TrackedCount() == 2);
    REQUIRE_FALSE(filter.ClaimIncoming(MakeStunResponse(0x01), kServer));
    REQUIRE(filter.ClaimIncoming(MakeStunResponse(0x02), kServer));
    REQUIRE(filter.ClaimIncoming(MakeStunResponse(0x03), kServer));
}

TEST_CASE("NAT type names and punchability", "[stun][network]") {
    REQUIRE(NatTypeAsString(NatType::FULL) == "Full cone NAT");
    REQUIRE(NatTypeAsString(NatType::PORT_RESTRICTED) == "Port restricted NAT");
    REQUIRE(NatTypeAsString(NatType::SYMMETRIC_UDP_FIREWALL) == "Symmetric UDP firewall");
    REQUIRE(NatTypeAsString(NatType::ERROR) == "Test failed");

    REQUIRE(IsPunchable(NatType::NONE));
    REQUIRE(IsPunchable(NatType::FULL));
    REQUIRE(IsPunchable(NatType::RESTRICTED));
    REQUIRE(IsPunchable(NatType::PORT_RESTRICTED));
    REQUIRE_FALSE(IsPunchable(NatType::SYMMETRIC));
    REQUIRE_FALSE(IsPunchable(NatType::SYMMETRIC_UDP_FIREWALL));
    REQUIRE_FALSE(IsPunchable(NatType::BLOCKED));
    REQUIRE_FALSE(IsPunchable(NatType::UNKNOWN));
    REQUIRE_FALSE(IsPunchable(NatType::ERROR));
}
