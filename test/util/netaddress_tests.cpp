// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace synclink::util;

TEST_CASE("ValidateAndNormalizeIP", "[util]") {
    REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == "192.168.1.1");
    REQUIRE(ValidateAndNormalizeIP("::ffff:192.168.1.1") == "192.168.1.1");
    REQUIRE(ValidateAndNormalizeIP("2001:db8::1") == "2001:db8::1");
    REQUIRE_FALSE(ValidateAndNormalizeIP(""));
    REQUIRE_FALSE(ValidateAndNormalizeIP("example.com"));
    REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1"));
}

TEST_CASE("SplitHostPort", "[util]") {
    SECTION("IPv4 with port") {
        auto hp = SplitHostPort("1.2.3.4:22000");
        REQUIRE(hp);
        REQUIRE(hp->host == "1.2.3.4");
        REQUIRE(hp->has_port_separator);
        REQUIRE(hp->port == "22000");
    }

    SECTION("Hostname without port") {
        auto hp = SplitHostPort("stun.example.com");
        REQUIRE(hp);
        REQUIRE(hp->host == "stun.example.com");
        REQUIRE_FALSE(hp->has_port_separator);
        REQUIRE(hp->port.empty());
    }

    SECTION("Empty port") {
        auto hp = SplitHostPort("1.2.3.4:");
        REQUIRE(hp);
        REQUIRE(hp->has_port_separator);
        REQUIRE(hp->port.empty());
    }

    SECTION("Bracketed IPv6") {
        auto hp = SplitHostPort("[2001:db8::1]:3478");
        REQUIRE(hp);
        REQUIRE(hp->host == "2001:db8::1");
        REQUIRE(hp->port == "3478");

        auto bare = SplitHostPort("[::1]");
        REQUIRE(bare);
        REQUIRE(bare->host == "::1");
        REQUIRE_FALSE(bare->has_port_separator);
    }

    SECTION("Bare IPv6 literal") {
        auto hp = SplitHostPort("2001:db8::1");
        REQUIRE(hp);
        REQUIRE(hp->host == "2001:db8::1");
        REQUIRE(hp->port.empty());
    }

    SECTION("Empty string is the wildcard") {
        auto hp = SplitHostPort("");
        REQUIRE(hp);
        REQUIRE(hp->host.empty());
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(SplitHostPort("[::1"));
        REQUIRE_FALSE(SplitHostPort("[::1]x"));
        REQUIRE_FALSE(SplitHostPort("a:b:c"));
    }
}

TEST_CASE("JoinHostPort", "[util]") {
    REQUIRE(JoinHostPort("1.2.3.4", 22000) == "1.2.3.4:22000");
    REQUIRE(JoinHostPort("2001:db8::1", 3478) == "[2001:db8::1]:3478");
    REQUIRE(JoinHostPort("host", 1) == "host:1");
}

TEST_CASE("SafeParseInt and SafeParsePort", "[util]") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE_FALSE(SafeParseInt("999", 0, 100));
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100));
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100));
    REQUIRE_FALSE(SafeParseInt("", 0, 100));
    REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100));

    REQUIRE(SafeParsePort("3478") == 3478);
    REQUIRE_FALSE(SafeParsePort("0"));
    REQUIRE_FALSE(SafeParsePort("65536"));
}
