#include "Target.h"

#include <catch2/catch.hpp>

TEST_CASE("target parse", "[unit]") {
	Target t;
	QString err;

	REQUIRE(Target::parse("root@192.168.1.100", 22, &t, &err));
	CHECK(t.userHost == "root@192.168.1.100");
	CHECK(t.user == "root");
	CHECK(t.host == "192.168.1.100");
	CHECK(t.port == 22);
	CHECK(err.isEmpty());

	REQUIRE(Target::parse("example.com", 2222, &t, &err));
	CHECK(t.user.isEmpty());
	CHECK(t.host == "example.com");
	CHECK(t.port == 2222);

	// surrounding whitespace is dropped
	REQUIRE(Target::parse("  user@example.com ", 22, &t));
	CHECK(t.userHost == "user@example.com");
}

TEST_CASE("target parse rejects", "[unit]") {
	QString err;

	CHECK_FALSE(Target::parse("", 22, nullptr, &err));
	CHECK_FALSE(err.isEmpty());

	CHECK_FALSE(Target::parse("user@", 22, nullptr, &err));
	CHECK_FALSE(Target::parse("@host", 22, nullptr, &err));
	CHECK_FALSE(Target::parse("-oProxyCommand=x", 22, nullptr, &err));
	CHECK_FALSE(Target::parse("user@-oProxyCommand=x", 22, nullptr, &err));
	CHECK_FALSE(Target::parse("user@host name", 22, nullptr, &err));
	CHECK_FALSE(Target::parse("user@host", 0, nullptr, &err));
	CHECK_FALSE(Target::parse("user@host", 65536, nullptr, &err));
	CHECK(Target::parse("user@host", 65535, nullptr, &err));
}

TEST_CASE("target display", "[unit]") {
	Target t;
	REQUIRE(Target::parse("user@host", 22, &t));
	CHECK(t.display() == "user@host");

	REQUIRE(Target::parse("user@host", 2222, &t));
	CHECK(t.display() == "user@host:2222");
}
