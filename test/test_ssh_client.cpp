#include "SshClient.h"

#include <catch2/catch.hpp>

TEST_CASE("libssh client without a host", "[unit]") {
	SshClient client;
	CHECK(client.name() == "libssh");
	CHECK_FALSE(client.isConnected());

	Target t;
	QString err;
	CHECK_FALSE(client.connectTarget(t, ExecOptions(), &err));
	CHECK(err == "No host specified.");

	RemoteResult res;
	CHECK_FALSE(client.exec("true", &res, &err));
	CHECK(err == "Not connected.");
	CHECK(res.exitStatus == -1);
}

TEST_CASE("libssh client refused connection", "[unit]") {
	SshClient client;

	Target t;
	REQUIRE(Target::parse("nobody@127.0.0.1", 1, &t));

	ExecOptions opts;
	opts.batchMode = true;
	opts.connectTimeoutSec = 2;

	RemoteResult res;
	QString err;
	CHECK_FALSE(client.run(t, "true", opts, &res, &err));
	CHECK(err.contains("127.0.0.1"));
	CHECK_FALSE(client.isConnected());

	// safe to repeat
	client.disconnect();
	client.disconnect();
	CHECK_FALSE(client.isConnected());
}
