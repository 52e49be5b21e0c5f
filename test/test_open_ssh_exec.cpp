#include "OpenSshExec.h"

#include <catch2/catch.hpp>

namespace {

Target target(const QString& userHost, int port) {
	Target t;
	Target::parse(userHost, port, &t);
	return t;
}

}

TEST_CASE("ssh arguments interactive", "[unit]") {
	ExecOptions opts;
	CHECK(OpenSshExec::buildArgs(target("user@host", 22), "true", opts) ==
	      QStringList({ "user@host", "true" }));

	opts.connectTimeoutSec = 5;
	CHECK(OpenSshExec::buildArgs(target("user@host", 2222), "true", opts) ==
	      QStringList({ "-p", "2222", "-o", "ConnectTimeout=5", "user@host", "true" }));
}

TEST_CASE("ssh arguments batch", "[unit]") {
	ExecOptions opts;
	opts.batchMode = true;
	opts.connectTimeoutSec = 7;
	opts.identityFile = "/home/u/.ssh/id_ed25519";

	const QStringList args = OpenSshExec::buildArgs(target("u@h", 22), "echo ok", opts);
	CHECK(args == QStringList({ "-o", "BatchMode=yes",
	                            "-o", "NumberOfPasswordPrompts=0",
	                            "-o", "ConnectionAttempts=1",
	                            "-o", "ConnectTimeout=7",
	                            "-i", "/home/u/.ssh/id_ed25519",
	                            "u@h", "echo ok" }));
}

TEST_CASE("ssh missing binary is a transport failure", "[unit]") {
	OpenSshExec exec("/nonexistent/ssh-keyreg-test-ssh");
	CHECK(exec.name() == "openssh");

	ExecOptions opts;
	opts.batchMode = true;
	RemoteResult res;
	QString err;
	CHECK_FALSE(exec.run(target("u@h", 22), "true", opts, &res, &err));
	CHECK_FALSE(err.isEmpty());
	CHECK(res.exitStatus == -1);
}
