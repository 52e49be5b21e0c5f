#include "KeyRegOptions.h"

#include <catch2/catch.hpp>

namespace {

ParseResult parse(QStringList args) {
	args.prepend("ssh-keyreg");
	return parseCommandLine(args);
}

}

TEST_CASE("options minimal", "[unit]") {
	const ParseResult r = parse({ "root@192.168.1.100" });
	REQUIRE(r.status == ParseStatus::Ok);

	const KeyRegOptions& o = r.options;
	CHECK(o.target.userHost == "root@192.168.1.100");
	CHECK(o.target.port == 22);
	CHECK(o.publicKeyPath.isEmpty());
	CHECK_FALSE(o.generate);
	CHECK(o.promptIfDuplicate);
	CHECK_FALSE(o.assumeYes);
	CHECK_FALSE(o.noCopyId);
	CHECK(o.backend.isEmpty());
	CHECK(o.generator.isEmpty());
	CHECK(o.logLevel == -1);
}

TEST_CASE("options full", "[unit]") {
	const ParseResult r = parse({ "-g", "-p", "2222", "--yes", "--no-copy-id",
	                              "--backend", "LibSSH", "--keygen", "sodium",
	                              "-v", "--log-file", "/tmp/keyreg.log",
	                              "user@example.com", "~/.ssh/id_ed25519.pub" });
	REQUIRE(r.status == ParseStatus::Ok);

	const KeyRegOptions& o = r.options;
	CHECK(o.target.userHost == "user@example.com");
	CHECK(o.target.port == 2222);
	CHECK(o.publicKeyPath == "~/.ssh/id_ed25519.pub");
	CHECK(o.generate);
	CHECK(o.assumeYes);
	CHECK_FALSE(o.promptIfDuplicate);
	CHECK(o.noCopyId);
	CHECK(o.backend == "libssh");
	CHECK(o.generator == "sodium");
	CHECK(o.logLevel == 2);
	CHECK(o.logFile == "/tmp/keyreg.log");
}

TEST_CASE("options flags after the target", "[unit]") {
	const ParseResult r = parse({ "user@host", "-p", "2200", "-q" });
	REQUIRE(r.status == ParseStatus::Ok);
	CHECK(r.options.target.port == 2200);
	CHECK(r.options.logLevel == 0);
}

TEST_CASE("options help and version", "[unit]") {
	ParseResult r = parse({ "-h" });
	CHECK(r.status == ParseStatus::Help);
	CHECK(r.message.contains("user@host"));
	CHECK(r.message.contains("Examples:"));

	r = parse({ "--help", "user@host" });
	CHECK(r.status == ParseStatus::Help);

	r = parse({ "--version" });
	CHECK(r.status == ParseStatus::Version);
}

TEST_CASE("options errors", "[unit]") {
	ParseResult r = parse({});
	CHECK(r.status == ParseStatus::Error);
	CHECK(r.message == "You must specify the remote server (user@host).");

	r = parse({ "-p", "abc", "user@host" });
	CHECK(r.status == ParseStatus::Error);
	CHECK(r.message == "Invalid port: abc");

	r = parse({ "-p", "0", "user@host" });
	CHECK(r.status == ParseStatus::Error);

	r = parse({ "-p", "70000", "user@host" });
	CHECK(r.status == ParseStatus::Error);

	r = parse({ "user@host", "key.pub", "extra" });
	CHECK(r.status == ParseStatus::Error);
	CHECK(r.message == "Invalid argument: extra");

	r = parse({ "--frobnicate", "user@host" });
	CHECK(r.status == ParseStatus::Error);
	CHECK_FALSE(r.message.isEmpty());

	r = parse({ "--backend", "putty", "user@host" });
	CHECK(r.status == ParseStatus::Error);

	r = parse({ "--keygen", "openssl", "user@host" });
	CHECK(r.status == ParseStatus::Error);

	r = parse({ "-v", "-q", "user@host" });
	CHECK(r.status == ParseStatus::Error);

	r = parse({ "@host" });
	CHECK(r.status == ParseStatus::Error);

	// missing value for -p
	r = parse({ "user@host", "-p" });
	CHECK(r.status == ParseStatus::Error);
}

TEST_CASE("usage text", "[unit]") {
	const QString text = usageText();
	CHECK(text.contains("--generate"));
	CHECK(text.contains("--port"));
	CHECK(text.contains("ssh-keyreg -g -p 2222 user@example.com"));
}
