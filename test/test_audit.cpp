#include "AuditLogger.h"
#include "KeyRegistrar.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <catch2/catch.hpp>

#include "util/Fakes.h"
#include "util/LocalShellExec.h"

using namespace test;

namespace {

// Audit on, into a scratch directory, for the lifetime of the object
struct audit_scope {
	QTemporaryDir dir;

	audit_scope() {
		AuditLogger::setAuditDirOverride(dir.path());
		AuditLogger::setEnabled(true);
	}
	~audit_scope() {
		AuditLogger::setEnabled(false);
		AuditLogger::setAuditDirOverride(QString());
	}

	QList<QJsonObject> events() const {
		QList<QJsonObject> out;
		QFile f(AuditLogger::currentLogFilePath());
		if(!f.open(QIODevice::ReadOnly))
			return out;
		for(const QByteArray& line : f.readAll().split('\n')) {
			if(!line.isEmpty())
				out.push_back(QJsonDocument::fromJson(line).object());
		}
		return out;
	}
};

}

TEST_CASE("audit event record", "[audit]") {
	audit_scope scope;
	REQUIRE(scope.dir.isValid());
	AuditLogger::setSessionId("test-session");

	QJsonObject f;
	f.insert("target", "u@h");
	AuditLogger::writeEvent("session.start", f);

	CHECK(AuditLogger::auditDir() == scope.dir.path());
	CHECK(QFileInfo(AuditLogger::currentLogFilePath()).fileName().startsWith("audit-"));

	const auto ev = scope.events();
	REQUIRE(ev.size() == 1);
	CHECK(ev[0].value("event").toString() == "session.start");
	CHECK(ev[0].value("session_id").toString() == "test-session");
	CHECK(ev[0].value("target").toString() == "u@h");
	CHECK(ev[0].contains("ts"));
	CHECK(ev[0].contains("pid"));

	CHECK_FALSE(QFileInfo(AuditLogger::currentLogFilePath()).permissions()
	            .testFlag(QFileDevice::ReadOther));

	AuditLogger::setSessionId(QString());
}

TEST_CASE("audit disabled writes nothing", "[audit]") {
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	AuditLogger::setAuditDirOverride(dir.path());
	AuditLogger::setEnabled(false);

	AuditLogger::writeEvent("session.start");
	CHECK_FALSE(QFileInfo::exists(AuditLogger::currentLogFilePath()));

	AuditLogger::setAuditDirOverride(QString());
}

TEST_CASE("audit registration events carry the fingerprint", "[audit]") {
	audit_scope scope;
	REQUIRE(scope.dir.isValid());

	QTemporaryDir keys;
	REQUIRE(writeFile(keys.filePath("id_ed25519.pub"), (ed25519Line() + "\n").toUtf8()));

	LocalShellExec remote;
	FakeKeyGenerator keygen;
	ScriptedPrompts prompts;
	KeyRegistrar::Config cfg;
	cfg.defaultPublicKey = keys.filePath("id_ed25519.pub");
	cfg.useCopyId = false;

	KeyRegistrar reg(remote, keygen, prompts.make(), cfg);
	KeyRegOptions o;
	REQUIRE(Target::parse("tester@localhost", 22, &o.target));
	REQUIRE(reg.run(o) == 0);

	const auto ev = scope.events();
	QStringList names;
	for(const QJsonObject& e : ev)
		names << e.value("event").toString();
	CHECK(names == QStringList({ "key.registered", "connection.verified" }));

	REQUIRE(!ev.isEmpty());
	CHECK(ev[0].value("fingerprint").toString() == kEd25519Sha256);
	CHECK(ev[0].value("target").toString() == "tester@localhost");

	// never the key body
	QFile f(AuditLogger::currentLogFilePath());
	REQUIRE(f.open(QIODevice::ReadOnly));
	CHECK_FALSE(f.readAll().contains(kEd25519Body.toLatin1()));
}
