#include "Logger.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <catch2/catch.hpp>

namespace {

// Logger for the duration of a test, then the previous handler again
struct logger_scope {
	QtMessageHandler previous;
	int previousLevel;

	logger_scope() {
		previous = qInstallMessageHandler(nullptr);
		qInstallMessageHandler(previous);
		previousLevel = Logger::logLevel();
		Logger::install("ssh-keyreg-tests");
		Logger::setColorEnabled(false);
	}
	~logger_scope() {
		Logger::setLogFilePath(QString());
		Logger::setLogLevel(previousLevel);
		qInstallMessageHandler(previous);
	}
};

QString readText(const QString& path) {
	QFile f(path);
	return f.open(QIODevice::ReadOnly) ? QString::fromUtf8(f.readAll()) : QString();
}

}

TEST_CASE("logger file sink and levels", "[logger]") {
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	const QString path = dir.filePath("logs/keyreg.log");

	logger_scope scope;
	Logger::setLogLevel(0);
	Logger::setLogFilePath(path);
	CHECK(Logger::logFilePath() == path);

	qInfo().noquote() << "info-hidden";
	qWarning().noquote() << "warn-line\nsecond part";

	Logger::setLogLevel(5);
	CHECK(Logger::logLevel() == 2);
	qDebug().noquote() << "debug-visible";

	const QString text = readText(path);
	CHECK_FALSE(text.contains("info-hidden"));
	CHECK(text.contains("[WARN]"));
	// one record per line
	CHECK(text.contains("warn-line second part"));
	CHECK(text.contains("[DEBUG]"));
	CHECK(text.contains("debug-visible"));
}

TEST_CASE("logger rotates a full file", "[logger]") {
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	const QString path = dir.filePath("keyreg.log");

	QFile big(path);
	REQUIRE(big.open(QIODevice::WriteOnly));
	REQUIRE(big.write(QByteArray(2 * 1024 * 1024 + 1, 'x')) > 0);
	big.close();

	logger_scope scope;
	Logger::setLogFilePath(path);

	CHECK(QFileInfo(path + ".1").size() > 2 * 1024 * 1024);
	CHECK(QFileInfo(path).size() < 1024);
}

TEST_CASE("logger without file", "[logger]") {
	logger_scope scope;
	Logger::setLogFilePath("   ");
	CHECK(Logger::logFilePath().isEmpty());
}
