/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "KeychainSecretStore.hpp"

#include <stdexcept>

#include <QCoreApplication>
#include <QEventLoop>
#include <QObject>
#include <QString>

#include <qt6keychain/keychain.h>

#include "BandError.hpp"

namespace OpenBand {

namespace {

void runToCompletion(QKeychain::Job &job)
{
	if (!QCoreApplication::instance()) {
		throw std::logic_error("NoApplicationError(KeychainSecretStore)");
	}

	bool finished = false;
	QEventLoop loop;
	QObject::connect(&job, &QKeychain::Job::finished, &loop, [&finished, &loop](QKeychain::Job *) {
		finished = true;
		loop.quit();
	});

	job.setAutoDelete(false);
	job.start();
	if (!finished) {
		loop.exec();
	}
}

} // anonymous namespace

KeychainSecretStore::KeychainSecretStore(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(KeychainSecretStore::KeychainSecretStore)"))
{
}

KeychainSecretStore::~KeychainSecretStore() noexcept = default;

std::optional<std::string> KeychainSecretStore::get(const std::string &ns, const std::string &key) const
{
	QKeychain::ReadPasswordJob job(QString::fromStdString(ns));
	job.setKey(QString::fromStdString(key));
	runToCompletion(job);

	if (job.error() == QKeychain::EntryNotFound) {
		return std::nullopt;
	}
	if (job.error() != QKeychain::NoError) {
		const std::string error = job.errorString().toStdString();
		logger_->error("KeychainReadError", {{"namespace", ns}, {"key", key}, {"error", error}});
		throw ConfigurationError("KeychainReadError(KeychainSecretStore::get):" + error);
	}

	return job.textData().toStdString();
}

void KeychainSecretStore::set(const std::string &ns, const std::string &key, const std::string &value)
{
	QKeychain::WritePasswordJob job(QString::fromStdString(ns));
	job.setKey(QString::fromStdString(key));
	job.setTextData(QString::fromStdString(value));
	runToCompletion(job);

	if (job.error() != QKeychain::NoError) {
		const std::string error = job.errorString().toStdString();
		logger_->error("KeychainWriteError", {{"namespace", ns}, {"key", key}, {"error", error}});
		throw ConfigurationError("KeychainWriteError(KeychainSecretStore::set):" + error);
	}

	logger_->debug("KeychainWriteSuccess", {{"namespace", ns}, {"key", key}});
}

void KeychainSecretStore::erase(const std::string &ns, const std::string &key)
{
	QKeychain::DeletePasswordJob job(QString::fromStdString(ns));
	job.setKey(QString::fromStdString(key));
	runToCompletion(job);

	if (job.error() != QKeychain::NoError && job.error() != QKeychain::EntryNotFound) {
		const std::string error = job.errorString().toStdString();
		logger_->error("KeychainDeleteError", {{"namespace", ns}, {"key", key}, {"error", error}});
		throw ConfigurationError("KeychainDeleteError(KeychainSecretStore::erase):" + error);
	}
}

} // namespace OpenBand
