/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "QtRedirectListener.hpp"

#include <limits>
#include <stdexcept>

#include <QByteArray>
#include <QHostAddress>
#include <QRegularExpression>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>
#include <QUrl>
#include <QUrlQuery>

#include <BandError.hpp>

namespace OpenBand::BandAuth {

namespace {

constexpr int kRequestReadTimeoutMs = 10000;
constexpr int kResponseWriteTimeoutMs = 5000;
constexpr qsizetype kMaxRequestHeadBytes = 16 * 1024;

const char kEmptyOkResponse[] = "HTTP/1.1 200 OK\r\n"
				"Content-Length: 0\r\n"
				"Connection: close\r\n"
				"\r\n";

QHostAddress toHostAddress(const std::string &host)
{
	if (host == "localhost") {
		return QHostAddress(QHostAddress::LocalHost);
	}
	return QHostAddress(QString::fromStdString(host));
}

} // anonymous namespace

QtRedirectListener::QtRedirectListener(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(QtRedirectListener::QtRedirectListener)"))
{
}

QtRedirectListener::~QtRedirectListener() noexcept
{
	close();
}

void QtRedirectListener::listen(const RedirectEndpoint &endpoint)
{
	close();

	const QHostAddress address = toHostAddress(endpoint.host);
	if (address.isNull()) {
		logger_->error("RedirectHostUnsupportedError", {{"host", endpoint.host}});
		throw ConfigurationError("RedirectHostUnsupportedError(QtRedirectListener::listen):" + endpoint.host);
	}

	auto server = std::make_unique<QTcpServer>();
	server->setMaxPendingConnections(1);
	if (!server->listen(address, endpoint.port)) {
		const std::string error = server->errorString().toStdString();
		logger_->error("RedirectListenError", {{"host", endpoint.host}, {"error", error}});
		throw AuthorizationError("ListenError(QtRedirectListener::listen):" + error);
	}

	server_ = std::move(server);
	const std::string port = std::to_string(server_->serverPort());
	logger_->info("RedirectListenerStarted", {{"host", endpoint.host}, {"port", port}});
}

int QtRedirectListener::toWaitMsecs(std::chrono::milliseconds timeout, int whenUnset) noexcept
{
	if (timeout.count() <= 0) {
		return whenUnset;
	}
	if (timeout.count() > std::numeric_limits<int>::max()) {
		return std::numeric_limits<int>::max();
	}
	return static_cast<int>(timeout.count());
}

std::string QtRedirectListener::waitForCode(std::chrono::milliseconds timeout)
{
	if (!isListening()) {
		logger_->error("NotListeningError");
		throw std::logic_error("NotListeningError(QtRedirectListener::waitForCode)");
	}

	const int waitMs = toWaitMsecs(timeout, -1);
	bool timedOut = false;
	const bool accepted = server_->waitForNewConnection(waitMs, &timedOut);

	std::unique_ptr<QTcpSocket> socket;
	if (accepted) {
		socket.reset(server_->nextPendingConnection());
	}
	if (socket) {
		socket->setParent(nullptr);
	}

	const std::string serverError = server_->errorString().toStdString();
	close();

	if (!socket) {
		if (timedOut) {
			logger_->error("RedirectTimeoutError");
			throw AuthorizationError("RedirectTimeoutError(QtRedirectListener::waitForCode)");
		}
		logger_->error("RedirectAcceptError", {{"error", serverError}});
		throw AuthorizationError("AcceptError(QtRedirectListener::waitForCode):" + serverError);
	}

	return serve(*socket, timeout);
}

std::string QtRedirectListener::serve(QTcpSocket &socket, std::chrono::milliseconds timeout)
{
	const int readMs = toWaitMsecs(timeout, kRequestReadTimeoutMs);

	QByteArray request;
	while (!request.contains("\r\n\r\n") && request.size() < kMaxRequestHeadBytes) {
		if (socket.bytesAvailable() == 0 && !socket.waitForReadyRead(readMs)) {
			break;
		}
		request += socket.readAll();
	}

	socket.write(kEmptyOkResponse);
	socket.waitForBytesWritten(kResponseWriteTimeoutMs);
	socket.disconnectFromHost();
	if (socket.state() != QAbstractSocket::UnconnectedState) {
		socket.waitForDisconnected(kResponseWriteTimeoutMs);
	}

	static const QRegularExpression re("^GET\\s+(\\S+)\\s+HTTP");
	const QRegularExpressionMatch match = re.match(QString::fromUtf8(request));
	if (!match.hasMatch()) {
		logger_->error("MalformedRedirectError");
		throw AuthorizationError("MalformedRedirectError(QtRedirectListener::serve)");
	}

	const QUrl url("http://localhost" + match.captured(1));
	const QUrlQuery query(url);

	if (query.hasQueryItem("error")) {
		const std::string error = query.queryItemValue("error", QUrl::FullyDecoded).toStdString();
		const std::string description =
			query.queryItemValue("error_description", QUrl::FullyDecoded).toStdString();
		logger_->error("ConsentDeniedError", {{"error", error}, {"description", description}});
		throw AuthorizationError("ConsentDeniedError(QtRedirectListener::serve):" + error + " " + description);
	}

	const std::string code = query.queryItemValue("code", QUrl::FullyDecoded).toStdString();
	if (code.empty()) {
		logger_->error("AuthorizationCodeMissingError");
		throw AuthorizationError("AuthorizationCodeMissingError(QtRedirectListener::serve)");
	}

	logger_->info("RedirectReceived");
	return code;
}

void QtRedirectListener::close() noexcept
{
	if (server_) {
		server_->close();
		server_.reset();
	}
}

bool QtRedirectListener::isListening() const noexcept
{
	return server_ && server_->isListening();
}

std::uint16_t QtRedirectListener::serverPort() const noexcept
{
	return server_ ? server_->serverPort() : 0;
}

} // namespace OpenBand::BandAuth
