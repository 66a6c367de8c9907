/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <ILogger.hpp>

#include "RedirectReceiver.hpp"

class QTcpServer;
class QTcpSocket;

namespace OpenBand::BandAuth {

// One-shot loopback HTTP listener built on the blocking QTcpServer/QTcpSocket API; no event loop needed.
class QtRedirectListener final : public IRedirectReceiver {
public:
	explicit QtRedirectListener(std::shared_ptr<const Logger::ILogger> logger);
	~QtRedirectListener() noexcept override;

	void listen(const RedirectEndpoint &endpoint) override;
	std::string waitForCode(std::chrono::milliseconds timeout) override;
	void close() noexcept override;

	bool isListening() const noexcept;

	// Actual bound port, useful when listening on port 0.
	std::uint16_t serverPort() const noexcept;

	// Qt wait argument for a timeout: whenUnset for zero or less, saturated at INT_MAX milliseconds.
	static int toWaitMsecs(std::chrono::milliseconds timeout, int whenUnset) noexcept;

private:
	std::string serve(QTcpSocket &socket, std::chrono::milliseconds timeout);

	const std::shared_ptr<const Logger::ILogger> logger_;
	std::unique_ptr<QTcpServer> server_;
};

} // namespace OpenBand::BandAuth
