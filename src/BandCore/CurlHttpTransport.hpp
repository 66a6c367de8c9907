/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <CurlHandle.hpp>
#include <ILogger.hpp>

#include "HttpTransport.hpp"

namespace OpenBand {

class CurlHttpTransport final : public IHttpTransport {
public:
	explicit CurlHttpTransport(std::shared_ptr<const Logger::ILogger> logger);
	~CurlHttpTransport() noexcept override;

	HttpResponse get(const std::string &url, const QueryParams &query,
			 const std::optional<BasicAuth> &basicAuth = std::nullopt) override;

	HttpResponse post(const std::string &url, const QueryParams &query) override;

private:
	HttpResponse perform(const std::string &method, const std::string &url, const QueryParams &query,
			     const std::optional<BasicAuth> &basicAuth);

	const std::shared_ptr<const Logger::ILogger> logger_;
	CurlHelper::CurlHandle curl_;
};

} // namespace OpenBand
