/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <BandError.hpp>
#include <HttpTransport.hpp>
#include <RedirectReceiver.hpp>

namespace OpenBand::Testing {

struct RecordedRequest {
	std::string method;
	std::string url;
	QueryParams query;
	std::optional<BasicAuth> basicAuth;

	std::optional<std::string> param(const std::string &key) const
	{
		auto it = std::find_if(query.begin(), query.end(), [&key](const auto &p) { return p.first == key; });
		if (it == query.end())
			return std::nullopt;
		return it->second;
	}
};

inline HttpResponse jsonResponse(long status, std::string body)
{
	HttpResponse response;
	response.status = status;
	response.headers["content-type"] = "application/json; charset=UTF-8";
	response.body = std::move(body);
	return response;
}

// Replays queued responses in order and records every request.
class RecordingHttpTransport final : public IHttpTransport {
public:
	void enqueue(HttpResponse response) { responses_.push_back(std::move(response)); }

	HttpResponse get(const std::string &url, const QueryParams &query,
			 const std::optional<BasicAuth> &basicAuth = std::nullopt) override
	{
		return record("GET", url, query, basicAuth);
	}

	HttpResponse post(const std::string &url, const QueryParams &query) override
	{
		return record("POST", url, query, std::nullopt);
	}

	const std::vector<RecordedRequest> &requests() const noexcept { return requests_; }

private:
	HttpResponse record(std::string method, const std::string &url, const QueryParams &query,
			    const std::optional<BasicAuth> &basicAuth)
	{
		requests_.push_back({std::move(method), url, query, basicAuth});
		if (responses_.empty()) {
			throw TransportError("NoQueuedResponseError(RecordingHttpTransport)");
		}
		HttpResponse response = std::move(responses_.front());
		responses_.pop_front();
		return response;
	}

	std::deque<HttpResponse> responses_;
	std::vector<RecordedRequest> requests_;
};

class FakeRedirectReceiver final : public BandAuth::IRedirectReceiver {
public:
	explicit FakeRedirectReceiver(std::string code) : code_(std::move(code)) {}

	void listen(const BandAuth::RedirectEndpoint &endpoint) override
	{
		++listenCount;
		lastEndpoint = endpoint;
		listening = true;
	}

	std::string waitForCode(std::chrono::milliseconds timeout) override
	{
		++waitCount;
		lastTimeout = timeout;
		listening = false;
		if (failure) {
			throw AuthorizationError(*failure);
		}
		return code_;
	}

	void close() noexcept override { listening = false; }

	int listenCount = 0;
	int waitCount = 0;
	bool listening = false;
	std::optional<BandAuth::RedirectEndpoint> lastEndpoint;
	std::chrono::milliseconds lastTimeout{-1};
	std::optional<std::string> failure;

private:
	std::string code_;
};

} // namespace OpenBand::Testing
