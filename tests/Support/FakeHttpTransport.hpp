/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <deque>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <VideoPublisher/HttpTransport/IHttpTransport.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

namespace VideoPublisher::Testing {

/**
 * Replays scripted responses in order and records every request. A scripted
 * NetworkFailure is thrown as UploadError(NetworkError), the way a real
 * transport reports an unreachable host.
 */
class FakeHttpTransport : public HttpTransport::IHttpTransport {
public:
	struct NetworkFailure {
		std::string detail;
	};

	struct RecordedRequest {
		std::string method;
		std::string url;
		std::vector<std::string> headers;
		std::string body;
		HttpTransport::HttpTimeouts timeouts;

		bool hasHeader(std::string_view line) const
		{
			for (const auto &header : headers) {
				if (header == line)
					return true;
			}
			return false;
		}
	};

	void enqueue(HttpTransport::HttpResponse response) { script_.emplace_back(std::move(response)); }

	void enqueue(long statusCode, std::string body,
		     std::vector<std::pair<std::string, std::string>> headers = {})
	{
		script_.emplace_back(HttpTransport::HttpResponse{statusCode, std::move(headers), std::move(body)});
	}

	void enqueueNetworkFailure(std::string detail) { script_.emplace_back(NetworkFailure{std::move(detail)}); }

	const std::vector<RecordedRequest> &requests() const noexcept { return requests_; }

	std::size_t remaining() const noexcept { return script_.size(); }

	std::size_t countRequests(std::string_view method) const
	{
		std::size_t count = 0;
		for (const auto &request : requests_) {
			if (request.method == method)
				++count;
		}
		return count;
	}

	HttpTransport::HttpResponse post(const std::string &url, std::span<const std::string> headers,
					 std::string_view body, const HttpTransport::HttpTimeouts &timeouts) override
	{
		requests_.push_back(RecordedRequest{"POST", url, {headers.begin(), headers.end()}, std::string(body),
						    timeouts});
		return next();
	}

	HttpTransport::HttpResponse put(const std::string &url, std::span<const std::string> headers,
					std::span<const char> body,
					const HttpTransport::HttpTimeouts &timeouts) override
	{
		requests_.push_back(RecordedRequest{"PUT", url, {headers.begin(), headers.end()},
						    std::string(body.begin(), body.end()), timeouts});
		return next();
	}

private:
	HttpTransport::HttpResponse next()
	{
		if (script_.empty()) {
			throw std::logic_error("FakeHttpTransport: no scripted response left");
		}

		auto step = std::move(script_.front());
		script_.pop_front();

		if (auto *failure = std::get_if<NetworkFailure>(&step)) {
			throw UploadCore::UploadError(UploadCore::UploadErrorKind::NetworkError, "FakeHttpTransport",
						      failure->detail);
		}
		return std::get<HttpTransport::HttpResponse>(std::move(step));
	}

	std::deque<std::variant<HttpTransport::HttpResponse, NetworkFailure>> script_;
	std::vector<RecordedRequest> requests_;
};

} // namespace VideoPublisher::Testing
