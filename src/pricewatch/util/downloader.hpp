#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

typedef void CURL;

namespace pricewatch
{
	class fetch_error : public std::runtime_error
	{
	private:
		bool timeout;

	public:
		fetch_error(const std::string& what, bool _timeout)
		: std::runtime_error(what)
		, timeout(_timeout)
		{}

		bool timed_out() const { return timeout; }
	};

	class downloader
	{
	public:
		typedef std::unique_ptr<CURL, std::function<void(CURL*)>> curl_ptr;

		struct response
		{
			long status;
			std::string body;
		};

	private:
		std::string agent;
		long timeout;

		curl_ptr create_handle() const;

	public:
		downloader(const std::string& agent, long timeout_seconds = 20);

		/* Throws fetch_error on transport failure; HTTP errors are returned as a status. */
		response fetch(const std::string& url) const;

		downloader(downloader&) = delete;
		void operator=(downloader&) = delete;
	};
}
