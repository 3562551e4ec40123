#pragma once

#include <string>

#include <pricewatch/util/downloader.hpp>

namespace pricewatch
{
	struct page_t
	{
		std::string source; // URL or file path
		long status; // HTTP status, 0 for files
		std::string html; // UTF-8
	};

	/* Converts from charset to UTF-8; UTF-8 input is passed through. */
	std::string to_utf8(const std::string& body, const std::string& charset);

	page_t read_page(const std::string& path, const std::string& charset);
	page_t fetch_page(const downloader& dl, const std::string& url, const std::string& charset);
}
