#include <pricewatch/util/downloader.hpp>

#include <curl/curl.h>

namespace pricewatch
{
	static size_t downloader_write_callback(void *contents, size_t size, size_t nmemb, void *userp)
	{
		size_t realsize = size * nmemb;

		std::string *mem = static_cast<std::string*>(userp);
		mem->append(static_cast<char*>(contents), realsize);

		return realsize;
	}

	static void global_init()
	{
		static const CURLcode init_result = curl_global_init(CURL_GLOBAL_ALL);

		if(init_result != CURLE_OK)
			throw fetch_error(std::string("Could not initialize libcurl: ") + curl_easy_strerror(init_result), false);
	}

	downloader::curl_ptr downloader::create_handle() const
	{
		global_init();

		CURL* handle = curl_easy_init();
		if(handle == nullptr)
			throw fetch_error("Could not create curl handle", false);

		curl_easy_setopt(handle, CURLOPT_USERAGENT, agent.c_str());
		curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
		curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout);
		curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, downloader_write_callback);

		return curl_ptr(handle, &curl_easy_cleanup);
	}

	downloader::downloader(const std::string& _agent, long timeout_seconds)
	: agent(_agent)
	, timeout(timeout_seconds)
	{}

	downloader::response downloader::fetch(const std::string& url) const
	{
		response result{0, std::string()};
		curl_ptr handle(create_handle());

		curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
		curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&result.body));

		CURLcode code = curl_easy_perform(handle.get());
		if(code != CURLE_OK)
			throw fetch_error("Could not fetch " + url + ": " + curl_easy_strerror(code), code == CURLE_OPERATION_TIMEDOUT);

		curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &result.status);

		return result;
	}
}
