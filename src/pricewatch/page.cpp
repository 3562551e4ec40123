#include <pricewatch/page.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>

namespace pricewatch
{
	std::string to_utf8(const std::string& body, const std::string& charset)
	{
		const std::string cs = boost::algorithm::to_lower_copy(charset);
		if(cs.empty() || cs == "utf-8" || cs == "utf8")
			return body;

		return boost::locale::conv::to_utf<char>(body, charset);
	}

	page_t read_page(const std::string& path, const std::string& charset)
	{
		std::ifstream is(path, std::ios::binary);
		if(!is)
			throw std::runtime_error("Could not open " + path);

		std::ostringstream sstr;
		sstr << is.rdbuf();

		return page_t{path, 0, to_utf8(sstr.str(), charset)};
	}

	page_t fetch_page(const downloader& dl, const std::string& url, const std::string& charset)
	{
		downloader::response response(dl.fetch(url));
		return page_t{url, response.status, to_utf8(response.body, charset)};
	}
}
