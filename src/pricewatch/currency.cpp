#include <pricewatch/currency.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

namespace pricewatch
{
	std::string currency_hint(const std::string& raw_price_text)
	{
		static const boost::regex match_noise("[0-9.,[:space:]]+");

		// No-break spaces (U+00A0, U+202F) separate amount and symbol in many locales
		std::string hint = raw_price_text;
		boost::replace_all(hint, "\xC2\xA0", " ");
		boost::replace_all(hint, "\xE2\x80\xAF", " ");

		hint = boost::regex_replace(hint, match_noise, "");
		boost::trim(hint);
		return hint;
	}
}
