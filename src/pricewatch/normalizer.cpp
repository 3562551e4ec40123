#include <pricewatch/normalizer.hpp>

#include <algorithm>
#include <cmath>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace pricewatch
{
	std::string strip_to_numeric(const std::string& raw_text)
	{
		static const boost::regex match_noise("[^0-9.,]");
		return boost::regex_replace(raw_text, match_noise, "");
	}

	decimal_mark infer_decimal_mark(const std::string& numeric)
	{
		size_t last_point = numeric.rfind('.');
		size_t last_comma = numeric.rfind(',');

		if(last_comma == std::string::npos)
			return decimal_mark::POINT;

		if(last_point == std::string::npos)
			return decimal_mark::COMMA;

		return last_comma > last_point ? decimal_mark::COMMA : decimal_mark::POINT;
	}

	std::string apply_decimal_mark(std::string numeric, decimal_mark mark)
	{
		switch(mark)
		{
		case decimal_mark::COMMA:
			numeric.erase(std::remove(numeric.begin(), numeric.end(), '.'), numeric.end());
			std::replace(numeric.begin(), numeric.end(), ',', '.');
			break;
		case decimal_mark::POINT:
			numeric.erase(std::remove(numeric.begin(), numeric.end(), ','), numeric.end());
			break;
		}

		return numeric;
	}

	boost::optional<double> normalize(const std::string& raw_text)
	{
		static const boost::regex match_decimal("([0-9]*)\\.?([0-9]*)");

		std::string numeric = strip_to_numeric(raw_text);
		if(numeric.empty())
			return boost::none;

		numeric = apply_decimal_mark(numeric, infer_decimal_mark(numeric));

		// Several points left over ("1.234.567") or no digits at all (".")
		boost::smatch what;
		if(!boost::regex_match(numeric, what, match_decimal) || (what[1].length() == 0 && what[2].length() == 0))
			return boost::none;

		const std::string integral = what[1].length() > 0 ? what[1].str() : "0";
		const std::string fractional = what[2].length() > 0 ? what[2].str() : "0";

		double value;
		try
		{
			value = boost::lexical_cast<double>(integral + "." + fractional);
		}
		catch(const boost::bad_lexical_cast&)
		{
			// Out of range for a double
			return boost::none;
		}

		if(!std::isfinite(value))
			return boost::none;

		return value;
	}
}
