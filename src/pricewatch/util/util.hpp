#pragma once

#include <iomanip>
#include <locale>
#include <string>
#include <sstream>
#include <boost/algorithm/string.hpp>

namespace pricewatch
{
	class util
	{
		util() = delete;
		util(util&) = delete;
		void operator=(util&) = delete;

	public:
		/* Collapses whitespace runs into a single space and trims both ends. */
		static inline std::string sanitize(const std::string& str)
		{
			std::stringstream is(str);
			std::string result;

			while(is.peek() != std::char_traits<char>::eof())
			{
				std::string tmp;
				is >> tmp;

				if(tmp.empty())
					continue;

				if(!result.empty())
					result.append(" ");

				result.append(tmp);
			}

			boost::trim(result);
			return result;
		}

		static inline std::string lower(const std::string& str)
		{
			return boost::algorithm::to_lower_copy(str);
		}

		/* Shortest natural decimal form: 49.9, 1234.56, 12 */
		static inline std::string format_price(double price)
		{
			std::ostringstream sstr;
			sstr.imbue(std::locale::classic());
			sstr << std::setprecision(15) << price;
			return sstr.str();
		}
	};
}
