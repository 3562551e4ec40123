#pragma once

#include <locale>
#include <sstream>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace pricewatch
{
	typedef boost::posix_time::ptime datetime;

	inline datetime datetime_now()
	{
		return boost::posix_time::second_clock::local_time();
	}

	/* "YYYY-MM-DD HH:MM:SS" */
	inline std::string to_string(const datetime& dt)
	{
		std::ostringstream sstr;
		sstr.imbue(std::locale(sstr.getloc(), new boost::posix_time::time_facet("%Y-%m-%d %H:%M:%S")));
		sstr << dt;
		return sstr.str();
	}
}
