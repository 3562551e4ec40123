#pragma once

#include <string>
#include <boost/optional.hpp>

namespace pricewatch
{
	/* Which of '.' and ',' separates the fractional part. */
	enum class decimal_mark
	{
		POINT,
		COMMA
	};

	/* Drops everything except digits, '.' and ','. */
	std::string strip_to_numeric(const std::string& raw_text);

	/*
	 * Both marks present: the one occurring last is decimal.
	 * Only ',' present: ',' is decimal.
	 * Only '.' present, or neither: '.' is decimal.
	 *
	 * Thousands-grouped integers without a fractional part ("1.234", "1,234")
	 * are read as decimals. No locale information is available to tell them apart.
	 */
	decimal_mark infer_decimal_mark(const std::string& numeric);

	/* Removes the grouping mark and rewrites the decimal mark to '.'. */
	std::string apply_decimal_mark(std::string numeric, decimal_mark mark);

	/*
	 * Price text to a number; boost::none when nothing parseable remains.
	 * A digit run too large for a double is also boost::none rather than
	 * infinity, so every returned price is finite.
	 */
	boost::optional<double> normalize(const std::string& raw_text);
}
