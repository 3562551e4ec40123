#pragma once

#include <string>

namespace pricewatch
{
	/*
	 * Whatever symbol or code remains of a price text once digits, separators
	 * and whitespace are removed: "$49.90" gives "$", "1.234,56 TL" gives "TL".
	 * Empty when the text carries no hint.
	 */
	std::string currency_hint(const std::string& raw_price_text);
}
