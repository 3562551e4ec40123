#pragma once

#include <stdexcept>
#include <string>

#include <pricewatch/document.hpp>
#include <pricewatch/location_rule.hpp>

namespace pricewatch
{
	/* Only ever built from a successful extraction, so price_value is always meaningful. */
	struct price_observation
	{
		std::string title; // Empty when no title rule matched
		double price_value;
		std::string price_raw_text;
		std::string currency_hint;
	};

	class extraction_error : public std::runtime_error
	{
	public:
		explicit extraction_error(const std::string& what)
		: std::runtime_error(what)
		{}
	};

	class price_not_found : public extraction_error
	{
	public:
		price_not_found()
		: extraction_error("Price element not found. The page layout may be different or blocked.")
		{}
	};

	class price_unparseable : public extraction_error
	{
	private:
		std::string raw;

	public:
		explicit price_unparseable(const std::string& _raw)
		: extraction_error("Price could not be parsed. The content may be blocked or the format is unexpected.")
		, raw(_raw)
		{}

		const std::string& raw_text() const { return raw; }
	};

	class extractor
	{
	private:
		rule_set title_rules;
		rule_set price_rules;

	public:
		extractor();
		extractor(rule_set _title_rules, rule_set _price_rules);

		/*
		 * Locates the title (optional) and the price (mandatory), normalizes the
		 * price and derives its currency hint. Throws price_not_found or
		 * price_unparseable; never returns a partial observation.
		 */
		price_observation extract(const document& doc) const;

		const rule_set& get_title_rules() const { return title_rules; }
		const rule_set& get_price_rules() const { return price_rules; }
	};
}
