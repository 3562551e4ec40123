#include <pricewatch/location_rule.hpp>

namespace pricewatch
{
	std::string to_string(purpose p)
	{
		switch(p)
		{
		case purpose::TITLE:
			return "title";
		case purpose::PRICE:
			return "price";
		}

		return "unknown";
	}

	static document::expression_t compile(const std::string& pattern)
	{
		if(pattern.empty())
			throw rule_error(pattern, "empty expression");

		Arabica::XPath::XPath<std::string> xpath;
		try
		{
			return document::expression_t(xpath.compile(pattern));
		} catch(const std::runtime_error& e)
		{
			// SyntaxException, or UnsupportedException for unknown functions
			throw rule_error(pattern, e.what());
		}
	}

	location_rule::location_rule(size_t _rank, purpose _target, const std::string& _pattern)
	: rank(_rank)
	, target(_target)
	, pattern(_pattern)
	, expression(compile(_pattern))
	{}

	rule_set::rule_set(purpose _target, const std::vector<std::string>& patterns)
	: target(_target)
	, rules()
	{
		rules.reserve(patterns.size());
		for(const auto& pattern : patterns)
			rules.emplace_back(rules.size(), target, pattern);
	}

	rule_set rule_set::from_table(purpose target, const std::vector<rule_descriptor>& table)
	{
		std::vector<std::string> patterns;
		for(const auto& row : table)
			if(row.target == target)
				patterns.emplace_back(row.pattern);

		return rule_set(target, patterns);
	}

	const std::vector<rule_descriptor>& builtin_rule_table()
	{
		// Class tests match one token of a whitespace-separated class attribute
		static const std::vector<rule_descriptor> table = {
			{purpose::TITLE, "//*[@id='productTitle']"},
			{purpose::TITLE, "//h1[@id='title']"},

			{purpose::PRICE, "//*[@id='priceblock_ourprice']"},
			{purpose::PRICE, "//*[@id='priceblock_dealprice']"},
			{purpose::PRICE, "//*[@id='priceblock_saleprice']"},
			{purpose::PRICE, "//span[contains(concat(' ', normalize-space(@class), ' '), ' a-price ')]"
				"//span[contains(concat(' ', normalize-space(@class), ' '), ' a-offscreen ')]"},
			{purpose::PRICE, "//*[@id='corePriceDisplay_desktop_feature_div']"
				"//span[contains(concat(' ', normalize-space(@class), ' '), ' a-price ')]"
				"//span[contains(concat(' ', normalize-space(@class), ' '), ' a-offscreen ')]"},
			{purpose::PRICE, "//*[@id='corePrice_feature_div']"
				"//span[contains(concat(' ', normalize-space(@class), ' '), ' a-price ')]"
				"//span[contains(concat(' ', normalize-space(@class), ' '), ' a-offscreen ')]"}
		};

		return table;
	}

	const rule_set& rule_set::default_title_rules()
	{
		static const rule_set rules(from_table(purpose::TITLE, builtin_rule_table()));
		return rules;
	}

	const rule_set& rule_set::default_price_rules()
	{
		static const rule_set rules(from_table(purpose::PRICE, builtin_rule_table()));
		return rules;
	}
}
