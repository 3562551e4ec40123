#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <pricewatch/document.hpp>

namespace pricewatch
{
	enum class purpose
	{
		TITLE,
		PRICE
	};

	std::string to_string(purpose p);

	class rule_error : public std::runtime_error
	{
	private:
		std::string pattern;

	public:
		rule_error(const std::string& _pattern, const std::string& reason)
		: std::runtime_error("Could not compile rule '" + _pattern + "': " + reason)
		, pattern(_pattern)
		{}

		const std::string& get_pattern() const { return pattern; }
	};

	/* One row of a rule table: what the rule locates and the XPath that finds it. */
	struct rule_descriptor
	{
		purpose target;
		const char* pattern;
	};

	class location_rule
	{
	private:
		size_t rank;
		purpose target;
		std::string pattern;
		document::expression_t expression;

	public:
		/* Compiles pattern as XPath 1.0; throws rule_error when it does not compile. */
		location_rule(size_t _rank, purpose _target, const std::string& _pattern);

		size_t get_rank() const { return rank; }
		purpose get_purpose() const { return target; }
		const std::string& get_pattern() const { return pattern; }
		const document::expression_t& get_expression() const { return expression; }
	};

	/* Ordered, most specific first. The rank of a rule is its position. */
	class rule_set
	{
	public:
		typedef std::vector<location_rule>::const_iterator const_iterator;

	private:
		purpose target;
		std::vector<location_rule> rules;

	public:
		rule_set(purpose _target, const std::vector<std::string>& patterns);

		/* Collects the rows of the table aimed at target, keeping table order. */
		static rule_set from_table(purpose target, const std::vector<rule_descriptor>& table);

		static const rule_set& default_title_rules();
		static const rule_set& default_price_rules();

		purpose get_purpose() const { return target; }
		const std::vector<location_rule>& get_rules() const { return rules; }

		size_t size() const { return rules.size(); }
		bool empty() const { return rules.empty(); }
		const_iterator begin() const { return rules.begin(); }
		const_iterator end() const { return rules.end(); }
	};

	/* The built-in rule table, title and price rows interleaved by purpose. */
	const std::vector<rule_descriptor>& builtin_rule_table();
}
