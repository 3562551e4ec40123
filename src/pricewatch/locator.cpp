#include <pricewatch/locator.hpp>

namespace pricewatch
{
	boost::optional<raw_text_match> locate(const document& doc, const rule_set& rules)
	{
		for(const auto& rule : rules)
		{
			document::node_t n = doc.select_first(rule.get_expression());
			if(n == 0)
				continue;

			std::string text = document::text_of(n);
			if(text.empty())
				continue;

			return raw_text_match{rule.get_rank(), text};
		}

		return boost::none;
	}
}
