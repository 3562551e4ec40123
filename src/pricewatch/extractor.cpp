#include <pricewatch/extractor.hpp>

#include <utility>

#include <pricewatch/currency.hpp>
#include <pricewatch/locator.hpp>
#include <pricewatch/normalizer.hpp>

namespace pricewatch
{
	extractor::extractor()
	: extractor(rule_set::default_title_rules(), rule_set::default_price_rules())
	{}

	extractor::extractor(rule_set _title_rules, rule_set _price_rules)
	: title_rules(std::move(_title_rules))
	, price_rules(std::move(_price_rules))
	{
		if(title_rules.get_purpose() != purpose::TITLE)
			throw std::invalid_argument("Title rules must target " + to_string(purpose::TITLE));

		if(price_rules.get_purpose() != purpose::PRICE)
			throw std::invalid_argument("Price rules must target " + to_string(purpose::PRICE));
	}

	price_observation extractor::extract(const document& doc) const
	{
		boost::optional<raw_text_match> title = locate(doc, title_rules);

		boost::optional<raw_text_match> price = locate(doc, price_rules);
		if(!price)
			throw price_not_found();

		boost::optional<double> value = normalize(price->text);
		if(!value)
			throw price_unparseable(price->text);

		return price_observation{
			title ? title->text : std::string(),
			*value,
			price->text,
			currency_hint(price->text)
		};
	}
}
