#include <pricewatch/report.hpp>

#include <pricewatch/util/util.hpp>

namespace pricewatch
{
	bool target_reached(const price_observation& observation, double target)
	{
		return target > 0 && observation.price_value <= target;
	}

	void write_report(std::ostream& os, const price_observation& observation, double target)
	{
		const std::string title = observation.title.empty() ? "(title not found)" : observation.title;
		const std::string price = util::format_price(observation.price_value);

		os << "Product: " << title << std::endl;
		os << "Price: " << price << "  |  (raw: " << observation.price_raw_text << ")" << std::endl;

		if(!target_reached(observation, target))
			return;

		std::string current = price;
		if(!observation.currency_hint.empty())
			current.append(" ").append(observation.currency_hint);

		os << "Target reached! Price is below your target." << std::endl;
		os << "Target: " << util::format_price(target) << std::endl;
		os << "Current: " << current << std::endl;
	}

	Json::Value to_json(const std::string& url, const price_observation& observation, double target)
	{
		Json::Value root(Json::objectValue);

		root["url"] = url;
		root["title"] = observation.title;
		root["price"] = observation.price_value;
		root["price_text"] = observation.price_raw_text;
		root["currency_hint"] = observation.currency_hint;
		root["target_reached"] = target_reached(observation, target);

		return root;
	}
}
