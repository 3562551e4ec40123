#pragma once

#include <ostream>
#include <string>
#include <jsoncpp/json/json.h>

#include <pricewatch/extractor.hpp>

namespace pricewatch
{
	/* A target of zero (or less) disables the alert. */
	bool target_reached(const price_observation& observation, double target);

	void write_report(std::ostream& os, const price_observation& observation, double target);

	Json::Value to_json(const std::string& url, const price_observation& observation, double target);
}
