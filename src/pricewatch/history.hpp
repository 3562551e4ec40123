#pragma once

#include <string>
#include <vector>

#include <pricewatch/extractor.hpp>
#include <pricewatch/util/datetime.hpp>

namespace pricewatch
{
	struct history_entry
	{
		datetime timestamp;
		std::string url;
		std::string title;
		double price;
		std::string raw_price;
	};

	/*
	 * Append-only UTF-8 CSV log of observations. The header row is written
	 * once, when the file is created.
	 */
	class history_log
	{
	private:
		std::string path;

	public:
		static const std::string default_path;
		static const std::vector<std::string> header;

		explicit history_log(const std::string& _path = default_path);

		const std::string& get_path() const { return path; }

		void append(const history_entry& entry) const;
		void append(const std::string& url, const price_observation& observation) const;

		static std::string escape(const std::string& field);
		static std::string format_row(const std::vector<std::string>& fields);
	};
}
