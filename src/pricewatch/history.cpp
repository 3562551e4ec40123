#include <pricewatch/history.hpp>

#include <fstream>
#include <stdexcept>
#include <boost/filesystem.hpp>

#include <pricewatch/util/util.hpp>

namespace pricewatch
{
	const std::string history_log::default_path = "data/price_history.csv";

	const std::vector<std::string> history_log::header = {
		"timestamp", "url", "title", "price", "raw_price"
	};

	history_log::history_log(const std::string& _path)
	: path(_path)
	{}

	void history_log::append(const history_entry& entry) const
	{
		boost::filesystem::path p(path);
		if(p.has_parent_path())
			boost::filesystem::create_directories(p.parent_path());

		const bool write_header = !boost::filesystem::exists(p) || boost::filesystem::file_size(p) == 0;

		std::ofstream out(path, std::ios::app | std::ios::binary);
		if(!out)
			throw std::runtime_error("Could not open history log " + path);

		if(write_header)
			out << format_row(header);

		out << format_row({
			to_string(entry.timestamp),
			entry.url,
			entry.title,
			util::format_price(entry.price),
			entry.raw_price
		});

		out.flush();
		if(!out)
			throw std::runtime_error("Could not write to history log " + path);
	}

	void history_log::append(const std::string& url, const price_observation& observation) const
	{
		append(history_entry{
			datetime_now(),
			url,
			observation.title,
			observation.price_value,
			observation.price_raw_text
		});
	}

	std::string history_log::escape(const std::string& field)
	{
		if(field.find_first_of(",\"\r\n") == std::string::npos)
			return field;

		std::string result("\"");
		for(char c : field)
		{
			if(c == '"')
				result.append("\"\"");
			else
				result.push_back(c);
		}
		result.push_back('"');

		return result;
	}

	std::string history_log::format_row(const std::vector<std::string>& fields)
	{
		std::string row;
		for(size_t i = 0; i < fields.size(); ++i)
		{
			if(i > 0)
				row.push_back(',');

			row.append(escape(fields[i]));
		}

		row.append("\r\n");
		return row;
	}
}
