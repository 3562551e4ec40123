#include <pricewatch/extractor.hpp>
#include <pricewatch/history.hpp>
#include <pricewatch/options.hpp>
#include <pricewatch/page.hpp>
#include <pricewatch/report.hpp>
#include <pricewatch/util/datetime.hpp>
#include <pricewatch/util/util.hpp>

#include <cstdlib>
#include <iostream>

static void status(const pricewatch::cli_options& opt, const std::string& msg)
{
	if(!opt.silent)
		std::cerr << '[' << pricewatch::to_string(pricewatch::datetime_now()) << "] " << msg << std::endl;
}

static void error(const std::string& msg)
{
	std::cerr << '[' << pricewatch::to_string(pricewatch::datetime_now()) << "] ERROR: " << msg << std::endl;
}

int main(int argc, char** argv)
{
	pricewatch::cli_options opt;
	int result = pricewatch::read_options(opt, argc, argv);
	if(result != EXIT_SUCCESS)
		return result;

	pricewatch::page_t page;
	try
	{
		if(!opt.file.empty())
		{
			status(opt, "Reading " + opt.file);
			page = pricewatch::read_page(opt.file, opt.charset);
		}
		else
		{
			status(opt, "Fetching " + opt.url);

			pricewatch::downloader dl(opt.agent, opt.timeout);
			page = pricewatch::fetch_page(dl, opt.url, opt.charset);

			if(page.status >= 400)
				status(opt, "Server answered with HTTP " + std::to_string(page.status));
		}
	} catch(const pricewatch::fetch_error& e)
	{
		if(e.timed_out())
			error("Timeout: page is slow or blocked.");
		else
			error(e.what());

		return EXIT_FAILURE;
	} catch(const std::runtime_error& e)
	{
		error(e.what());
		return EXIT_FAILURE;
	}

	pricewatch::price_observation observation;
	try
	{
		pricewatch::extractor ex;
		observation = ex.extract(pricewatch::document::parse(page.html));
	} catch(const pricewatch::price_unparseable& e)
	{
		error(std::string(e.what()) + " Raw price text: '" + e.raw_text() + "'");
		return EXIT_FAILURE;
	} catch(const std::runtime_error& e)
	{
		error(e.what());
		return EXIT_FAILURE;
	}

	std::string parsed = "OK: parsed price " + pricewatch::util::format_price(observation.price_value);
	if(!observation.currency_hint.empty())
		parsed.append(" ").append(observation.currency_hint);
	status(opt, parsed);

	if(opt.json)
	{
		Json::StreamWriterBuilder builder;
		builder["indentation"] = "  ";
		std::cout << Json::writeString(builder, pricewatch::to_json(page.source, observation, opt.target)) << std::endl;
	}
	else
		pricewatch::write_report(std::cout, observation, opt.target);

	if(opt.save)
	{
		try
		{
			pricewatch::history_log log(opt.history);
			log.append(page.source, observation);
			status(opt, "Saved to " + log.get_path());
		} catch(const std::runtime_error& e)
		{
			error(e.what());
			return EXIT_FAILURE;
		}
	}

	return EXIT_SUCCESS;
}
