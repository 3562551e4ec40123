#include <pricewatch/options.hpp>
#include <pricewatch/history.hpp>

#include <cstdlib>
#include <fstream>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

namespace pricewatch
{
	int read_options(cli_options& opt, int argc, const char* const* argv, std::ostream& out, std::ostream& err)
	{
		namespace po = boost::program_options;

		po::options_description o_general("General options");
		o_general.add_options()
				("help,h", "display this message")
				("config,c", po::value(&opt.config), "read options from an ini-style file (command line wins)");

		po::options_description o_fetch("Fetch options");
		o_fetch.add_options()
				("url,u", po::value(&opt.url), "product page to fetch")
				("file,f", po::value(&opt.file), "read the page from an html file instead of fetching it")
				("timeout", po::value(&opt.timeout)->default_value(20), "fetch timeout in seconds, 5 to 120")
				("agent", po::value(&opt.agent)->default_value("pricewatch/1.0"), "user agent sent with requests")
				("charset", po::value(&opt.charset)->default_value("UTF-8"), "charset of the page, converted to UTF-8");

		po::options_description o_output("Output options");
		o_output.add_options()
				("target,t", po::value(&opt.target)->default_value(0), "alert when the price is at or below this value (0 disables)")
				("save,s", po::bool_switch(&opt.save), "append the observation to the history log")
				("history", po::value(&opt.history)->default_value(history_log::default_path), "history log path")
				("json,j", po::bool_switch(&opt.json), "print the observation as json")
				("silent", po::bool_switch(&opt.silent), "do not write status reports to cerr");

		po::variables_map vm;
		po::positional_options_description pos;
		pos.add("url", 1);

		po::options_description options("Allowed options");
		options.add(o_general).add(o_fetch).add(o_output);

		po::options_description file_options;
		file_options.add(o_fetch).add(o_output);

		try
		{
			po::store(po::command_line_parser(argc, argv).options(options).positional(pos).run(), vm);

			// Values stored first are final, so the file only fills in what the command line left out
			if(vm.count("config"))
			{
				const std::string path = vm["config"].as<std::string>();
				std::ifstream is(path);
				if(!is)
				{
					err << "Could not open config file " << path << std::endl;
					return EXIT_FAILURE;
				}

				po::store(po::parse_config_file(is, file_options), vm);
			}

			po::notify(vm);
		} catch(const po::unknown_option& e)
		{
			err << "Unknown option " << e.get_option_name() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		} catch(const po::error& e)
		{
			err << e.what() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		}

		if(vm.count("help"))
		{
			out
					<< "Extracts the title and price of a product page." << std::endl
					<< "Usage: ./pricewatch [options] <url>" << std::endl
					<< std::endl
					<< o_general << std::endl
					<< o_fetch << std::endl
					<< o_output;
			return EXIT_FAILURE;
		}

		if(opt.url.empty() == opt.file.empty())
		{
			err << "Provide either a url or --file, see --help." << std::endl;
			return EXIT_FAILURE;
		}

		if(!opt.url.empty() && !boost::algorithm::starts_with(opt.url, "http://") && !boost::algorithm::starts_with(opt.url, "https://"))
		{
			err << "Invalid url '" << opt.url << "', expected an http(s) product page." << std::endl;
			return EXIT_FAILURE;
		}

		if(opt.timeout < 5 || opt.timeout > 120)
		{
			err << "Timeout must be between 5 and 120 seconds." << std::endl;
			return EXIT_FAILURE;
		}

		return EXIT_SUCCESS;
	}
}
