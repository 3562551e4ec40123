#include <pricewatch/util/html_parser.hpp>
#include <pricewatch/util/util.hpp>

#include <sstream>
#include <DOM/SAX2DOM/SAX2DOM.hpp>
#include <SAX/helpers/AttributesImpl.hpp>
#include <SAX/helpers/XMLFilterImpl.hpp>
#include <Taggle/Taggle.hpp>

namespace pricewatch
{
	const size_t html_parser::max_depth;

	namespace
	{
		/*
		 * Taggle behind a filter that hands SAX2DOM plain lowercase HTML names
		 * without namespaces, so unprefixed XPath name tests match, and stops
		 * building elements past html_parser::max_depth.
		 */
		class html_reader : public Arabica::SAX::XMLFilterImpl<std::string>
		{
		private:
			typedef Arabica::SAX::XMLFilterImpl<std::string> base_t;

			// Taggle repairs tag soup into balanced SAX events, like a browser would
			Arabica::SAX::Taggle<std::string> taggle;
			size_t depth;
			size_t skipped;

		public:
			html_reader()
			: base_t()
			, taggle()
			, depth(0)
			, skipped(0)
			{
				setParent(taggle);
			}

			html_reader(html_reader&) = delete;
			void operator=(html_reader&) = delete;

			virtual void startElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName, const base_t::AttributesT& atts)
			{
				if(skipped > 0 || depth >= html_parser::max_depth)
				{
					skipped++;
					return;
				}

				depth++;

				Arabica::SAX::AttributesImpl<std::string> attributes;
				for(int i = 0; i < atts.getLength(); ++i)
				{
					const std::string name = util::lower(atts.getQName(i));
					if(name == "xmlns" || boost::algorithm::starts_with(name, "xmlns:"))
						continue;

					attributes.addAttribute("", name, name, "CDATA", atts.getValue(i));
				}

				const std::string name = util::lower(qName);
				base_t::startElement("", name, name, attributes);
			}

			virtual void endElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName)
			{
				if(skipped > 0)
				{
					skipped--;
					return;
				}

				if(depth > 0)
					depth--;

				const std::string name = util::lower(qName);
				base_t::endElement("", name, name);
			}
		};

		typedef Arabica::SAX2DOM::Parser<std::string, Arabica::default_string_adaptor<std::string>, html_reader> dom_builder;
	}

	html_parser::dom_t html_parser::parse(const std::string& src)
	{
		std::istringstream ss(src);
		return parse(ss);
	}

	html_parser::dom_t html_parser::parse(std::istream& is)
	{
		dom_builder builder;

		Arabica::SAX::InputSource<std::string> i(is);
		if(!builder.parse(i))
			return dom_t();

		return builder.getDocument();
	}
}
