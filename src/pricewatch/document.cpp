#include <pricewatch/document.hpp>

#include <set>

#include <pricewatch/util/html_parser.hpp>
#include <pricewatch/util/util.hpp>

namespace pricewatch
{
	static bool is_hidden(const document::node_t& n)
	{
		static const std::set<std::string> hidden = {"script", "style", "noscript", "template"};
		return hidden.find(n.getNodeName()) != hidden.end();
	}

	document::document()
	: dom()
	{}

	document::document(const dom_t& _dom)
	: dom(_dom)
	{}

	document document::parse(const std::string& html)
	{
		return document(html_parser::parse(html));
	}

	document::node_t document::select_first(const expression_t& expr) const
	{
		if(dom == 0)
			return node_t();

		Arabica::XPath::XPathValue<std::string> result = expr->evaluate(dom);
		if(result.type() != Arabica::XPath::NODE_SET)
			return node_t();

		Arabica::XPath::NodeSet<std::string> nodes = result.asNodeSet();
		if(nodes.size() == 0)
			return node_t();

		nodes.to_document_order();
		return nodes[0];
	}

	std::string document::text_of(const node_t& n)
	{
		std::string buffer;

		// Pre-order walk over first-child/next-sibling links, never leaving n
		node_t current = n;
		while(current != 0)
		{
			node_t next;

			switch(current.getNodeType())
			{
			case Arabica::DOM::Node_base::TEXT_NODE:
			case Arabica::DOM::Node_base::CDATA_SECTION_NODE:
				buffer.append(current.getNodeValue());
				break;
			case Arabica::DOM::Node_base::ELEMENT_NODE:
				if(is_hidden(current))
					break;

				// Element boundaries separate words
				buffer.append(" ");
				next = current.getFirstChild();
				break;
			case Arabica::DOM::Node_base::DOCUMENT_NODE:
				next = current.getFirstChild();
				break;
			default:
				break;
			}

			while(next == 0 && current != n)
			{
				next = current.getNextSibling();
				if(next == 0)
					current = current.getParentNode();
			}

			current = next;
		}

		return util::sanitize(buffer);
	}
}
