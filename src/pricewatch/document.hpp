#pragma once

#include <string>
#include <DOM/Document.hpp>
#include <DOM/Node.hpp>
#include <XPath/XPath.hpp>

namespace pricewatch
{
	/* A parsed page. Element and attribute names are lowercase. */
	class document
	{
	public:
		typedef Arabica::DOM::Document<std::string> dom_t;
		typedef Arabica::DOM::Node<std::string> node_t;
		typedef Arabica::XPath::XPathExpressionPtr<std::string> expression_t;

	private:
		dom_t dom;

	public:
		/* An empty page, nothing matches. */
		document();
		explicit document(const dom_t& _dom);

		/* Builds a document from (possibly malformed) HTML. */
		static document parse(const std::string& html);

		const dom_t& get_dom() const { return dom; }

		/*
		 * First node in document order selected by expr. A null node when
		 * nothing matches, or when expr evaluates to a string, number or boolean.
		 */
		node_t select_first(const expression_t& expr) const;

		/* Descendant text joined by single spaces, whitespace collapsed and trimmed. */
		static std::string text_of(const node_t& n);
	};
}
