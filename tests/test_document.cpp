#include <catch2/catch.hpp>

#include <pricewatch/document.hpp>
#include <pricewatch/location_rule.hpp>
#include <pricewatch/util/html_parser.hpp>

using pricewatch::document;
using pricewatch::html_parser;

namespace {

const char *kProductPage = R"(<!DOCTYPE html>
<html>
<head>
  <title>Shop</title>
  <script>var price = "$1.00";</script>
</head>
<body>
  <H1 ID="title">
    Espresso   Machine
    <small>Deluxe</small>
  </H1>
  <div id="corePrice_feature_div">
    <span class="a-price aok-align-center">
      <span class="a-offscreen">$49.90</span>
      <span aria-hidden="true">$49<sup>.90</sup></span>
    </span>
  </div>
  <div class="a-price"><span class="a-offscreen">$12.00</span></div>
</body>
</html>)";

document::expression_t xpath(const std::string& pattern) {
  return pricewatch::location_rule(0, pricewatch::purpose::PRICE, pattern).get_expression();
}

std::string nested(size_t depth, const std::string& inner) {
  std::string html = "<html><body>";
  html.reserve(html.size() + depth * 5 + inner.size());
  for(size_t i = 0; i < depth; ++i)
    html += "<div>";
  return html + inner;
}

} // namespace

TEST_CASE("parse lowercases element and attribute names", "[document]") {
  document doc = document::parse(kProductPage);

  document::node_t h1 = doc.select_first(xpath("//h1[@id='title']"));
  REQUIRE(h1 != 0);
  REQUIRE(h1.getNodeName() == "h1");
  REQUIRE(doc.select_first(xpath("//H1")) == 0);
}

TEST_CASE("text_of collapses whitespace across nested elements", "[document]") {
  document doc = document::parse(kProductPage);

  document::node_t h1 = doc.select_first(xpath("//h1"));
  REQUIRE(h1 != 0);
  REQUIRE(document::text_of(h1) == "Espresso Machine Deluxe");
}

TEST_CASE("text_of skips script content", "[document]") {
  document doc = document::parse(kProductPage);

  document::node_t head = doc.select_first(xpath("//head"));
  REQUIRE(head != 0);
  REQUIRE(document::text_of(head) == "Shop");
}

TEST_CASE("select_first returns the first match in document order", "[document]") {
  document doc = document::parse(kProductPage);

  document::node_t offscreen = doc.select_first(xpath("//*[contains(@class, 'a-price')]//span[@class='a-offscreen']"));
  REQUIRE(offscreen != 0);
  REQUIRE(document::text_of(offscreen) == "$49.90");

  REQUIRE(doc.select_first(xpath("//*[@id='priceblock_ourprice']")) == 0);
}

TEST_CASE("expressions that do not select nodes match nothing", "[document]") {
  document doc = document::parse(kProductPage);

  REQUIRE(doc.select_first(xpath("count(//span)")) == 0);
  REQUIRE(doc.select_first(xpath("string(//h1)")) == 0);
}

TEST_CASE("adjacent text is joined without a separator", "[document]") {
  document doc = document::parse("<html><body><span id=\"p\">$4<!-- split -->9.90<sup>incl. VAT</sup>  </span></body></html>");

  document::node_t span = doc.select_first(xpath("//*[@id='p']"));
  REQUIRE(span != 0);
  REQUIRE(document::text_of(span) == "$49.90 incl. VAT");
}

TEST_CASE("text_of an element without text is empty", "[document]") {
  document doc = document::parse("<html><body><div id=\"d\"> \n\t <span></span></div></body></html>");

  document::node_t div = doc.select_first(xpath("//*[@id='d']"));
  REQUIRE(div != 0);
  REQUIRE(document::text_of(div).empty());
}

TEST_CASE("malformed html still yields a queryable tree", "[document]") {
  document doc = document::parse("<div id=priceblock_ourprice><b>TL 1.299,00<p>unclosed");

  document::node_t price = doc.select_first(xpath("//*[@id='priceblock_ourprice']//b"));
  REQUIRE(price != 0);
  REQUIRE(document::text_of(price).find("TL 1.299,00") == 0);
}

TEST_CASE("an empty document matches nothing", "[document]") {
  document doc;

  REQUIRE(doc.select_first(xpath("//*")) == 0);
  REQUIRE(document::text_of(doc.get_dom()).empty());
}

TEST_CASE("elements nested past the depth limit are flattened into their ancestor", "[document]") {
  document doc = document::parse(nested(html_parser::max_depth * 4, "<span id=\"deep\">$1.00</span>"));

  REQUIRE(doc.select_first(xpath("//*[@id='deep']")) == 0);
  REQUIRE(doc.select_first(xpath("//div[count(ancestor::*) > 600]")) == 0);

  document::node_t body = doc.select_first(xpath("//body"));
  REQUIRE(body != 0);
  REQUIRE(document::text_of(body) == "$1.00");
}

TEST_CASE("very deep nesting is parsed and walked without exhausting the stack", "[document]") {
  document doc = document::parse(nested(500000, "deepest text"));

  document::node_t body = doc.select_first(xpath("//body"));
  REQUIRE(body != 0);
  REQUIRE(document::text_of(body) == "deepest text");
}
