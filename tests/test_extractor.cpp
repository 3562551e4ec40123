#include <catch2/catch.hpp>

#include <pricewatch/extractor.hpp>

#include <thread>
#include <vector>

using pricewatch::document;
using pricewatch::extractor;
using pricewatch::price_not_found;
using pricewatch::price_observation;
using pricewatch::price_unparseable;
using pricewatch::purpose;
using pricewatch::rule_set;

namespace {

const char *kDealPage = R"(<html><body>
  <span id="productTitle">
    Coffee Grinder, 200 W
  </span>
  <div id="apex_desktop">
    <span id="priceblock_dealprice">1.234,56 TL</span>
  </div>
  <span class="a-price"><span class="a-offscreen">999,00 TL</span></span>
</body></html>)";

const char *kCorePricePage = R"(<html><body>
  <h1 id="title">Kettle</h1>
  <div id="corePrice_feature_div">
    <span class="a-price"><span class="a-offscreen">$49.90</span></span>
  </div>
</body></html>)";

std::string page_with_price(const std::string& title, const std::string& price) {
  return "<html><body><span id=\"productTitle\">" + title + "</span>"
         "<span id=\"priceblock_ourprice\">" + price + "</span></body></html>";
}

} // namespace

TEST_CASE("extract assembles title, price, raw text and currency", "[extractor]") {
  price_observation obs = extractor().extract(document::parse(kDealPage));

  REQUIRE(obs.title == "Coffee Grinder, 200 W");
  REQUIRE(obs.price_value == Approx(1234.56));
  REQUIRE(obs.price_raw_text == "1.234,56 TL");
  REQUIRE(obs.currency_hint == "TL");
}

TEST_CASE("extract falls back to later rules", "[extractor]") {
  price_observation obs = extractor().extract(document::parse(kCorePricePage));

  REQUIRE(obs.title == "Kettle");
  REQUIRE(obs.price_value == Approx(49.90));
  REQUIRE(obs.price_raw_text == "$49.90");
  REQUIRE(obs.currency_hint == "$");
}

TEST_CASE("a missing title degrades to an empty title", "[extractor]") {
  document doc = document::parse("<html><body><span id=\"priceblock_saleprice\">49,90</span></body></html>");
  price_observation obs = extractor().extract(doc);

  REQUIRE(obs.title.empty());
  REQUIRE(obs.price_value == Approx(49.90));
  REQUIRE(obs.currency_hint.empty());
}

TEST_CASE("no matching price rule fails with price_not_found", "[extractor]") {
  document doc = document::parse("<html><body><span id=\"productTitle\">Kettle</span><p>Robot check</p></body></html>");

  REQUIRE_THROWS_AS(extractor().extract(doc), price_not_found);
  REQUIRE_THROWS_AS(extractor().extract(document()), price_not_found);
}

TEST_CASE("a price element without text counts as not found", "[extractor]") {
  document doc = document::parse("<html><body><span id=\"priceblock_ourprice\">   </span></body></html>");

  REQUIRE_THROWS_AS(extractor().extract(doc), price_not_found);
}

TEST_CASE("price text without digits fails with price_unparseable", "[extractor]") {
  document doc = document::parse(page_with_price("Kettle", "\xE2\x80\x94"));

  try
  {
    extractor().extract(doc);
    FAIL("no exception");
  }
  catch(const price_unparseable& e)
  {
    REQUIRE(e.raw_text() == "\xE2\x80\x94");
    REQUIRE(std::string(e.what()).find("could not be parsed") != std::string::npos);
  }
}

TEST_CASE("both failures share the extraction_error base", "[extractor]") {
  REQUIRE_THROWS_AS(extractor().extract(document()), pricewatch::extraction_error);
  REQUIRE_THROWS_AS(extractor().extract(document::parse(page_with_price("", "n/a"))), pricewatch::extraction_error);
}

TEST_CASE("custom rule sets replace the built-in ones", "[extractor]") {
  extractor ex(
    rule_set(purpose::TITLE, {"//h2[@class='name']"}),
    rule_set(purpose::PRICE, {"//*[@itemprop='price']", "//*[contains(concat(' ', normalize-space(@class), ' '), ' price ')]"})
  );

  document doc = document::parse(
    "<html><body><h2 class=\"name\">Toaster</h2>"
    "<span id=\"priceblock_ourprice\">$1.00</span>"
    "<div class=\"price\">EUR 19,99</div></body></html>");

  price_observation obs = ex.extract(doc);
  REQUIRE(obs.title == "Toaster");
  REQUIRE(obs.price_value == Approx(19.99));
  REQUIRE(obs.currency_hint == "EUR");
}

TEST_CASE("rule sets must match their purpose", "[extractor]") {
  REQUIRE_THROWS_AS(extractor(rule_set(purpose::PRICE, {"//h1"}), rule_set(purpose::PRICE, {"//p"})), std::invalid_argument);
  REQUIRE_THROWS_AS(extractor(rule_set(purpose::TITLE, {"//h1"}), rule_set(purpose::TITLE, {"//p"})), std::invalid_argument);
}

TEST_CASE("pages with very deep unclosed nesting are extracted", "[extractor]") {
  std::string html = page_with_price("Kettle", "$49.90");
  html.reserve(html.size() + 500000 * 5);
  for(size_t i = 0; i < 500000; ++i)
    html += "<div>";
  html += "Robot check";

  price_observation obs = extractor().extract(document::parse(html));
  REQUIRE(obs.title == "Kettle");
  REQUIRE(obs.price_value == Approx(49.9));
}

TEST_CASE("concurrent extractions do not interfere", "[extractor]") {
  const size_t n = 16;

  std::vector<document> docs;
  for(size_t i = 0; i < n; ++i)
    docs.push_back(document::parse(page_with_price("Item " + std::to_string(i), std::to_string(i + 1) + ",25 TL")));

  const extractor ex;
  std::vector<price_observation> results(n);
  std::vector<std::thread> workers;

  for(size_t i = 0; i < n; ++i)
  {
    workers.emplace_back([&ex, &docs, &results, i]() {
      for(int round = 0; round < 50; ++round)
        results[i] = ex.extract(docs[i]);
    });
  }

  for(auto& w : workers)
    w.join();

  for(size_t i = 0; i < n; ++i)
  {
    REQUIRE(results[i].title == "Item " + std::to_string(i));
    REQUIRE(results[i].price_value == Approx(i + 1.25));
    REQUIRE(results[i].currency_hint == "TL");
  }
}
