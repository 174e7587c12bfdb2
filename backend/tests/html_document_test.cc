#include "html_document.h"

#include <gtest/gtest.h>

#include <string>

namespace {

std::string round_trip(const std::string &html) {
  auto document = parse_html_document(html);
  return serialize_html(*document);
}

}  // namespace

TEST(HtmlDocumentTest, SerializesUnmodifiedMarkupVerbatim) {
  const std::string html =
      "<!DOCTYPE html>\n"
      "<HTML lang='en'><head><title>A &amp; B</title>"
      "<meta charset=utf-8></head>\n"
      "<body class=\"x\" hidden><!-- note --><p>one<p>two"
      "<img src=\"/a.png\" alt='&quot;q&quot;'/>"
      "<script>if (a < b && c > d) { document.write('</div>'); }</script>"
      "</body></HTML>";
  EXPECT_EQ(round_trip(html), html);
}

TEST(HtmlDocumentTest, KeepsStrayEndTagsAndProcessingInstructions) {
  const std::string html = "<?xml version=\"1.0\"?><div></span>text</div>";
  EXPECT_EQ(round_trip(html), html);
}

TEST(HtmlDocumentTest, ToleratesUnclosedMarkup) {
  EXPECT_EQ(round_trip("<div><p>unclosed"), "<div><p>unclosed");
  EXPECT_EQ(round_trip("<!-- open comment"), "<!-- open comment-->");
  EXPECT_EQ(round_trip("a < b"), "a < b");
  EXPECT_EQ(round_trip("<script>never closed"), "<script>never closed");
}

TEST(HtmlDocumentTest, BuildsTreeWithLowerCaseTagNames) {
  auto document = parse_html_document(
      "<HTML><Body><DIV id=main><a HREF=\"/x\">link</a></DIV></Body></HTML>");
  HtmlNode *div = find_first_element(*document, "div");
  ASSERT_NE(div, nullptr);
  EXPECT_EQ(div->source_tag, "DIV");
  ASSERT_NE(div->attribute("ID"), nullptr);
  EXPECT_EQ(div->attribute("id")->value, "main");

  auto links = find_elements(*document, "a");
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links[0]->parent, div);
  EXPECT_EQ(links[0]->attribute("href")->value, "/x");
}

TEST(HtmlDocumentTest, RawTextElementsAreNotParsedAsMarkup) {
  auto document = parse_html_document(
      "<style>a::after { content: '<b>'; }</style>"
      "<script>var s = '<a href=\"/nope\">';</script>");
  EXPECT_TRUE(find_elements(*document, "a").empty());
  EXPECT_TRUE(find_elements(*document, "b").empty());
  HtmlNode *script = find_first_element(*document, "script");
  ASSERT_NE(script, nullptr);
  EXPECT_EQ(raw_text_content(*script), "var s = '<a href=\"/nope\">';");
}

TEST(HtmlDocumentTest, ScriptEndTagMatchIsCaseInsensitive) {
  auto document = parse_html_document("<script>x()</SCRIPT ><p>after</p>");
  EXPECT_NE(find_first_element(*document, "p"), nullptr);
}

TEST(HtmlDocumentTest, DecodesEntitiesInAttributeValues) {
  auto document = parse_html_document(
      "<a href=\"/s?a=1&amp;b=2&#x26;c=&#51;&unknown;\">x</a>");
  HtmlNode *a = find_first_element(*document, "a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->attribute("href")->value, "/s?a=1&b=2&c=3&unknown;");
  EXPECT_EQ(a->attribute("href")->raw_value, "/s?a=1&amp;b=2&#x26;c=&#51;&unknown;");
}

TEST(HtmlDocumentTest, DecodesEntityObfuscatedSchemes) {
  EXPECT_EQ(decode_html_entities("javascript&colon;alert(1)"),
            "javascript:alert(1)");
  EXPECT_EQ(decode_html_entities("&#106;avascript:"), "javascript:");
  EXPECT_EQ(decode_html_entities("&#x2603;"), "\xE2\x98\x83");
  EXPECT_EQ(decode_html_entities("a & b"), "a & b");
}

TEST(HtmlDocumentTest, SetAttributeReEncodesValue) {
  auto document = parse_html_document("<a href=/old title='it'>x</a>");
  HtmlNode *a = find_first_element(*document, "a");
  a->set_attribute("href", "/watch?url=abc&x=\"1\"");
  a->set_attribute("title", "it's");
  a->set_attribute("data-new", "v");
  EXPECT_EQ(serialize_html(*document),
            "<a href=\"/watch?url=abc&amp;x=&quot;1&quot;\" title='it&#39;s' "
            "data-new=\"v\">x</a>");
}

TEST(HtmlDocumentTest, DuplicateAttributesKeepTheFirst) {
  auto document = parse_html_document("<img src=a.png SRC=b.png>");
  HtmlNode *img = find_first_element(*document, "img");
  ASSERT_EQ(img->attributes.size(), 1u);
  EXPECT_EQ(img->attribute("src")->value, "a.png");
}

TEST(HtmlDocumentTest, EnsureHeadReusesOrCreatesHead) {
  auto with_head = parse_html_document("<html><head></head><body></body></html>");
  HtmlNode *existing = find_first_element(*with_head, "head");
  EXPECT_EQ(ensure_head(*with_head), existing);

  auto no_head = parse_html_document("<html><body>x</body></html>");
  HtmlNode *created = ensure_head(*no_head);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->parent, find_first_element(*no_head, "html"));
  EXPECT_EQ(serialize_html(*no_head),
            "<html><head></head><body>x</body></html>");

  auto fragment = parse_html_document("<!DOCTYPE html>\n<p>bare</p>");
  ensure_head(*fragment);
  EXPECT_EQ(serialize_html(*fragment), "<!DOCTYPE html>\n<head></head><p>bare</p>");
}

TEST(HtmlDocumentTest, InsertChildAndRawTextHelpers) {
  auto document = parse_html_document("<head><title>t</title></head>");
  HtmlNode *head = find_first_element(*document, "head");
  auto script = make_element("script");
  set_raw_text_content(*script, "run()");
  insert_child(*head, 0, std::move(script));
  EXPECT_EQ(serialize_html(*document),
            "<head><script>run()</script><title>t</title></head>");

  auto meta = make_element("meta", {{"charset", "utf-8"}});
  EXPECT_FALSE(meta->has_end_tag);
  insert_child(*head, 99, std::move(meta));
  EXPECT_EQ(serialize_html(*head),
            "<head><script>run()</script><title>t</title>"
            "<meta charset=\"utf-8\"></head>");
}

TEST(HtmlDocumentTest, ClassifiesElements) {
  EXPECT_TRUE(is_void_element("img"));
  EXPECT_TRUE(is_void_element("base"));
  EXPECT_FALSE(is_void_element("div"));
  EXPECT_TRUE(is_raw_text_element("script"));
  EXPECT_TRUE(is_raw_text_element("style"));
  EXPECT_FALSE(is_raw_text_element("p"));
}

TEST(HtmlDocumentTest, AbruptCommentsEndWhereBrowsersEndThem) {
  const std::string html =
      "<body><!--><a href=\"/one\">1</a><!---><a href=\"/two\">2</a>"
      "<!-- c --!><img src=\"/p.png\"><!-- real --></body>";
  auto document = parse_html_document(html);
  EXPECT_EQ(find_elements(*document, "a").size(), 2u);
  EXPECT_NE(find_first_element(*document, "img"), nullptr);
  EXPECT_EQ(serialize_html(*document), html);
}

TEST(HtmlDocumentTest, CommentDashesBeforeTerminatorStayInComment) {
  auto document = parse_html_document("<!-- a -- b ----><p>x</p>");
  ASSERT_EQ(document->children.size(), 2u);
  EXPECT_TRUE(document->children[0]->type == HtmlNodeType::Comment);
  EXPECT_EQ(document->children[0]->text, " a -- b --");
  EXPECT_EQ(document->children[1]->tag_name, "p");
}

TEST(HtmlDocumentTest, DecodesCommonNamedEntities) {
  EXPECT_EQ(decode_html_entities("caf&eacute; &Omega;&sigmaf; &iquest;"),
            "caf\xC3\xA9 \xCE\xA9\xCF\x82 \xC2\xBF");
  EXPECT_EQ(decode_html_entities("&bogus; &amp"), "&bogus; &amp");
}

TEST(HtmlDocumentTest, DetectsUnknownNamedEntities) {
  EXPECT_FALSE(has_unknown_named_entity("/a?x=1&amp;y=2&eacute;"));
  EXPECT_FALSE(has_unknown_named_entity("/a?x=1&y=2&#39;"));
  EXPECT_TRUE(has_unknown_named_entity("/a?x=1&zigzag;"));
}
