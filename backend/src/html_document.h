#pragma once
// ─── Mirrorgate — Lossless HTML tree ────────────────────────────────────
// A forgiving tokenizer plus tree builder tuned for rewriting, not
// rendering. The tree keeps enough of the source (tag and attribute
// casing, quote style, raw entity text, which end tags were present) that
// serialize_html() reproduces unmodified markup byte for byte apart from
// whitespace inside tags.

#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class HtmlNodeType {
  Document,
  Doctype,
  Comment,
  Element,
  Text,
  Raw,  // markup kept verbatim: stray end tags, <?...?>, bogus <!...>
};

struct HtmlAttribute {
  std::string name;       // as written in the source
  std::string value;      // entity-decoded
  std::string raw_value;  // as written in the source (entities intact)
  char quote = '"';       // '"', '\'' or 0 for unquoted
  bool has_value = true;
};

struct HtmlNode {
  HtmlNodeType type = HtmlNodeType::Document;
  std::string tag_name;    // lower-case, elements only
  std::string source_tag;  // tag as written
  std::vector<HtmlAttribute> attributes;
  std::string text;  // Text/Raw: source text; Comment/Doctype: inner text
  bool self_closing = false;
  bool has_end_tag = false;
  std::vector<std::unique_ptr<HtmlNode>> children;
  HtmlNode *parent = nullptr;

  HtmlNode() = default;
  explicit HtmlNode(HtmlNodeType node_type) : type(node_type) {}

  // Case-insensitive lookup; nullptr when absent.
  const HtmlAttribute *attribute(const std::string &name) const;
  HtmlAttribute *attribute(const std::string &name);
  bool has_attribute(const std::string &name) const {
    return attribute(name) != nullptr;
  }
  // Replaces the value (re-encoding the raw text) or appends the attribute.
  void set_attribute(const std::string &name, const std::string &value);
};

std::unique_ptr<HtmlNode> parse_html_document(const std::string &html);
std::string serialize_html(const HtmlNode &node);

// Elements that never have content or an end tag.
bool is_void_element(const std::string &tag);
// Elements whose content is not markup (script, style, textarea, ...).
bool is_raw_text_element(const std::string &tag);

std::string decode_html_entities(const std::string &text);
std::string encode_attribute_value(const std::string &value, char quote);
// True when `raw` holds a named reference ("&name;") this decoder does not
// know; such a value cannot be re-encoded without changing its meaning.
bool has_unknown_named_entity(const std::string &raw);

// ── Tree helpers ──

std::vector<HtmlNode *> find_elements(HtmlNode &root, const std::string &tag);
HtmlNode *find_first_element(HtmlNode &root, const std::string &tag);

// Returns the document's <head>, creating one (inside <html> when present)
// if the source has none.
HtmlNode *ensure_head(HtmlNode &document);

std::unique_ptr<HtmlNode> make_element(
    const std::string &tag,
    const std::vector<std::pair<std::string, std::string>> &attributes = {});
std::unique_ptr<HtmlNode> make_text(const std::string &text);

HtmlNode *insert_child(HtmlNode &parent, size_t index,
                       std::unique_ptr<HtmlNode> child);

// Concatenated raw text of the direct text children (script/style bodies).
std::string raw_text_content(const HtmlNode &node);
void set_raw_text_content(HtmlNode &node, const std::string &text);
