// ─── Mirrorgate — Lossless HTML tree implementation ─────────────────────

#include "html_document.h"
#include "utils.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kVoidElements = {
    "area", "base",  "br",   "col",   "embed",  "hr",    "img",
    "input", "link", "meta", "param", "source", "track", "wbr",
};

const std::unordered_set<std::string> kRawTextElements = {
    "script", "style", "textarea", "title", "xmp",
    "iframe", "noembed", "noframes", "plaintext",
};

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_tag_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

void append_utf8(uint32_t code_point, std::string &out) {
  if (code_point == 0 || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    out += "\xEF\xBF\xBD";  // U+FFFD
    return;
  }
  if (code_point <= 0x7F) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

const std::unordered_map<std::string, uint32_t> &named_entities() {
  static const std::unordered_map<std::string, uint32_t> table = [] {
    std::unordered_map<std::string, uint32_t> out = {
        {"amp", '&'},       {"lt", '<'},         {"gt", '>'},
        {"quot", '"'},      {"apos", '\''},      {"sol", '/'},
        {"colon", ':'},     {"quest", '?'},      {"equals", '='},
        {"num", '#'},       {"percnt", '%'},     {"period", '.'},
        {"lpar", '('},      {"rpar", ')'},       {"comma", ','},
        {"excl", '!'},      {"dollar", '$'},     {"ast", '*'},
        {"plus", '+'},      {"semi", ';'},       {"commat", '@'},
        {"lsqb", '['},      {"rsqb", ']'},       {"lbrack", '['},
        {"rbrack", ']'},    {"lcub", '{'},       {"rcub", '}'},
        {"lbrace", '{'},    {"rbrace", '}'},     {"lowbar", '_'},
        {"grave", '`'},     {"verbar", '|'},     {"vert", '|'},
        {"bsol", '\\'},     {"Hat", '^'},        {"Tab", '\t'},
        {"NewLine", '\n'},  {"OElig", 0x152},    {"oelig", 0x153},
        {"Scaron", 0x160},  {"scaron", 0x161},   {"Yuml", 0x178},
        {"fnof", 0x192},    {"circ", 0x2C6},     {"tilde", 0x2DC},
        {"ensp", 0x2002},   {"emsp", 0x2003},    {"thinsp", 0x2009},
        {"zwnj", 0x200C},   {"zwj", 0x200D},     {"lrm", 0x200E},
        {"rlm", 0x200F},    {"ndash", 0x2013},   {"mdash", 0x2014},
        {"lsquo", 0x2018},  {"rsquo", 0x2019},   {"sbquo", 0x201A},
        {"ldquo", 0x201C},  {"rdquo", 0x201D},   {"bdquo", 0x201E},
        {"dagger", 0x2020}, {"Dagger", 0x2021},  {"bull", 0x2022},
        {"hellip", 0x2026}, {"permil", 0x2030},  {"prime", 0x2032},
        {"Prime", 0x2033},  {"lsaquo", 0x2039},  {"rsaquo", 0x203A},
        {"oline", 0x203E},  {"frasl", 0x2044},   {"euro", 0x20AC},
        {"trade", 0x2122},  {"larr", 0x2190},    {"uarr", 0x2191},
        {"rarr", 0x2192},   {"darr", 0x2193},    {"harr", 0x2194},
        {"minus", 0x2212},  {"infin", 0x221E},   {"ne", 0x2260},
        {"le", 0x2264},     {"ge", 0x2265},      {"loz", 0x25CA},
        {"spades", 0x2660}, {"clubs", 0x2663},   {"hearts", 0x2665},
        {"diams", 0x2666},
    };
    // Latin-1 supplement, U+00A0 to U+00FF in order.
    static const char *const kLatin1[] = {
        "nbsp",   "iexcl",  "cent",   "pound",  "curren", "yen",    "brvbar",
        "sect",   "uml",    "copy",   "ordf",   "laquo",  "not",    "shy",
        "reg",    "macr",   "deg",    "plusmn", "sup2",   "sup3",   "acute",
        "micro",  "para",   "middot", "cedil",  "sup1",   "ordm",   "raquo",
        "frac14", "frac12", "frac34", "iquest", "Agrave", "Aacute", "Acirc",
        "Atilde", "Auml",   "Aring",  "AElig",  "Ccedil", "Egrave", "Eacute",
        "Ecirc",  "Euml",   "Igrave", "Iacute", "Icirc",  "Iuml",   "ETH",
        "Ntilde", "Ograve", "Oacute", "Ocirc",  "Otilde", "Ouml",   "times",
        "Oslash", "Ugrave", "Uacute", "Ucirc",  "Uuml",   "Yacute", "THORN",
        "szlig",  "agrave", "aacute", "acirc",  "atilde", "auml",   "aring",
        "aelig",  "ccedil", "egrave", "eacute", "ecirc",  "euml",   "igrave",
        "iacute", "icirc",  "iuml",   "eth",    "ntilde", "ograve", "oacute",
        "ocirc",  "otilde", "ouml",   "divide", "oslash", "ugrave", "uacute",
        "ucirc",  "uuml",   "yacute", "thorn",  "yuml",
    };
    uint32_t code_point = 0xA0;
    for (const char *name : kLatin1) out[name] = code_point++;
    // Greek letters; U+03A2 is unassigned.
    static const char *const kGreek[] = {
        "Alpha", "Beta",  "Gamma",   "Delta", "Epsilon", "Zeta",    "Eta",
        "Theta", "Iota",  "Kappa",   "Lambda", "Mu",     "Nu",      "Xi",
        "Omicron", "Pi",  "Rho",     "",      "Sigma",   "Tau",     "Upsilon",
        "Phi",   "Chi",   "Psi",     "Omega",
    };
    code_point = 0x391;
    for (const char *name : kGreek) {
      if (*name) {
        out[name] = code_point;
        std::string lower = to_lower(name);
        out[lower] = code_point + 0x20;
      }
      ++code_point;
    }
    out["sigmaf"] = 0x3C2;
    return out;
  }();
  return table;
}

bool decode_named_entity(const std::string &name, std::string &out) {
  const auto &table = named_entities();
  auto it = table.find(name);
  if (it == table.end()) return false;
  append_utf8(it->second, out);
  return true;
}

class TreeBuilder {
public:
  explicit TreeBuilder(const std::string &html) : html_(html) {}

  std::unique_ptr<HtmlNode> build() {
    auto document = std::make_unique<HtmlNode>(HtmlNodeType::Document);
    stack_.push_back(document.get());

    while (pos_ < html_.size()) {
      if (html_[pos_] != '<') {
        parse_text();
      } else if (starts_with("<!--")) {
        parse_comment();
      } else if (starts_with("</")) {
        parse_end_tag();
      } else if (starts_with("<!")) {
        parse_declaration();
      } else if (starts_with("<?")) {
        parse_processing_instruction();
      } else if (pos_ + 1 < html_.size() && is_tag_start(html_[pos_ + 1])) {
        parse_start_tag();
      } else {
        append_text("<");
        ++pos_;
      }
    }
    return document;
  }

private:
  HtmlNode *current() { return stack_.back(); }

  bool starts_with(const char *token) const {
    size_t len = std::char_traits<char>::length(token);
    return html_.compare(pos_, len, token) == 0;
  }

  HtmlNode *append(std::unique_ptr<HtmlNode> node) {
    node->parent = current();
    current()->children.push_back(std::move(node));
    return current()->children.back().get();
  }

  void append_text(const std::string &text) {
    if (text.empty()) return;
    auto &children = current()->children;
    if (!children.empty() && children.back()->type == HtmlNodeType::Text) {
      children.back()->text += text;
      return;
    }
    append(make_text(text));
  }

  void parse_text() {
    size_t next = html_.find('<', pos_);
    if (next == std::string::npos) next = html_.size();
    append_text(html_.substr(pos_, next - pos_));
    pos_ = next;
  }

  // Ends where a browser ends it: "-->" or "--!>", and "<!-->" / "<!--->"
  // are complete empty comments. Irregular forms are kept as Raw so the
  // source bytes survive.
  void parse_comment() {
    size_t start = pos_ + 4;
    if (starts_with("<!-->") || starts_with("<!--->")) {
      size_t stop = html_.find('>', start);
      append_raw(html_.substr(pos_, stop + 1 - pos_));
      pos_ = stop + 1;
      return;
    }
    size_t end = std::string::npos;
    size_t terminator = 0;
    for (size_t dash = html_.find("--", start); dash != std::string::npos;
         dash = html_.find("--", dash + 1)) {
      if (html_.compare(dash, 3, "-->") == 0) {
        end = dash;
        terminator = 3;
        break;
      }
      if (html_.compare(dash, 4, "--!>") == 0) {
        end = dash;
        terminator = 4;
        break;
      }
    }
    if (end == std::string::npos) {
      auto node = std::make_unique<HtmlNode>(HtmlNodeType::Comment);
      node->text = html_.substr(start);
      pos_ = html_.size();
      append(std::move(node));
      return;
    }
    if (terminator == 4) {
      append_raw(html_.substr(pos_, end + terminator - pos_));
    } else {
      auto node = std::make_unique<HtmlNode>(HtmlNodeType::Comment);
      node->text = html_.substr(start, end - start);
      append(std::move(node));
    }
    pos_ = end + terminator;
  }

  void append_raw(const std::string &text) {
    auto node = std::make_unique<HtmlNode>(HtmlNodeType::Raw);
    node->text = text;
    append(std::move(node));
  }

  void parse_declaration() {
    size_t end = html_.find('>', pos_ + 2);
    size_t stop = end == std::string::npos ? html_.size() : end;
    std::string inner = html_.substr(pos_ + 2, stop - pos_ - 2);
    pos_ = end == std::string::npos ? html_.size() : end + 1;
    if (starts_with_ci(inner, "doctype")) {
      auto node = std::make_unique<HtmlNode>(HtmlNodeType::Doctype);
      node->text = inner;
      append(std::move(node));
      return;
    }
    auto node = std::make_unique<HtmlNode>(HtmlNodeType::Raw);
    node->text = "<!" + inner + (end == std::string::npos ? "" : ">");
    append(std::move(node));
  }

  void parse_processing_instruction() {
    size_t end = html_.find('>', pos_);
    size_t stop = end == std::string::npos ? html_.size() : end + 1;
    auto node = std::make_unique<HtmlNode>(HtmlNodeType::Raw);
    node->text = html_.substr(pos_, stop - pos_);
    pos_ = stop;
    append(std::move(node));
  }

  std::string read_name(size_t &pos) const {
    size_t start = pos;
    while (pos < html_.size() && !is_space(html_[pos]) && html_[pos] != '>' &&
           html_[pos] != '/')
      ++pos;
    return html_.substr(start, pos - start);
  }

  void parse_end_tag() {
    size_t start = pos_;
    size_t pos = pos_ + 2;
    std::string name = read_name(pos);
    size_t end = html_.find('>', pos);
    pos_ = end == std::string::npos ? html_.size() : end + 1;

    std::string tag = to_lower(name);
    for (size_t i = stack_.size(); i > 1; --i) {
      if (stack_[i - 1]->tag_name == tag) {
        stack_[i - 1]->has_end_tag = true;
        stack_.resize(i - 1);
        return;
      }
    }
    // No matching open element: keep the markup as written.
    auto node = std::make_unique<HtmlNode>(HtmlNodeType::Raw);
    node->text = html_.substr(start, pos_ - start);
    append(std::move(node));
  }

  void parse_start_tag() {
    size_t pos = pos_ + 1;
    auto element = std::make_unique<HtmlNode>(HtmlNodeType::Element);
    element->source_tag = read_name(pos);
    element->tag_name = to_lower(element->source_tag);

    while (pos < html_.size()) {
      while (pos < html_.size() && is_space(html_[pos])) ++pos;
      if (pos >= html_.size()) break;
      if (html_[pos] == '>') {
        ++pos;
        break;
      }
      if (html_[pos] == '/') {
        if (pos + 1 < html_.size() && html_[pos + 1] == '>') {
          element->self_closing = true;
          pos += 2;
          break;
        }
        ++pos;
        continue;
      }

      HtmlAttribute attr;
      size_t name_start = pos;
      // A leading '=' is part of the name per the tokenizer rules.
      if (html_[pos] == '=') ++pos;
      while (pos < html_.size() && !is_space(html_[pos]) && html_[pos] != '=' &&
             html_[pos] != '>' && html_[pos] != '/')
        ++pos;
      attr.name = html_.substr(name_start, pos - name_start);

      size_t after_name = pos;
      while (pos < html_.size() && is_space(html_[pos])) ++pos;
      if (pos < html_.size() && html_[pos] == '=') {
        ++pos;
        while (pos < html_.size() && is_space(html_[pos])) ++pos;
        if (pos < html_.size() && (html_[pos] == '"' || html_[pos] == '\'')) {
          attr.quote = html_[pos++];
          size_t close = html_.find(attr.quote, pos);
          if (close == std::string::npos) close = html_.size();
          attr.raw_value = html_.substr(pos, close - pos);
          pos = close < html_.size() ? close + 1 : close;
        } else {
          attr.quote = 0;
          size_t value_start = pos;
          while (pos < html_.size() && !is_space(html_[pos]) &&
                 html_[pos] != '>')
            ++pos;
          attr.raw_value = html_.substr(value_start, pos - value_start);
        }
        attr.value = decode_html_entities(attr.raw_value);
      } else {
        attr.has_value = false;
        pos = after_name;
      }
      if (!element->attribute(attr.name)) {
        element->attributes.push_back(std::move(attr));
      }
    }
    pos_ = pos;

    std::string tag = element->tag_name;
    HtmlNode *node = append(std::move(element));
    if (is_void_element(tag)) return;

    if (is_raw_text_element(tag)) {
      consume_raw_text(node);
      return;
    }
    if (!node->self_closing) stack_.push_back(node);
  }

  // Content runs up to the matching end tag; nothing inside is markup.
  void consume_raw_text(HtmlNode *node) {
    std::string needle = "</" + node->tag_name;
    size_t end = std::string::npos;
    if (node->tag_name != "plaintext") {
      size_t candidate = html_.find("</", pos_);
      while (candidate != std::string::npos) {
        size_t after = candidate + needle.size();
        if (starts_with_ci(html_.substr(candidate, needle.size()), needle) &&
            (after >= html_.size() || is_space(html_[after]) ||
             html_[after] == '>' || html_[after] == '/')) {
          end = candidate;
          break;
        }
        candidate = html_.find("</", candidate + 2);
      }
    }

    size_t content_end = end == std::string::npos ? html_.size() : end;
    if (content_end > pos_) {
      auto text = make_text(html_.substr(pos_, content_end - pos_));
      text->parent = node;
      node->children.push_back(std::move(text));
    }
    if (end == std::string::npos) {
      pos_ = html_.size();
      return;
    }
    size_t close = html_.find('>', end);
    pos_ = close == std::string::npos ? html_.size() : close + 1;
    node->has_end_tag = true;
  }

  const std::string &html_;
  size_t pos_ = 0;
  std::vector<HtmlNode *> stack_;
};

void serialize_into(const HtmlNode &node, std::string &out) {
  switch (node.type) {
    case HtmlNodeType::Document:
      break;
    case HtmlNodeType::Doctype:
      out += "<!" + node.text + ">";
      return;
    case HtmlNodeType::Comment:
      out += "<!--" + node.text + "-->";
      return;
    case HtmlNodeType::Text:
    case HtmlNodeType::Raw:
      out += node.text;
      return;
    case HtmlNodeType::Element: {
      out += '<';
      out += node.source_tag.empty() ? node.tag_name : node.source_tag;
      for (const auto &attr : node.attributes) {
        out += ' ';
        out += attr.name;
        if (!attr.has_value) continue;
        out += '=';
        if (attr.quote) out += attr.quote;
        out += attr.raw_value;
        if (attr.quote) out += attr.quote;
      }
      out += node.self_closing ? "/>" : ">";
      break;
    }
  }

  for (const auto &child : node.children) serialize_into(*child, out);

  if (node.type == HtmlNodeType::Element && node.has_end_tag) {
    out += "</";
    out += node.source_tag.empty() ? node.tag_name : node.source_tag;
    out += '>';
  }
}

void collect_elements(HtmlNode &node, const std::string &tag,
                      std::vector<HtmlNode *> &out) {
  if (node.type == HtmlNodeType::Element && (tag.empty() || node.tag_name == tag))
    out.push_back(&node);
  for (auto &child : node.children) collect_elements(*child, tag, out);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
// HtmlNode
// ═══════════════════════════════════════════════════════════════════════

const HtmlAttribute *HtmlNode::attribute(const std::string &name) const {
  for (const auto &attr : attributes) {
    if (attr.name.size() == name.size() && starts_with_ci(attr.name, name))
      return &attr;
  }
  return nullptr;
}

HtmlAttribute *HtmlNode::attribute(const std::string &name) {
  return const_cast<HtmlAttribute *>(
      static_cast<const HtmlNode *>(this)->attribute(name));
}

void HtmlNode::set_attribute(const std::string &name, const std::string &value) {
  HtmlAttribute *attr = attribute(name);
  if (!attr) {
    attributes.push_back(HtmlAttribute{});
    attr = &attributes.back();
    attr->name = name;
  }
  if (attr->quote == 0) attr->quote = '"';
  attr->has_value = true;
  attr->value = value;
  attr->raw_value = encode_attribute_value(value, attr->quote);
}

// ═══════════════════════════════════════════════════════════════════════
// Parsing and serialization
// ═══════════════════════════════════════════════════════════════════════

bool is_void_element(const std::string &tag) {
  return kVoidElements.count(tag) != 0;
}

bool is_raw_text_element(const std::string &tag) {
  return kRawTextElements.count(tag) != 0;
}

std::unique_ptr<HtmlNode> parse_html_document(const std::string &html) {
  return TreeBuilder(html).build();
}

std::string serialize_html(const HtmlNode &node) {
  std::string out;
  serialize_into(node, out);
  return out;
}

std::string decode_html_entities(const std::string &text) {
  if (text.find('&') == std::string::npos) return text;

  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '&') {
      out.push_back(text[pos++]);
      continue;
    }
    size_t semicolon = text.find(';', pos + 1);
    if (semicolon == std::string::npos || semicolon - pos > 32) {
      out.push_back(text[pos++]);
      continue;
    }
    std::string body = text.substr(pos + 1, semicolon - pos - 1);
    bool decoded = false;
    if (body.size() > 1 && body[0] == '#') {
      bool hex = body[1] == 'x' || body[1] == 'X';
      std::string digits = body.substr(hex ? 2 : 1);
      const char *allowed = hex ? "0123456789abcdefABCDEF" : "0123456789";
      if (!digits.empty() && digits.size() <= 8 &&
          digits.find_first_not_of(allowed) == std::string::npos) {
        append_utf8(static_cast<uint32_t>(
                        std::stoul(digits, nullptr, hex ? 16 : 10)),
                    out);
        decoded = true;
      }
    } else {
      decoded = decode_named_entity(body, out);
    }
    if (decoded) {
      pos = semicolon + 1;
    } else {
      out.push_back(text[pos++]);
    }
  }
  return out;
}

std::string encode_attribute_value(const std::string &value, char quote) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    if (ch == '&') out += "&amp;";
    else if (ch == '"' && quote != '\'') out += "&quot;";
    else if (ch == '\'' && quote == '\'') out += "&#39;";
    else out += ch;
  }
  return out;
}

bool has_unknown_named_entity(const std::string &raw) {
  for (size_t amp = raw.find('&'); amp != std::string::npos;
       amp = raw.find('&', amp + 1)) {
    size_t end = amp + 1;
    while (end < raw.size() &&
           std::isalnum(static_cast<unsigned char>(raw[end])))
      ++end;
    if (end == amp + 1 || end >= raw.size() || raw[end] != ';') continue;
    if (!std::isalpha(static_cast<unsigned char>(raw[amp + 1]))) continue;
    if (!named_entities().count(raw.substr(amp + 1, end - amp - 1))) return true;
  }
  return false;
}

// ═══════════════════════════════════════════════════════════════════════
// Tree helpers
// ═══════════════════════════════════════════════════════════════════════

std::vector<HtmlNode *> find_elements(HtmlNode &root, const std::string &tag) {
  std::vector<HtmlNode *> out;
  collect_elements(root, tag, out);
  return out;
}

HtmlNode *find_first_element(HtmlNode &root, const std::string &tag) {
  if (root.type == HtmlNodeType::Element && root.tag_name == tag) return &root;
  for (auto &child : root.children) {
    if (HtmlNode *found = find_first_element(*child, tag)) return found;
  }
  return nullptr;
}

HtmlNode *ensure_head(HtmlNode &document) {
  if (HtmlNode *head = find_first_element(document, "head")) return head;

  auto head = make_element("head");
  head->has_end_tag = true;
  if (HtmlNode *html = find_first_element(document, "html")) {
    return insert_child(*html, 0, std::move(head));
  }
  // No <html> either: place it before the first real content.
  size_t index = 0;
  while (index < document.children.size()) {
    const HtmlNode &child = *document.children[index];
    bool skippable = child.type == HtmlNodeType::Doctype ||
                     child.type == HtmlNodeType::Comment ||
                     (child.type == HtmlNodeType::Text &&
                      trim_copy(child.text).empty());
    if (!skippable) break;
    ++index;
  }
  return insert_child(document, index, std::move(head));
}

std::unique_ptr<HtmlNode> make_element(
    const std::string &tag,
    const std::vector<std::pair<std::string, std::string>> &attributes) {
  auto node = std::make_unique<HtmlNode>(HtmlNodeType::Element);
  node->tag_name = to_lower(tag);
  node->source_tag = tag;
  node->has_end_tag = !is_void_element(node->tag_name);
  for (const auto &attr : attributes) node->set_attribute(attr.first, attr.second);
  return node;
}

std::unique_ptr<HtmlNode> make_text(const std::string &text) {
  auto node = std::make_unique<HtmlNode>(HtmlNodeType::Text);
  node->text = text;
  return node;
}

HtmlNode *insert_child(HtmlNode &parent, size_t index,
                       std::unique_ptr<HtmlNode> child) {
  child->parent = &parent;
  if (index > parent.children.size()) index = parent.children.size();
  auto it = parent.children.insert(parent.children.begin() +
                                       static_cast<std::ptrdiff_t>(index),
                                   std::move(child));
  return it->get();
}

std::string raw_text_content(const HtmlNode &node) {
  std::string out;
  for (const auto &child : node.children) {
    if (child->type == HtmlNodeType::Text) out += child->text;
  }
  return out;
}

void set_raw_text_content(HtmlNode &node, const std::string &text) {
  node.children.clear();
  if (text.empty()) return;
  auto child = make_text(text);
  child->parent = &node;
  node.children.push_back(std::move(child));
}
