#include "HtmlDom.h"
#include "thinkara/TextUtils.h"

#include <set>
#include <sstream>
#include <stdexcept>

namespace Thinkara {
namespace Html {

namespace {

const std::set<std::string>& voidTags() {
    static const std::set<std::string> tags = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    return tags;
}

const std::set<std::string>& blockTags() {
    static const std::set<std::string> tags = {
        "address", "article", "aside", "blockquote", "caption", "dd", "details",
        "div", "dl", "dt", "fieldset", "figcaption", "figure", "footer", "form",
        "h1", "h2", "h3", "h4", "h5", "h6", "header", "hr", "li", "main", "nav",
        "ol", "p", "pre", "section", "table", "tbody", "td", "tfoot", "th",
        "thead", "tr", "ul", "body", "html"
    };
    return tags;
}

bool isInvisibleTag(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "noscript" ||
           tag == "template" || tag == "head" || tag == "title";
}

bool isRawTextTag(const std::string& tag) {
    return tag == "script" || tag == "style";
}

const GumboNode* findChildByTag(const GumboNode* parent, GumboTag tag) {
    if (!parent || parent->type != GUMBO_NODE_ELEMENT) {
        return nullptr;
    }
    const GumboVector& kids = parent->v.element.children;
    for (unsigned int i = 0; i < kids.length; ++i) {
        auto* child = static_cast<const GumboNode*>(kids.data[i]);
        if (child->type == GUMBO_NODE_ELEMENT && child->v.element.tag == tag) {
            return child;
        }
    }
    return nullptr;
}

void appendText(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out += node->v.text.text;
            break;

        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            std::string tag = tagName(node);
            if (isInvisibleTag(tag)) {
                return;
            }
            if (tag == "br") {
                out += '\n';
                return;
            }
            bool block = isBlockTag(tag);
            if (block) out += '\n';
            for (const GumboNode* child : children(node)) {
                appendText(child, out);
            }
            if (block) out += '\n';
            break;
        }

        default:
            break;
    }
}

void serializeNode(const GumboNode* node, const SerializeOptions& options,
                   bool rawText, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out += rawText ? std::string(node->v.text.text) : escapeText(node->v.text.text);
            return;

        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE:
            break;

        default:
            return;     // Комментарии и прочее не выводим
    }

    std::string tag = tagName(node);
    NodeAction action = options.classify ? options.classify(node, tag) : NodeAction::Keep;

    if (action == NodeAction::Drop) {
        return;
    }

    if (action == NodeAction::Unwrap) {
        for (const GumboNode* child : children(node)) {
            serializeNode(child, options, false, out);
        }
        return;
    }

    out += '<';
    out += tag;

    const GumboVector& attrs = node->v.element.attributes;
    for (unsigned int i = 0; i < attrs.length; ++i) {
        auto* attr = static_cast<const GumboAttribute*>(attrs.data[i]);
        std::string name = TextUtils::toLower(attr->name);
        std::optional<std::string> value = std::string(attr->value);
        if (options.filterAttribute) {
            value = options.filterAttribute(tag, name, *value);
        }
        if (!value) {
            continue;
        }
        out += ' ';
        out += name;
        out += "=\"";
        out += escapeAttribute(*value);
        out += '"';
    }
    out += '>';

    if (voidTags().count(tag)) {
        return;
    }

    bool childRaw = isRawTextTag(tag);
    for (const GumboNode* child : children(node)) {
        serializeNode(child, options, childRaw, out);
    }

    out += "</";
    out += tag;
    out += '>';
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Document
// ═══════════════════════════════════════════════════════════

Document::Document(const std::string& html)
    : m_source(html)
{
    m_output = gumbo_parse_with_options(&kGumboDefaultOptions, m_source.c_str(), m_source.size());
    if (!m_output || !m_output->root) {
        throw std::runtime_error("HTML parser returned no document");
    }
}

Document::~Document() {
    if (m_output) {
        gumbo_destroy_output(&kGumboDefaultOptions, m_output);
    }
}

const GumboNode* Document::head() const {
    return findChildByTag(m_output->root, GUMBO_TAG_HEAD);
}

const GumboNode* Document::body() const {
    return findChildByTag(m_output->root, GUMBO_TAG_BODY);
}

// ═══════════════════════════════════════════════════════════
// Обход
// ═══════════════════════════════════════════════════════════

bool isElement(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string tagName(const GumboNode* node) {
    if (!isElement(node)) {
        return "";
    }
    const GumboElement& element = node->v.element;
    if (element.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(element.tag);
    }
    // Неизвестный тег: берём имя из исходного текста
    GumboStringPiece piece = element.original_tag;
    gumbo_tag_from_original_text(&piece);
    return TextUtils::toLower(std::string(piece.data, piece.length));
}

std::optional<std::string> attribute(const GumboNode* node, const char* name) {
    if (!isElement(node)) {
        return std::nullopt;
    }
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr) {
        return std::nullopt;
    }
    return std::string(attr->value);
}

std::vector<const GumboNode*> children(const GumboNode* node) {
    std::vector<const GumboNode*> result;
    if (!node) {
        return result;
    }
    const GumboVector* kids = nullptr;
    if (isElement(node)) {
        kids = &node->v.element.children;
    } else if (node->type == GUMBO_NODE_DOCUMENT) {
        kids = &node->v.document.children;
    }
    if (!kids) {
        return result;
    }
    result.reserve(kids->length);
    for (unsigned int i = 0; i < kids->length; ++i) {
        result.push_back(static_cast<const GumboNode*>(kids->data[i]));
    }
    return result;
}

void forEachElement(const GumboNode* node, const std::function<void(const GumboNode*)>& visit) {
    if (!isElement(node)) {
        return;
    }
    visit(node);
    for (const GumboNode* child : children(node)) {
        forEachElement(child, visit);
    }
}

const GumboNode* findFirst(const GumboNode* node,
                           const std::function<bool(const GumboNode*)>& match) {
    if (!isElement(node)) {
        return nullptr;
    }
    if (match(node)) {
        return node;
    }
    for (const GumboNode* child : children(node)) {
        if (const GumboNode* found = findFirst(child, match)) {
            return found;
        }
    }
    return nullptr;
}

bool isBlockTag(const std::string& tag) {
    return blockTags().count(tag) > 0;
}

std::string textContent(const GumboNode* node) {
    if (!node) {
        return "";
    }
    std::string raw;
    appendText(node, raw);

    // Схлопываем пробелы внутри строк, пустые строки убираем
    std::istringstream lines(raw);
    std::string line;
    std::string result;
    while (std::getline(lines, line)) {
        std::string clean = TextUtils::collapseWhitespace(line);
        if (clean.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += clean;
    }
    return result;
}

// ═══════════════════════════════════════════════════════════
// Сериализация
// ═══════════════════════════════════════════════════════════

std::string serialize(const GumboNode* node, const SerializeOptions& options, bool includeSelf) {
    std::string out;
    if (!node) {
        return out;
    }
    if (includeSelf) {
        serializeNode(node, options, false, out);
    } else {
        for (const GumboNode* child : children(node)) {
            serializeNode(child, options, false, out);
        }
    }
    return out;
}

std::string escapeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string escapeAttribute(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

} // namespace Html
} // namespace Thinkara
