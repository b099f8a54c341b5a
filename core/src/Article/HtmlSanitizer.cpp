#include "thinkara/ArticleExtractor.h"
#include "thinkara/TextUtils.h"
#include "HtmlDom.h"

#include <spdlog/spdlog.h>

#include <cctype>

namespace Thinkara {

namespace {

/// Теги, которые удаляются вместе с содержимым
const std::set<std::string>& forbiddenContentTags() {
    static const std::set<std::string> tags = {
        "script", "style", "noscript", "iframe", "object", "embed", "template",
        "svg", "math", "form", "textarea", "select", "button", "head", "title"
    };
    return tags;
}

const std::set<std::string>& urlAttributes() {
    static const std::set<std::string> attrs = {"href", "src"};
    return attrs;
}

/// Схема URL без учёта пробелов и управляющих символов ("java\tscript:")
std::string normalizedScheme(const std::string& value) {
    std::string compact;
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) {
            continue;
        }
        compact += static_cast<char>(std::tolower(uc));
        if (c == ':' || compact.size() > 32) {
            break;
        }
    }
    return compact;
}

bool isSafeUrl(const std::string& attr, const std::string& value) {
    std::string scheme = normalizedScheme(value);
    if (scheme.rfind("javascript:", 0) == 0 || scheme.rfind("vbscript:", 0) == 0) {
        return false;
    }
    if (scheme.rfind("data:", 0) == 0) {
        // Встроенные изображения допустимы только в src
        std::string lower = TextUtils::toLower(TextUtils::trim(value));
        return attr == "src" && lower.rfind("data:image/", 0) == 0;
    }
    return true;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// HtmlSanitizer
// ═══════════════════════════════════════════════════════════

const std::set<std::string>& HtmlSanitizer::defaultAllowedTags() {
    static const std::set<std::string> tags = {
        "a", "b", "blockquote", "br", "caption", "code", "div", "em",
        "h1", "h2", "h3", "h4", "h5", "h6", "hr", "i", "img", "li", "nl",
        "ol", "p", "pre", "span", "strong", "table", "tbody", "td", "th",
        "thead", "tr", "ul"
    };
    return tags;
}

const std::set<std::string>& HtmlSanitizer::defaultAllowedAttributes() {
    static const std::set<std::string> attrs = {"href", "src", "alt", "title", "class"};
    return attrs;
}

HtmlSanitizer::HtmlSanitizer()
    : m_allowedTags(defaultAllowedTags())
    , m_allowedAttributes(defaultAllowedAttributes())
{}

HtmlSanitizer::HtmlSanitizer(std::set<std::string> allowedTags, std::set<std::string> allowedAttributes)
    : m_allowedTags(std::move(allowedTags))
    , m_allowedAttributes(std::move(allowedAttributes))
{}

std::string HtmlSanitizer::sanitize(const std::string& html) const {
    if (html.empty()) {
        return "";
    }

    Html::Document doc(html);
    const GumboNode* body = doc.body();
    if (!body) {
        return "";
    }

    size_t removed = 0;

    Html::SerializeOptions options;
    options.classify = [this, &removed](const GumboNode*, const std::string& tag) {
        if (forbiddenContentTags().count(tag)) {
            ++removed;
            return Html::NodeAction::Drop;
        }
        if (!m_allowedTags.count(tag)) {
            return Html::NodeAction::Unwrap;
        }
        return Html::NodeAction::Keep;
    };
    options.filterAttribute = [this](const std::string&, const std::string& name,
                                     const std::string& value) -> std::optional<std::string> {
        if (!m_allowedAttributes.count(name)) {
            return std::nullopt;
        }
        if (urlAttributes().count(name) && !isSafeUrl(name, value)) {
            return std::nullopt;
        }
        return value;
    };

    std::string result = Html::serialize(body, options, false);
    if (removed > 0) {
        spdlog::debug("HtmlSanitizer: removed {} forbidden element(s)", removed);
    }
    return result;
}

} // namespace Thinkara
