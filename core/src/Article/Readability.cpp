#include "thinkara/ArticleExtractor.h"
#include "thinkara/TextUtils.h"
#include "thinkara/Url.h"
#include "HtmlDom.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <map>
#include <regex>
#include <set>
#include <unordered_map>

namespace Thinkara {

namespace {

// ═══════════════════════════════════════════════════════════
// Эвристики по class/id
// ═══════════════════════════════════════════════════════════

const std::regex& unlikelyPattern() {
    static const std::regex re(
        "banner|breadcrumbs|combx|comment|community|cover-wrap|disqus|extra|footer|gdpr|"
        "legends|menu|related|remark|replies|rss|shoutbox|sidebar|skyscraper|social|sponsor|"
        "supplemental|ad-break|agegate|pagination|pager|popup|cookie",
        std::regex::icase);
    return re;
}

const std::regex& maybeCandidatePattern() {
    static const std::regex re("and|article|body|column|content|main|shadow", std::regex::icase);
    return re;
}

const std::regex& positivePattern() {
    static const std::regex re(
        "article|body|content|entry|hentry|h-entry|main|page|post|text|blog|story",
        std::regex::icase);
    return re;
}

const std::regex& negativePattern() {
    static const std::regex re(
        "-ad-|hidden|banner|combx|comment|com-|contact|foot|footer|footnote|gdpr|masthead|"
        "media|meta|outbrain|promo|related|scroll|share|shoutbox|sidebar|skyscraper|sponsor|"
        "shopping|tags|tool|widget",
        std::regex::icase);
    return re;
}

const std::regex& bylinePattern() {
    static const std::regex re("byline|author|dateline|writtenby|p-author", std::regex::icase);
    return re;
}

/// Поддеревья, которые не участвуют в оценке
const std::set<std::string>& skippedTags() {
    static const std::set<std::string> tags = {
        "nav", "header", "footer", "aside", "script", "style", "noscript",
        "form", "iframe", "template", "svg", "button", "select", "textarea"
    };
    return tags;
}

/// Элементы, выбрасываемые из итогового содержимого
const std::set<std::string>& droppedContentTags() {
    static const std::set<std::string> tags = {
        "script", "style", "noscript", "template", "iframe", "form", "button",
        "input", "select", "textarea", "nav", "aside", "footer", "svg",
        "object", "embed", "link", "meta"
    };
    return tags;
}

const std::set<std::string>& paragraphTags() {
    static const std::set<std::string> tags = {"p", "pre", "td"};
    return tags;
}

std::string classAndId(const GumboNode* node) {
    return Html::attribute(node, "class").value_or("") + " " + Html::attribute(node, "id").value_or("");
}

bool isUnlikelyCandidate(const GumboNode* node, const std::string& tag) {
    if (tag == "body" || tag == "article" || tag == "main" || tag == "a") {
        return false;
    }
    std::string match = classAndId(node);
    if (match.size() <= 1) {
        return false;
    }
    return std::regex_search(match, unlikelyPattern()) &&
           !std::regex_search(match, maybeCandidatePattern());
}

double classWeight(const GumboNode* node) {
    double weight = 0.0;
    for (const char* name : {"class", "id"}) {
        auto value = Html::attribute(node, name);
        if (!value || value->empty()) {
            continue;
        }
        if (std::regex_search(*value, negativePattern())) weight -= 25.0;
        if (std::regex_search(*value, positivePattern())) weight += 25.0;
    }
    return weight;
}

double baseScore(const GumboNode* node) {
    std::string tag = Html::tagName(node);
    double score = 0.0;
    if (tag == "div") {
        score = 5.0;
    } else if (tag == "pre" || tag == "td" || tag == "blockquote") {
        score = 3.0;
    } else if (tag == "address" || tag == "ol" || tag == "ul" || tag == "dl" ||
               tag == "dd" || tag == "dt" || tag == "li" || tag == "form") {
        score = -3.0;
    } else if (tag == "h1" || tag == "h2" || tag == "h3" || tag == "h4" ||
               tag == "h5" || tag == "h6" || tag == "th") {
        score = -5.0;
    }
    return score + classWeight(node);
}

size_t visibleLength(const GumboNode* node) {
    return TextUtils::collapseWhitespace(Html::textContent(node)).size();
}

double linkDensity(const GumboNode* node) {
    size_t total = visibleLength(node);
    if (total == 0) {
        return 0.0;
    }
    size_t linkChars = 0;
    Html::forEachElement(node, [&](const GumboNode* el) {
        if (el != node && Html::tagName(el) == "a") {
            linkChars += visibleLength(el);
        }
    });
    return std::min(1.0, static_cast<double>(linkChars) / static_cast<double>(total));
}

void collectParagraphs(const GumboNode* node, std::vector<const GumboNode*>& out) {
    if (!Html::isElement(node)) {
        return;
    }
    std::string tag = Html::tagName(node);
    if (skippedTags().count(tag) || isUnlikelyCandidate(node, tag)) {
        return;
    }
    if (paragraphTags().count(tag)) {
        out.push_back(node);
    }
    for (const GumboNode* child : Html::children(node)) {
        collectParagraphs(child, out);
    }
}

// ═══════════════════════════════════════════════════════════
// Метаданные
// ═══════════════════════════════════════════════════════════

using MetaMap = std::map<std::string, std::string>;

MetaMap collectMeta(const GumboNode* root) {
    MetaMap meta;
    Html::forEachElement(root, [&](const GumboNode* node) {
        if (Html::tagName(node) != "meta") {
            return;
        }
        auto content = Html::attribute(node, "content");
        if (!content) {
            return;
        }
        std::string value = TextUtils::trim(*content);
        if (value.empty()) {
            return;
        }
        for (const char* keyAttr : {"property", "name", "itemprop"}) {
            auto key = Html::attribute(node, keyAttr);
            if (key && !key->empty()) {
                meta.emplace(TextUtils::toLower(TextUtils::trim(*key)), value);
            }
        }
    });
    return meta;
}

std::optional<std::string> pickMeta(const MetaMap& meta, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = meta.find(key);
        if (it != meta.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

/// "Заголовок статьи | Сайт" -> "Заголовок статьи", если остаётся хотя бы 3 слова
std::string trimSiteSuffix(const std::string& title) {
    static const char* separators[] = {
        " | ", " - ", " :: ", " / ", " \xC2\xBB ", " \xE2\x80\x93 ", " \xE2\x80\x94 "
    };

    size_t best = std::string::npos;
    for (const char* sep : separators) {
        size_t pos = title.rfind(sep);
        if (pos != std::string::npos && (best == std::string::npos || pos > best)) {
            best = pos;
        }
    }
    if (best == std::string::npos) {
        return title;
    }

    std::string head = TextUtils::trim(title.substr(0, best));
    return TextUtils::countWords(head) >= 3 ? head : title;
}

std::string extractTitle(const Html::Document& doc, const MetaMap& meta) {
    if (auto og = pickMeta(meta, {"og:title", "twitter:title", "dc:title"})) {
        return TextUtils::collapseWhitespace(*og);
    }

    const GumboNode* titleNode = Html::findFirst(doc.root(), [](const GumboNode* n) {
        return Html::tagName(n) == "title";
    });
    if (titleNode) {
        // textContent пропускает <title>, читаем детей напрямую
        std::string text;
        for (const GumboNode* child : Html::children(titleNode)) {
            if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
                text += child->v.text.text;
            }
        }
        text = TextUtils::collapseWhitespace(text);
        if (!text.empty()) {
            return trimSiteSuffix(text);
        }
    }

    const GumboNode* h1 = Html::findFirst(doc.body(), [](const GumboNode* n) {
        return Html::tagName(n) == "h1";
    });
    return h1 ? TextUtils::collapseWhitespace(Html::textContent(h1)) : "";
}

std::optional<std::string> extractByline(const Html::Document& doc, const MetaMap& meta) {
    auto fromMeta = pickMeta(meta, {"author", "article:author", "dc:creator", "parsely-author"});
    if (fromMeta && fromMeta->rfind("http", 0) != 0) {
        return fromMeta;
    }

    const GumboNode* found = Html::findFirst(doc.body(), [](const GumboNode* n) {
        if (Html::attribute(n, "rel").value_or("") == "author") {
            return true;
        }
        std::string match = classAndId(n);
        if (match.size() <= 1 || !std::regex_search(match, bylinePattern())) {
            return false;
        }
        size_t len = visibleLength(n);
        return len > 0 && len < 100;
    });
    if (!found) {
        return std::nullopt;
    }
    std::string text = TextUtils::collapseWhitespace(Html::textContent(found));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<std::string> extractPublishedTime(const Html::Document& doc, const MetaMap& meta) {
    if (auto value = pickMeta(meta, {"article:published_time", "parsely-pub-date",
                                     "datepublished", "dc:date", "date"})) {
        return value;
    }
    const GumboNode* time = Html::findFirst(doc.body(), [](const GumboNode* n) {
        return Html::tagName(n) == "time" && Html::attribute(n, "datetime").has_value();
    });
    if (time) {
        std::string value = TextUtils::trim(*Html::attribute(time, "datetime"));
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// Выбор узла
// ═══════════════════════════════════════════════════════════

struct Candidate {
    const GumboNode* node = nullptr;
    double score = 0.0;
};

const GumboNode* fallbackContainer(const GumboNode* body) {
    for (const char* tag : {"article", "main"}) {
        const GumboNode* node = Html::findFirst(body, [tag](const GumboNode* n) {
            return Html::tagName(n) == tag;
        });
        if (node) {
            return node;
        }
    }
    const GumboNode* roleMain = Html::findFirst(body, [](const GumboNode* n) {
        return Html::attribute(n, "role").value_or("") == "main";
    });
    return roleMain ? roleMain : body;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Readability
// ═══════════════════════════════════════════════════════════

Readability::Readability(size_t minParagraphChars)
    : m_minParagraphChars(minParagraphChars)
{}

std::optional<ReadabilityArticle> Readability::parse(const std::string& html,
                                                     const std::string& documentUrl) const {
    Html::Document doc(html);
    const GumboNode* body = doc.body();
    if (!body) {
        return std::nullopt;
    }

    // Очки абзацев родителю и деду
    std::vector<const GumboNode*> paragraphs;
    collectParagraphs(body, paragraphs);

    std::vector<Candidate> candidates;
    std::unordered_map<const GumboNode*, size_t> index;
    auto candidateFor = [&](const GumboNode* node) -> Candidate& {
        auto it = index.find(node);
        if (it == index.end()) {
            it = index.emplace(node, candidates.size()).first;
            candidates.push_back({node, baseScore(node)});
        }
        return candidates[it->second];
    };

    for (const GumboNode* p : paragraphs) {
        std::string text = TextUtils::collapseWhitespace(Html::textContent(p));
        if (text.size() < m_minParagraphChars) {
            continue;
        }
        const GumboNode* parent = p->parent;
        if (!Html::isElement(parent) || Html::tagName(parent) == "html") {
            continue;
        }

        double score = 1.0;
        score += static_cast<double>(std::count(text.begin(), text.end(), ','));
        score += std::min<double>(static_cast<double>(text.size() / 100), 3.0);

        candidateFor(parent).score += score;
        const GumboNode* grand = parent->parent;
        if (Html::isElement(grand) && Html::tagName(grand) != "html") {
            candidateFor(grand).score += score / 2.0;
        }
    }

    const GumboNode* top = nullptr;
    double topScore = 0.0;
    std::unordered_map<const GumboNode*, double> finalScores;
    for (const auto& c : candidates) {
        double adjusted = c.score * (1.0 - linkDensity(c.node));
        finalScores[c.node] = adjusted;
        if (adjusted > topScore) {
            topScore = adjusted;
            top = c.node;
        }
    }

    std::vector<const GumboNode*> selected;
    if (top) {
        const GumboNode* parent = top->parent;
        if (Html::isElement(parent) && Html::tagName(parent) != "html") {
            // Соседи лучшего узла с достаточным весом идут в статью
            double threshold = std::max(10.0, topScore * 0.2);
            for (const GumboNode* sibling : Html::children(parent)) {
                if (!Html::isElement(sibling)) {
                    continue;
                }
                if (sibling == top) {
                    selected.push_back(sibling);
                    continue;
                }
                auto it = finalScores.find(sibling);
                if (it != finalScores.end() && it->second >= threshold) {
                    selected.push_back(sibling);
                    continue;
                }
                if (Html::tagName(sibling) == "p" && visibleLength(sibling) > 80 &&
                    linkDensity(sibling) < 0.25) {
                    selected.push_back(sibling);
                }
            }
        } else {
            selected.push_back(top);
        }
        spdlog::debug("Readability: top candidate <{}> score {:.1f}", Html::tagName(top), topScore);
    } else {
        selected.push_back(fallbackContainer(body));
        spdlog::debug("Readability: no scored candidate, using <{}>", Html::tagName(selected.front()));
    }

    Html::SerializeOptions options;
    options.classify = [](const GumboNode* node, const std::string& tag) {
        if (droppedContentTags().count(tag) || isUnlikelyCandidate(node, tag)) {
            return Html::NodeAction::Drop;
        }
        return Html::NodeAction::Keep;
    };
    options.filterAttribute = [&documentUrl](const std::string&, const std::string& name,
                                             const std::string& value) -> std::optional<std::string> {
        if (name == "href" || name == "src") {
            return Url::resolve(documentUrl, value).value_or(value);
        }
        return value;
    };

    std::string content = "<div>";
    for (const GumboNode* node : selected) {
        content += Html::serialize(node, options, Html::tagName(node) != "body");
    }
    content += "</div>";

    Html::Document contentDoc(content);
    std::string text = Html::textContent(contentDoc.body());
    if (text.empty()) {
        return std::nullopt;
    }

    MetaMap meta = collectMeta(doc.root());

    ReadabilityArticle article;
    article.title = extractTitle(doc, meta);
    article.content = std::move(content);
    article.textContent = std::move(text);
    article.byline = extractByline(doc, meta);
    article.excerpt = pickMeta(meta, {"description", "og:description", "twitter:description"});
    article.siteName = pickMeta(meta, {"og:site_name"});
    article.publishedTime = extractPublishedTime(doc, meta);

    if (auto lang = Html::attribute(doc.root(), "lang")) {
        std::string value = TextUtils::trim(*lang);
        if (!value.empty()) {
            article.language = value;
        }
    }

    return article;
}

} // namespace Thinkara
