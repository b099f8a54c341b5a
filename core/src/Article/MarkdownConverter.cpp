#include "thinkara/ArticleExtractor.h"
#include "thinkara/TextUtils.h"

#include <html2md.h>

namespace Thinkara {

std::string MarkdownConverter::toMarkdown(const std::string& html) {
    if (html.empty()) {
        return "";
    }
    return TextUtils::trim(html2md::Convert(html));
}

} // namespace Thinkara
