#include "EpubXml.h"
#include "thinkara/TextUtils.h"

#include <spdlog/spdlog.h>

namespace Thinkara {
namespace EpubXml {

std::string localName(const pugi::xml_node& node) {
    std::string name = node.name();
    auto colonPos = name.find(':');
    if (colonPos != std::string::npos) {
        name = name.substr(colonPos + 1);
    }
    return name;
}

pugi::xml_node child(const pugi::xml_node& parent, const char* name) {
    for (pugi::xml_node node : parent.children()) {
        if (node.type() == pugi::node_element && localName(node) == name) {
            return node;
        }
    }
    return pugi::xml_node();
}

pugi::xml_node descendant(const pugi::xml_node& root, const char* name) {
    for (pugi::xml_node node : root.children()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        if (localName(node) == name) {
            return node;
        }
        if (pugi::xml_node found = descendant(node, name)) {
            return found;
        }
    }
    return pugi::xml_node();
}

void forEachChild(const pugi::xml_node& parent, const char* name,
                  const std::function<void(const pugi::xml_node&)>& visit) {
    for (pugi::xml_node node : parent.children()) {
        if (node.type() == pugi::node_element && localName(node) == name) {
            visit(node);
        }
    }
}

std::optional<std::string> packagePath(const std::string& containerXml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(containerXml.data(), containerXml.size());
    if (!result) {
        spdlog::warn("EpubXml: failed to parse container.xml: {}", result.description());
        return std::nullopt;
    }

    pugi::xml_node rootfile = descendant(doc, "rootfile");
    if (!rootfile) {
        return std::nullopt;
    }
    std::string path = TextUtils::trim(rootfile.attribute("full-path").as_string());
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
}

std::optional<std::string> text(const pugi::xml_node& node) {
    if (!node) {
        return std::nullopt;
    }
    std::string value = TextUtils::collapseWhitespace(node.child_value());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace EpubXml
} // namespace Thinkara
