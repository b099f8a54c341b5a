// EpubXml.h — Общие функции разбора container.xml и OPF (pugixml)
// Внутренний заголовок модуля Epub

#pragma once

#include <pugixml.hpp>

#include <functional>
#include <optional>
#include <string>

namespace Thinkara {
namespace EpubXml {

/// Имя узла без префикса пространства имён ("dc:title" -> "title")
std::string localName(const pugi::xml_node& node);

/// Первый прямой потомок с данным локальным именем
pugi::xml_node child(const pugi::xml_node& parent, const char* name);

/// Первый потомок на любой глубине с данным локальным именем
pugi::xml_node descendant(const pugi::xml_node& root, const char* name);

/// Обойти прямых потомков с данным локальным именем
void forEachChild(const pugi::xml_node& parent, const char* name,
                  const std::function<void(const pugi::xml_node&)>& visit);

/// Путь OPF из container.xml (rootfile/@full-path)
std::optional<std::string> packagePath(const std::string& containerXml);

/// Текст узла со схлопнутыми пробелами, nullopt если пусто
std::optional<std::string> text(const pugi::xml_node& node);

} // namespace EpubXml
} // namespace Thinkara
