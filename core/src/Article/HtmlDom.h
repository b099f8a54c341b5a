// HtmlDom.h — Обёртка над gumbo: разбор, обход, текст и сериализация
// Внутренний заголовок модуля Article

#pragma once

#include <gumbo.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Thinkara {
namespace Html {

/// Дерево gumbo, освобождается в деструкторе
class Document {
public:
    /// @throws std::runtime_error если gumbo не вернул дерево
    explicit Document(const std::string& html);
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const GumboNode* root() const { return m_output->root; }
    const GumboNode* head() const;
    const GumboNode* body() const;

private:
    std::string m_source;   // gumbo ссылается на исходный буфер
    GumboOutput* m_output = nullptr;
};

bool isElement(const GumboNode* node);

/// Имя тега в нижнем регистре ("" для не-элементов)
std::string tagName(const GumboNode* node);

std::optional<std::string> attribute(const GumboNode* node, const char* name);

/// Дочерние узлы (для элементов и template)
std::vector<const GumboNode*> children(const GumboNode* node);

/// Все элементы поддерева в порядке документа (сам узел включительно)
void forEachElement(const GumboNode* node, const std::function<void(const GumboNode*)>& visit);

/// Первый элемент поддерева, удовлетворяющий условию
const GumboNode* findFirst(const GumboNode* node,
                           const std::function<bool(const GumboNode*)>& match);

/// Блочные элементы дают перевод строки на границе
bool isBlockTag(const std::string& tag);

/// Текст поддерева. script/style/noscript/template пропускаются
std::string textContent(const GumboNode* node);

// ═══════════════════════════════════════════════════════════
// Сериализация
// ═══════════════════════════════════════════════════════════

enum class NodeAction {
    Keep,       // Элемент с атрибутами после фильтра
    Unwrap,     // Только дети
    Drop        // Вместе с содержимым
};

struct SerializeOptions {
    /// nullptr = Keep для всех
    std::function<NodeAction(const GumboNode* node, const std::string& tag)> classify;

    /// Значение атрибута после фильтра, nullopt = удалить. nullptr = как есть
    std::function<std::optional<std::string>(const std::string& tag, const std::string& name,
                                             const std::string& value)> filterAttribute;
};

/// Сериализовать узел (includeSelf = false: только детей)
std::string serialize(const GumboNode* node, const SerializeOptions& options,
                      bool includeSelf = true);

std::string escapeText(const std::string& text);
std::string escapeAttribute(const std::string& value);

} // namespace Html
} // namespace Thinkara
