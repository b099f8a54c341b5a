#pragma once

#include "export.h"
#include <optional>
#include <string>

namespace Thinkara {

/// Операции над URL поверх CURLU
class TK_API Url {
public:
    /// Абсолютный URL со схемой http/https
    static bool isValidHttpUrl(const std::string& url);

    /// Нормализованная форма (схема и хост в нижнем регистре, путь "/" по умолчанию)
    /// @throws ValidationError если URL не абсолютный http/https
    static std::string normalize(const std::string& url);

    /// Хост без порта, nullopt если URL не разбирается
    static std::optional<std::string> hostname(const std::string& url);

    /// Разрешить ссылку относительно базового URL
    /// @return nullopt если ссылку нельзя разрешить
    static std::optional<std::string> resolve(const std::string& base,
                                              const std::string& reference);

    /// Percent-encoding компонента (как encodeURIComponent)
    static std::string encodeComponent(const std::string& value);
};

} // namespace Thinkara
