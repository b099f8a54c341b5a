// core.h — версия библиотеки

#pragma once

namespace Thinkara {

constexpr const char* VERSION = "0.1.0";

} // namespace Thinkara
