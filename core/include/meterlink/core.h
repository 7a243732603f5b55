// core.h — версия библиотеки

#pragma once

namespace MeterLink {

constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace MeterLink
