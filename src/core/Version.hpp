#pragma once

namespace chime {

constexpr const char* VERSION = "0.4.0";
constexpr const char* APP_NAME = "Task Chime";

} // namespace chime
