#pragma once

namespace quickform {

constexpr const char* generator_name = "quickform";
constexpr const char* generator_version = "0.1.0";

} // namespace quickform
