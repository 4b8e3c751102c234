#pragma once

#include <string>

namespace Utils
{
const std::string GetVersions();
const std::string FloatToStr(float val, size_t precision = 4);
}
