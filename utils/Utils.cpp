
#include "Utils.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

const std::string Utils::GetVersions()
{
  return std::string(VERSION_MAJOR) + "." + std::string(VERSION_MINOR);
}

const std::string Utils::FloatToStr(float val, size_t precision)
{
  std::ostringstream str;
  str << std::fixed << std::setprecision(precision) << val;
  return str.str();
}
