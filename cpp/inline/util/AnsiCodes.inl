#include "util/AnsiCodes.hpp"

#include "util/Exceptions.hpp"

namespace ansi {

inline const char* color(const std::string& name) {
  if (name == "red") return kRed();
  if (name == "green") return kGreen();
  if (name == "yellow") return kYellow();
  if (name == "blue") return kBlue();
  if (name == "black") return kReset();
  throw util::CleanException("Unknown color \"{}\"", name);
}

}  // namespace ansi
