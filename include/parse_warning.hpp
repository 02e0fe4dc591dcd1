#pragma once

#include <string>

// Content the engine dropped without failing the parse.
struct ParseWarning {
  int slideIndex;
  std::string message;
};
