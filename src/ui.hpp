#pragma once
#include <string>

/* console reporting (stderr, coloured) */
namespace labelsheet {
namespace ui {
  extern bool quiet;
  void banner();
  void step(const std::string& s);
  void ok(const std::string& s);
  void warn(const std::string& s);
  void fail(const std::string& s);
}
}
