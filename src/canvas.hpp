#pragma once
#include <string>

#include "code128.hpp"

namespace labelsheet {

enum class Font { Helvetica, HelveticaBold };

/* Drawing sink for the sheet engine. Coordinates are PDF points, origin bottom-left. */
class Canvas {
 public:
  virtual ~Canvas() = default;
  /* bars scaled so the symbol spans exactly `width` */
  virtual void draw_barcode(const Code128Symbol& sym, double x, double y, double width, double height) = 0;
  virtual void draw_centred_text(Font font, double size, double centre_x, double baseline_y, const std::string& text) = 0;
  /* ends the current page; the next drawing call starts a new one */
  virtual void show_page() = 0;
  virtual void save() = 0;
};

}
