#pragma once
#include <fstream>
#include <string>
#include <vector>

#include "canvas.hpp"

namespace labelsheet {

/* Multi-page PDF 1.4 writer over the built-in Helvetica faces.
 * The output file is opened on construction and written by save(); a canvas
 * destroyed before save() removes the file. */
class PdfCanvas : public Canvas {
 public:
  PdfCanvas(const std::string& path, double page_width, double page_height);
  ~PdfCanvas() override;
  PdfCanvas(const PdfCanvas&) = delete;
  PdfCanvas& operator=(const PdfCanvas&) = delete;

  void draw_barcode(const Code128Symbol& sym, double x, double y, double width, double height) override;
  void draw_centred_text(Font font, double size, double centre_x, double baseline_y, const std::string& text) override;
  void show_page() override;
  void save() override;

  size_t page_count() const { return pages_.size() + (page_open_ ? 1 : 0); }

 private:
  std::string path_;
  double width_, height_;
  std::ofstream out_;
  std::string content_;
  std::vector<std::string> pages_;
  bool page_open_=false, saved_=false;
};

/* serialises finished page content streams into a complete document */
std::vector<unsigned char> build_pdf(const std::vector<std::string>& pages, double page_width, double page_height);

}
