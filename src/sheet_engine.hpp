#pragma once
#include <string>
#include <vector>

#include "canvas.hpp"
#include "geometry.hpp"
#include "label_record.hpp"

namespace labelsheet {

extern const char* const HEADER_TEXT;
extern const char* const INSTRUCTION_TEXT;

struct RenderOptions {
  bool include_header=true;
  bool include_id_text=true;
  bool include_instruction=true;
};

struct RunSummary {
  unsigned pages=0;
  size_t labels=0;
};

/* FreshPage: nothing placed on the current page. Full: every cell used. */
enum class PageState { FreshPage, Filling, Full };

struct PageCursor {
  int index=0;                              // next free cell on the page
  std::string current_source;               // source of the last placed record
  std::vector<std::string> page_sources;    // header sources, in order of first appearance
  bool page_has_content=false;
};

/* Places records on consecutive cells, row-major, and breaks the page only
 * when every cell is used. A change of source file never breaks a page: the
 * new source is added to that page's header. */
class SheetEngine {
 public:
  SheetEngine(const SheetGeometry& geometry, const RenderOptions& options, Canvas& canvas);

  void place(const LabelRecord& rec);
  /* emits the last page if it holds anything */
  RunSummary finish();

  PageState state() const;
  const PageCursor& cursor() const { return cursor_; }

 private:
  void flush_page();
  void draw_header();
  void draw_label(const Cell& cell, const Code128Symbol& sym);

  const SheetGeometry& g_;
  RenderOptions opts_;
  Canvas& canvas_;
  PageCursor cursor_;
  RunSummary summary_;
};

/* "Source: a.csv, b.csv" fitted to max_width (Helvetica 7pt): trailing names
 * collapse into "+N more", and a single name that is still too wide is cut
 * short with "..." */
std::string header_source_line(const std::vector<std::string>& sources, double max_width);

/* Lays out all records, then saves the canvas. Throws EncodingError naming
 * the identifier and its source; zero records yield a zero-page document. */
RunSummary generate(const std::vector<LabelRecord>& records, const RenderOptions& options,
                    const SheetGeometry& geometry, Canvas& canvas);

}
