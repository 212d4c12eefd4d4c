#include "geometry.hpp"

namespace labelsheet {

SheetGeometry avery5160(){
  SheetGeometry g{};
  g.page_width=inch(8.5); g.page_height=inch(11.0);
  g.top_margin=inch(0.5);
  g.left_margin=inch(0.05);
  g.cell_width=inch(2.625); g.cell_height=inch(1.0);
  g.col_gap=inch(2.75)-g.cell_width;
  g.row_gap=0.0;
  g.rows=10; g.cols=3;
  g.side_margin=inch(0.138);   // ~3.5mm
  g.barcode_shift=inch(0.157); // ~4mm
  g.barcode_height=inch(0.4);
  g.barcode_raise=inch(0.05);
  return g;
}

Cell cell_for_index(int idx, const SheetGeometry& g){
  Cell c{};
  c.row=idx/g.cols; c.col=idx%g.cols;
  c.width=g.cell_width; c.height=g.cell_height;
  c.x=g.left_margin + c.col*(g.cell_width+g.col_gap);
  c.y=g.page_height - g.top_margin - c.row*(g.cell_height+g.row_gap) - g.cell_height;
  return c;
}

Rect barcode_rect(const Cell& cell, const SheetGeometry& g){
  Rect r{};
  r.width=g.barcode_width();
  r.height=g.barcode_height;
  r.x=cell.x + (cell.width-r.width)/2 - g.barcode_shift;
  r.y=cell.y + (cell.height-r.height)/2 + g.barcode_raise;
  return r;
}

Rect usable_area(const SheetGeometry& g){
  Rect r{};
  r.width=g.cols*g.cell_width + (g.cols-1)*g.col_gap;
  r.height=g.rows*g.cell_height + (g.rows-1)*g.row_gap;
  r.x=g.left_margin;
  r.y=g.page_height - g.top_margin - r.height;
  return r;
}

}
