#pragma once

/* Sheet geometry for Avery 5160 compatible stock on US Letter.
 *
 * All lengths are PDF points (1/72 in). Coordinates are PDF user space:
 * origin at the bottom-left corner of the page, y grows upward. A cell's
 * (x,y) is its bottom-left corner, so row 0 is the top row of the sheet.
 */
namespace labelsheet {

constexpr double POINTS_PER_INCH = 72.0;
constexpr double inch(double v){ return v*POINTS_PER_INCH; }

struct SheetGeometry {
  double page_width, page_height;
  double top_margin, left_margin;
  double cell_width, cell_height;
  double col_gap, row_gap;
  int rows, cols;
  double side_margin;       // barcode inset on each side of the cell
  double barcode_shift;     // calibration: barcode moved this far left of centre
  double barcode_height;
  double barcode_raise;     // barcode centre sits this far above the cell centre

  int labels_per_page() const { return rows*cols; }
  double barcode_width() const { return cell_width - 2*side_margin; }
};

/* 10 x 3 labels, 2.625in x 1in, 0.125in column gutter */
SheetGeometry avery5160();

struct Cell {
  int row, col;
  double x, y, width, height;
};

struct Rect {
  double x, y, width, height;
};

/* idx must be in [0, labels_per_page) */
Cell cell_for_index(int idx, const SheetGeometry& g);

/* where the barcode goes inside a cell: inset by side_margin, shifted left by barcode_shift */
Rect barcode_rect(const Cell& cell, const SheetGeometry& g);

/* bounding box of all cells of a page */
Rect usable_area(const SheetGeometry& g);

}
