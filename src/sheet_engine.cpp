#include "sheet_engine.hpp"
#include "errors.hpp"
#include "helvetica.hpp"

#include <algorithm>

namespace labelsheet {

const char* const HEADER_TEXT="One barcode per Tasso foil pouch. To be scanned via the ARQ app.";
const char* const INSTRUCTION_TEXT="scan in ARQ app after taking blood sample";

static const double SOURCE_SIZE=7;
static const double HEADER_SIDE_MARGIN=inch(0.25);

std::string header_source_line(const std::vector<std::string>& sources, double max_width){
  auto fits=[&](const std::string& l){ return string_width(Font::Helvetica,SOURCE_SIZE,l)<=max_width; };
  const size_t n=sources.size();
  std::string line;
  for(size_t k=n;k>=1;--k){
    line="Source: ";
    for(size_t i=0;i<k;++i){ if(i) line+=", "; line+=sources[i]; }
    if(k<n) line+=" +"+std::to_string(n-k)+" more";
    if(fits(line)) return line;
  }
  if(n==0) return "Source:";

  std::string name=sources[0];
  const std::string more= n>1? " +"+std::to_string(n-1)+" more" : std::string();
  while(!name.empty()){
    // drop one whole UTF-8 sequence
    while(!name.empty() && ((unsigned char)name.back()&0xC0)==0x80) name.pop_back();
    if(!name.empty()) name.pop_back();
    line="Source: "+name+"..."+more;
    if(fits(line)) return line;
  }
  return line;
}

SheetEngine::SheetEngine(const SheetGeometry& geometry, const RenderOptions& options, Canvas& canvas)
  : g_(geometry), opts_(options), canvas_(canvas) {}

PageState SheetEngine::state() const {
  if(!cursor_.page_has_content) return PageState::FreshPage;
  if(cursor_.index>=g_.labels_per_page()) return PageState::Full;
  return PageState::Filling;
}

void SheetEngine::place(const LabelRecord& rec){
  Code128Symbol sym;
  try{
    sym=encode_code128(rec.identifier);
  }catch(const EncodingError& e){
    throw EncodingError(std::string(e.what())+" (source: "+rec.source+")", rec.identifier, rec.source);
  }

  if(state()==PageState::Full) flush_page();

  if(state()==PageState::FreshPage){
    cursor_.page_sources.assign(1,rec.source);
  }else if(rec.source!=cursor_.current_source){
    auto& ps=cursor_.page_sources;
    if(std::find(ps.begin(),ps.end(),rec.source)==ps.end()) ps.push_back(rec.source);
  }
  cursor_.current_source=rec.source;

  draw_label(cell_for_index(cursor_.index,g_),sym);
  ++cursor_.index;
  cursor_.page_has_content=true;
  ++summary_.labels;
}

RunSummary SheetEngine::finish(){
  if(state()!=PageState::FreshPage) flush_page();
  return summary_;
}

void SheetEngine::flush_page(){
  if(opts_.include_header) draw_header();
  canvas_.show_page();
  ++summary_.pages;
  cursor_.index=0;
  cursor_.page_sources.clear();
  cursor_.page_has_content=false;
}

void SheetEngine::draw_header(){
  const double cx=g_.page_width/2;
  canvas_.draw_centred_text(Font::HelveticaBold,8,cx,g_.page_height-inch(0.29),HEADER_TEXT);
  canvas_.draw_centred_text(Font::Helvetica,SOURCE_SIZE,cx,g_.page_height-inch(0.42),
                            header_source_line(cursor_.page_sources,g_.page_width-2*HEADER_SIDE_MARGIN));
}

void SheetEngine::draw_label(const Cell& cell, const Code128Symbol& sym){
  Rect r=barcode_rect(cell,g_);
  canvas_.draw_barcode(sym,r.x,r.y,r.width,r.height);
  const double cx=cell.x+cell.width/2;
  if(opts_.include_id_text)
    canvas_.draw_centred_text(Font::Helvetica,6,cx,r.y-inch(0.08),sym.text);
  if(opts_.include_instruction)
    canvas_.draw_centred_text(Font::Helvetica,5.5,cx,cell.y+inch(0.05),INSTRUCTION_TEXT);
}

RunSummary generate(const std::vector<LabelRecord>& records, const RenderOptions& options,
                    const SheetGeometry& geometry, Canvas& canvas){
  SheetEngine engine(geometry,options,canvas);
  for(const auto& rec: records) engine.place(rec);
  RunSummary s=engine.finish();
  canvas.save();
  return s;
}

}
