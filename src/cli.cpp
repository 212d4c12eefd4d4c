#include "cli.hpp"
#include "fsutil.hpp"
#include "geometry.hpp"
#include "pdf_canvas.hpp"
#include "ui.hpp"

#include <exception>
#include <iostream>

namespace labelsheet {

static const char* OUTPUT_DIR="output";

void usage(const char* argv0){
  std::cerr<<"Usage:\n"
           <<"  "<<argv0<<" [-o <out.pdf>] [--no-header] [--no-id] [--no-instruction] [--quiet] [file.csv ...]\n"
           <<"  "<<argv0<<" [-o <out.pdf>] --dir <DIR> [--pattern <glob>] [options]\n"
           <<"With no files and no --dir, every *.csv in input/ is used.\n"
           <<"Default output: output/<name>.pdf for one file, output/tasso_barcodes.pdf for several.\n";
}

std::string default_output(const std::vector<std::string>& files){
  if(files.size()==1) return join2(OUTPUT_DIR,path_stem(files[0])+".pdf");
  return join2(OUTPUT_DIR,"tasso_barcodes.pdf");
}

CliOptions parse_args(const std::vector<std::string>& args){
  CliOptions o;
  auto bad=[&](const std::string& why){ o.action=CliOptions::Action::UsageError; o.error=why; return o; };
  size_t i=0;
  while(i<args.size()){
    const std::string& a=args[i];
    if(a=="-h"||a=="--help"){ o.action=CliOptions::Action::Help; return o; }
    if(a=="-o"||a=="--output"||a=="-d"||a=="--dir"||a=="-p"||a=="--pattern"){
      if(i+1>=args.size()) return bad("Missing value for "+a);
      const std::string& v=args[i+1];
      if(a=="-o"||a=="--output") o.output=v;
      else if(a=="-d"||a=="--dir") o.input.directory=v;
      else o.input.pattern=v;
      i+=2; continue;
    }
    if(a=="--no-header"){ o.render.include_header=false; ++i; continue; }
    if(a=="--no-id"){ o.render.include_id_text=false; ++i; continue; }
    if(a=="--no-instruction"){ o.render.include_instruction=false; ++i; continue; }
    if(a=="--quiet"){ o.quiet=true; ++i; continue; }
    if(a.size()>1 && a[0]=='-') return bad("Unknown option: "+a);
    o.input.paths.push_back(a); ++i;
  }
  return o;
}

int run(const CliOptions& opts){
  try{
    ui::quiet=opts.quiet;
    ui::banner();
    auto files=resolve_inputs(opts.input);
    ui::step("found "+std::to_string(files.size())+" CSV file(s)");
    LoadedInput loaded=load_records(files);

    std::string out_path= opts.output.empty()? default_output(files) : opts.output;
    ensure_dir(path_dirname(out_path));

    const SheetGeometry geometry=avery5160();
    PdfCanvas canvas(out_path,geometry.page_width,geometry.page_height);
    ui::step("writing "+out_path);
    RunSummary s=generate(loaded.records,opts.render,geometry,canvas);

    if(s.labels==0) ui::warn("no barcodes found; wrote an empty document");
    if(loaded.skipped()) ui::warn("skipped "+std::to_string(loaded.skipped())+" row(s) without a barcode in total");
    ui::ok("PDF created: "+out_path);
    if(!ui::quiet){
      std::cerr<<"   labels: "<<s.labels<<"\n"
               <<"   pages in PDF: "<<s.pages<<"\n"
               <<"   sticker sheets needed: "<<s.pages<<"\n"
               <<"   CSV files processed: "<<files.size()<<"\n";
    }
  }catch(const std::exception& e){
    ui::fail(e.what()); return 2;
  }
  return 0;
}

int run_cli(int argc, char** argv){
  std::vector<std::string> args(argv+1,argv+argc);
  CliOptions opts=parse_args(args);
  switch(opts.action){
    case CliOptions::Action::Help: usage(argv[0]); return 0;
    case CliOptions::Action::UsageError: ui::fail(opts.error); usage(argv[0]); return 1;
    case CliOptions::Action::Run: break;
  }
  return run(opts);
}

}
