#include "csv_source.hpp"
#include "errors.hpp"
#include "fsutil.hpp"
#include "ui.hpp"

#include <algorithm>
#include <glob.h>
#include <utility>

namespace labelsheet {

static std::string trim(const std::string& s){
  const char* ws=" \t\r\n";
  auto a=s.find_first_not_of(ws); if(a==std::string::npos) return "";
  auto b=s.find_last_not_of(ws); return s.substr(a,b-a+1);
}

std::vector<std::vector<std::string>> parse_csv(const std::string& text){
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row; std::string field;
  bool quoted=false, any=false;
  size_t i=0;
  if(text.compare(0,3,"\xEF\xBB\xBF")==0) i=3;
  for(;i<text.size();++i){
    char c=text[i];
    if(quoted){
      if(c=='"'){
        if(i+1<text.size() && text[i+1]=='"'){ field.push_back('"'); ++i; }
        else quoted=false;
      }else field.push_back(c);
      continue;
    }
    if(c=='"'){ quoted=true; any=true; }
    else if(c==','){ row.push_back(field); field.clear(); any=true; }
    else if(c=='\r'){ /* CRLF */ }
    else if(c=='\n'){
      if(any || !field.empty()){ row.push_back(field); rows.push_back(row); }
      row.clear(); field.clear(); any=false;
    }else{ field.push_back(c); }
  }
  if(any || !field.empty()){ row.push_back(field); rows.push_back(row); }
  return rows;
}

CsvBatch read_barcodes(const std::string& path){
  CsvBatch batch; batch.path=path; batch.source=path_basename(path);
  auto raw=read_file(path);
  auto rows=parse_csv(std::string(raw.begin(),raw.end()));
  if(rows.empty()) return batch;

  const auto& header=rows[0];
  size_t col=header.size();
  for(size_t c=0;c<header.size();++c) if(trim(header[c])=="barcode"){ col=c; break; }
  if(col==header.size()) throw InputResolutionError("No 'barcode' column in: "+path);

  for(size_t r=1;r<rows.size();++r){
    std::string v= col<rows[r].size()? trim(rows[r][col]) : std::string();
    if(v.empty()){ ++batch.skipped; continue; }
    batch.barcodes.push_back(v);
  }
  return batch;
}

static std::vector<std::string> glob_sorted(const std::string& dir,const std::string& pattern){
  std::vector<std::string> out;
  glob_t g{};
  int rc=::glob(join2(dir,pattern).c_str(),0,nullptr,&g);
  if(rc==0){ for(size_t i=0;i<g.gl_pathc;++i) if(is_regular_file(g.gl_pathv[i])) out.push_back(g.gl_pathv[i]); }
  globfree(&g);
  if(rc!=0 && rc!=GLOB_NOMATCH) throw InputResolutionError("Cannot list: "+join2(dir,pattern));
  std::sort(out.begin(),out.end());
  return out;
}

std::vector<std::string> resolve_inputs(const InputSpec& spec){
  std::vector<std::string> files;
  std::string where;
  if(!spec.directory.empty()){
    if(!is_dir(spec.directory)) throw InputResolutionError("Not a directory: "+spec.directory);
    files=glob_sorted(spec.directory,spec.pattern);
    where=join2(spec.directory,spec.pattern);
  }else if(!spec.paths.empty()){
    for(const auto& p: spec.paths){
      if(!is_regular_file(p)) throw InputResolutionError("Cannot open: "+p);
      files.push_back(p);
    }
  }else{
    ensure_dir(spec.default_directory);
    files=glob_sorted(spec.default_directory,"*.csv");
    where=join2(spec.default_directory,"*.csv");
  }
  if(files.empty())
    throw InputResolutionError("No CSV files found in '"+where+"'.\n"
      "  1. Place CSV files in '"+spec.default_directory+"/' and run again\n"
      "  2. Specify files: labelsheet file1.csv file2.csv\n"
      "  3. Specify directory: labelsheet --dir /path/to/csvs/");
  return files;
}

size_t LoadedInput::skipped() const {
  size_t n=0; for(const auto& b: batches) n+=b.skipped; return n;
}

LoadedInput load_records(const std::vector<std::string>& paths){
  LoadedInput in;
  for(const auto& p: paths){
    CsvBatch b=read_barcodes(p);
    ui::step("Processing "+b.source+": "+std::to_string(b.barcodes.size())+" barcodes");
    if(b.skipped) ui::warn(b.source+": skipped "+std::to_string(b.skipped)+" row(s) without a barcode");
    for(const auto& v: b.barcodes) in.records.push_back(LabelRecord{v,b.source});
    in.batches.push_back(std::move(b));
  }
  return in;
}

}
