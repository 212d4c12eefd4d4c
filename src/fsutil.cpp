#include "fsutil.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <sys/types.h>

namespace labelsheet {

bool is_dir(const std::string& p){ struct stat st{}; return (stat(p.c_str(),&st)==0)&&S_ISDIR(st.st_mode); }
bool is_regular_file(const std::string& p){ struct stat st{}; return (stat(p.c_str(),&st)==0)&&S_ISREG(st.st_mode); }

void ensure_dir(const std::string& dir){
  if(dir.empty() || dir=="." ) return;
  if(is_dir(dir)) return;
  // mkdir -p; remember the first component that could not be created
  std::string cur, failed; int err=0;
  for(size_t i=0;i<=dir.size();++i){
    if(i==dir.size() || dir[i]=='/'){
      if(!cur.empty() && !is_dir(cur) && ::mkdir(cur.c_str(),0775)!=0){
        int e=errno;
        if(e==EEXIST && !is_dir(cur)) e=ENOTDIR;
        if(e!=EEXIST && err==0){ err=e; failed=cur; }
      }
    }
    if(i<dir.size()) cur.push_back(dir[i]);
  }
  if(!is_dir(dir)){
    std::string why= err? " ("+failed+": "+std::strerror(err)+")" : std::string();
    throw OutputWriteError("Cannot create folder: "+dir+why);
  }
}

std::string path_basename(const std::string& p){
  auto s=p.find_last_of("/"); return (s==std::string::npos)? p : p.substr(s+1);
}
std::string path_dirname(const std::string& p){
  auto s=p.find_last_of("/");
  if(s==std::string::npos) return "";
  return s==0? "/" : p.substr(0,s);
}
std::string path_stem(const std::string& p){
  std::string b=path_basename(p); auto d=b.find_last_of('.');
  return (d==std::string::npos || d==0)? b : b.substr(0,d);
}
std::string join2(const std::string& a,const std::string& b){
  if(a.empty()||a==".") return b;
  if(a.back()=='/') return a+b;
  return a+"/"+b;
}

std::vector<unsigned char> read_file(const std::string& path){
  std::ifstream f(path,std::ios::binary); if(!f) throw InputResolutionError("Cannot open: "+path);
  return std::vector<unsigned char>((std::istreambuf_iterator<char>(f)),std::istreambuf_iterator<char>());
}

bool remove_file(const std::string& path){ return std::remove(path.c_str())==0; }

}
