#include "ui.hpp"

#include <iostream>

namespace labelsheet {
namespace ui {
  static const char* R="\x1b[31m"; static const char* G="\x1b[32m"; static const char* Y="\x1b[33m";
  static const char* B="\x1b[34m"; static const char* C="\x1b[36m"; static const char* N="\x1b[0m";
  bool quiet=false;
  void banner(){ if(quiet) return; std::cerr<<B<<"labelsheet"<<N<<" - barcode sticker sheets (Avery 5160, PDF)\n"; }
  void step(const std::string&s){ if(!quiet) std::cerr<<C<<"» "<<s<<N<<"\n"; }
  void ok(const std::string&s){ if(!quiet) std::cerr<<G<<"✓ "<<s<<N<<"\n"; }
  void warn(const std::string&s){ if(!quiet) std::cerr<<Y<<"! "<<s<<N<<"\n"; }
  void fail(const std::string&s){ std::cerr<<R<<"✗ "<<s<<N<<"\n"; }
}
}
