#include "helvetica.hpp"

namespace labelsheet {

// AFM widths for 32..126, 1/1000 em
static const short HELVETICA[95]={
  278,278,355,556,556,889,667,191,333,333,389,584,278,333,278,278,
  556,556,556,556,556,556,556,556,556,556,278,278,584,584,584,556,
  1015,667,667,722,722,667,611,778,722,278,500,667,556,833,722,778,
  667,778,722,667,611,722,667,944,667,667,611,278,278,278,469,556,
  333,556,556,500,556,556,278,556,556,222,222,500,222,833,556,556,
  556,556,333,500,278,556,500,722,500,500,500,334,260,334,584
};
static const short HELVETICA_BOLD[95]={
  278,333,474,556,556,889,722,238,333,333,389,584,278,333,278,278,
  556,556,556,556,556,556,556,556,556,556,333,333,584,584,584,611,
  975,722,722,722,722,667,611,778,722,278,556,722,611,833,722,778,
  667,778,722,667,611,722,667,944,667,667,611,333,278,333,584,556,
  333,556,611,556,611,556,333,611,611,278,278,556,278,889,611,611,
  611,611,389,556,333,611,556,778,556,556,500,389,280,389,584
};
// 160..255
static const short HELVETICA_LATIN1[96]={
  278,333,556,556,556,556,260,556,333,737,370,556,584,333,737,333,
  400,584,333,333,333,556,537,278,333,333,365,556,834,834,834,611,
  667,667,667,667,667,667,1000,722,667,667,667,667,278,278,278,278,
  722,722,778,778,778,778,778,584,778,722,722,722,722,667,667,611,
  556,556,556,556,556,556,889,500,556,556,556,556,278,278,278,278,
  556,556,556,556,556,556,556,584,611,556,556,556,556,500,556,500
};
static const short HELVETICA_BOLD_LATIN1[96]={
  278,333,556,556,556,556,280,556,333,737,370,556,584,333,737,333,
  400,584,333,333,333,611,556,278,333,333,365,556,834,834,834,611,
  722,722,722,722,722,722,1000,722,667,667,667,667,278,278,278,278,
  722,722,778,778,778,778,778,584,778,722,722,722,722,667,667,611,
  556,556,556,556,556,556,889,556,556,556,556,556,278,278,278,278,
  611,611,611,611,611,611,611,584,611,611,611,611,611,556,611,556
};

std::string to_winansi(const std::string& utf8){
  std::string out;
  const size_t n=utf8.size();
  for(size_t i=0;i<n;){
    unsigned char c=(unsigned char)utf8[i];
    if(c<0x80){ out.push_back(c>=32 && c<127? (char)c : '?'); ++i; continue; }
    size_t len= (c&0xE0)==0xC0? 2 : (c&0xF0)==0xE0? 3 : (c&0xF8)==0xF0? 4 : 0;
    if(len==0 || i+len>n){ out.push_back('?'); ++i; continue; }
    unsigned long cp= len==2? (c&0x1F) : len==3? (c&0x0F) : (c&0x07);
    bool ok=true;
    for(size_t k=1;k<len;++k){
      unsigned char cc=(unsigned char)utf8[i+k];
      if((cc&0xC0)!=0x80){ ok=false; break; }
      cp=(cp<<6)|(cc&0x3F);
    }
    if(!ok){ out.push_back('?'); ++i; continue; }
    out.push_back(cp>=0xA0 && cp<=0xFF? (char)(unsigned char)cp : '?');
    i+=len;
  }
  return out;
}

double string_width(Font font, double size, const std::string& text){
  const bool bold=(font==Font::HelveticaBold);
  const short* ascii=bold? HELVETICA_BOLD : HELVETICA;
  const short* latin1=bold? HELVETICA_BOLD_LATIN1 : HELVETICA_LATIN1;
  long units=0;
  for(unsigned char ch: to_winansi(text)){
    if(ch>=160) units+=latin1[ch-160];
    else if(ch>=32 && ch<=126) units+=ascii[ch-32];
    else units+=ascii['?'-32];
  }
  return units*size/1000.0;
}

}
