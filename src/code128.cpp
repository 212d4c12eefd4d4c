#include "code128.hpp"
#include "errors.hpp"

#include <cstdio>

namespace labelsheet {

static const char* const PATTERNS[107]={
  "212222","222122","222221","121223","121322","131222","122213","122312","132212","221213",
  "221312","231212","112232","122132","122231","113222","123122","123221","223211","221132",
  "221231","213212","223112","312131","311222","321122","321221","312212","322112","322211",
  "212123","212321","232121","111323","131123","131321","112313","132113","132311","211313",
  "231113","231311","112133","112331","132131","113123","113321","133121","313121","211331",
  "231131","213113","213311","213131","311123","311321","331121","312113","312311","332111",
  "314111","221411","431111","111224","111422","121124","121421","141122","141221","112214",
  "112412","122114","122411","142112","142211","241211","221114","413111","241112","134111",
  "111242","121142","121241","114212","124112","124211","411212","421112","421211","212141",
  "214121","412121","111143","111341","131141","114113","114311","411113","411311","113141",
  "114131","311141","411131","211412","211214","211232","2331112"
};

enum : int { CODE_C=99, CODE_B=100, START_B=104, START_C=105, STOP=106 };

static bool is_digit(char c){ return c>='0' && c<='9'; }
static size_t digit_run(const std::string& s,size_t i){
  size_t j=i; while(j<s.size() && is_digit(s[j])) ++j; return j-i;
}

Code128Symbol encode_code128(const std::string& text){
  if(text.empty()) throw EncodingError("Code 128: empty value", text);
  for(size_t i=0;i<text.size();++i){
    unsigned char ch=(unsigned char)text[i];
    if(ch<32 || ch>126){
      char buf[96]; std::snprintf(buf,sizeof(buf),"Code 128: unsupported character 0x%02X at position %zu in '",ch,i);
      throw EncodingError(std::string(buf)+text+"'", text);
    }
  }

  Code128Symbol sym; sym.text=text;
  std::vector<int>& cw=sym.codewords;
  const size_t n=text.size();
  size_t i=0; bool in_c=false;

  size_t lead=digit_run(text,0);
  if(lead>=4 || (lead==n && lead>=2 && lead%2==0)){
    if(lead%2==1){ cw.push_back(START_B); cw.push_back(text[0]-32); i=1; cw.push_back(CODE_C); }
    else cw.push_back(START_C);
    in_c=true;
  }else{
    cw.push_back(START_B);
  }

  while(i<n){
    if(in_c){
      if(i+1<n && is_digit(text[i]) && is_digit(text[i+1])){ cw.push_back((text[i]-'0')*10+(text[i+1]-'0')); i+=2; continue; }
      cw.push_back(CODE_B); in_c=false; continue;
    }
    size_t run=digit_run(text,i);
    if(run>=4 && (i+run==n || run>=6)){
      if(run%2==1){ cw.push_back(text[i]-32); ++i; }
      cw.push_back(CODE_C); in_c=true; continue;
    }
    cw.push_back(text[i]-32); ++i;
  }

  long sum=cw[0];
  for(size_t k=1;k<cw.size();++k) sum+=(long)k*cw[k];
  cw.push_back((int)(sum%103));
  cw.push_back(STOP);

  for(int v: cw){
    for(const char* p=PATTERNS[v]; *p; ++p){ sym.widths.push_back((uint8_t)(*p-'0')); sym.modules+=(unsigned)(*p-'0'); }
  }
  return sym;
}

}
