#include "pdf_canvas.hpp"
#include "errors.hpp"
#include "fsutil.hpp"
#include "helvetica.hpp"
#include "ui.hpp"

#include <cstdio>
#include <openssl/evp.h>

namespace labelsheet {

struct PdfBuf{ std::vector<unsigned char> b; std::vector<size_t> xref; void put(const std::string& s){ b.insert(b.end(),s.begin(),s.end()); } size_t off()const{return b.size();}};

static std::string num(double v){
  char buf[32]; std::snprintf(buf,sizeof(buf),"%.3f",v);
  std::string s=buf;
  while(s.back()=='0') s.pop_back();
  if(s.back()=='.') s.pop_back();
  if(s=="-0") s="0";
  return s;
}

/* PDF literal string body from WinAnsi bytes */
static std::string pdf_escape(const std::string& t){
  std::string s;
  for(unsigned char ch: t){
    if(ch=='('||ch==')'||ch=='\\'){ s.push_back('\\'); s.push_back((char)ch); }
    else if(ch<32||(ch>126&&ch<160)) s.push_back('?');
    else s.push_back((char)ch);
  }
  return s;
}

static std::string hex(const unsigned char* p,size_t n){
  static const char* D="0123456789ABCDEF"; std::string s;
  for(size_t i=0;i<n;++i){ s.push_back(D[p[i]>>4]); s.push_back(D[p[i]&15]); }
  return s;
}

/* trailer /ID: first 16 bytes of SHA-256 over the document body */
static std::string document_id(const std::vector<unsigned char>& body){
  unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen=0;
  if(EVP_Digest(body.data(),body.size(),md,&mdlen,EVP_sha256(),nullptr)!=1)
    throw std::runtime_error("SHA-256 digest failed");
  return hex(md,16);
}

std::vector<unsigned char> build_pdf(const std::vector<std::string>& pages, double page_width, double page_height){
  PdfBuf P;
  const size_t np=pages.size();
  const size_t first_page=6, total=5+2*np;
  P.put("%PDF-1.4\n%\xE2\xE3\xCF\xD3\n");
  P.xref.push_back(P.off()); P.put("1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n");
  P.xref.push_back(P.off());
  {
    std::string kids;
    for(size_t i=0;i<np;++i){ if(i) kids+=" "; kids+=std::to_string(first_page+2*i)+" 0 R"; }
    P.put("2 0 obj\n<< /Type /Pages /Kids ["+kids+"] /Count "+std::to_string(np)+" >>\nendobj\n");
  }
  P.xref.push_back(P.off()); P.put("3 0 obj\n<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>\nendobj\n");
  P.xref.push_back(P.off()); P.put("4 0 obj\n<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>\nendobj\n");
  P.xref.push_back(P.off()); P.put("5 0 obj\n<< /Producer (labelsheet) >>\nendobj\n");
  for(size_t i=0;i<np;++i){
    size_t po=first_page+2*i, co=po+1;
    P.xref.push_back(P.off());
    P.put(std::to_string(po)+" 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "+num(page_width)+" "+num(page_height)+"]"
          " /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >> /Contents "+std::to_string(co)+" 0 R >>\nendobj\n");
    P.xref.push_back(P.off());
    P.put(std::to_string(co)+" 0 obj\n<< /Length "+std::to_string(pages[i].size())+" >>\nstream\n");
    P.put(pages[i]);
    P.put("\nendstream\nendobj\n");
  }
  std::string id=document_id(P.b);
  size_t xref_pos=P.off();
  P.put("xref\n0 "+std::to_string(total+1)+"\n0000000000 65535 f \n");
  for(size_t i=0;i<P.xref.size();++i){ char line[32]; std::snprintf(line,sizeof(line),"%010zu 00000 n \n",P.xref[i]); P.put(line); }
  P.put("trailer\n<< /Size "+std::to_string(total+1)+" /Root 1 0 R /Info 5 0 R /ID [<"+id+"> <"+id+">] >>\nstartxref\n");
  P.put(std::to_string(xref_pos)+"\n%%EOF\n");
  return P.b;
}

PdfCanvas::PdfCanvas(const std::string& path, double page_width, double page_height)
  : path_(path), width_(page_width), height_(page_height), out_(path,std::ios::binary|std::ios::trunc) {
  if(!out_) throw OutputWriteError("Cannot write: "+path);
}

PdfCanvas::~PdfCanvas(){
  if(saved_) return;
  out_.close();
  if(!remove_file(path_)) ui::warn("could not remove incomplete output "+path_);
}

void PdfCanvas::draw_barcode(const Code128Symbol& sym, double x, double y, double width, double height){
  if(sym.modules==0) return;
  page_open_=true;
  const double module=width/sym.modules;
  std::string ops="0 g\n";
  unsigned pos=0;
  for(size_t i=0;i<sym.widths.size();++i){
    if(i%2==0) ops+=num(x+pos*module)+" "+num(y)+" "+num(sym.widths[i]*module)+" "+num(height)+" re\n";
    pos+=sym.widths[i];
  }
  ops+="f\n";
  content_+=ops;
}

void PdfCanvas::draw_centred_text(Font font, double size, double centre_x, double baseline_y, const std::string& text){
  page_open_=true;
  double x=centre_x-string_width(font,size,text)/2;
  content_+="BT /"+std::string(font==Font::HelveticaBold?"F2":"F1")+" "+num(size)+" Tf "+num(x)+" "+num(baseline_y)+" Td ("+pdf_escape(to_winansi(text))+") Tj ET\n";
}

void PdfCanvas::show_page(){
  pages_.push_back(content_);
  content_.clear(); page_open_=false;
}

void PdfCanvas::save(){
  if(saved_) return;
  if(page_open_) show_page();
  auto doc=build_pdf(pages_,width_,height_);
  out_.write((const char*)doc.data(),(std::streamsize)doc.size());
  out_.close();
  if(!out_) throw OutputWriteError("Cannot write: "+path_);
  saved_=true;
}

}
