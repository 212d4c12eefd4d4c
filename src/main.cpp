// labelsheet: CSV barcodes -> Avery 5160 sticker sheets (PDF), one continuous document.
#include "cli.hpp"

int main(int argc,char** argv){
  return labelsheet::run_cli(argc,argv);
}
