#pragma once
#include <string>

namespace labelsheet {

/* one barcode value and the display name of the file it came from */
struct LabelRecord {
  std::string identifier;
  std::string source;
};

}
