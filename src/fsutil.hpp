#pragma once
#include <string>
#include <vector>

/* path helpers */
namespace labelsheet {
  bool is_dir(const std::string& p);
  bool is_regular_file(const std::string& p);
  void ensure_dir(const std::string& dir);
  std::string path_basename(const std::string& p);
  std::string path_dirname(const std::string& p);
  std::string path_stem(const std::string& p);
  std::string join2(const std::string& a,const std::string& b);

  std::vector<unsigned char> read_file(const std::string& path);
  bool remove_file(const std::string& path);
}
