#include "ResourceStore.hpp"

namespace ms {
DirectoryResourceStore::DirectoryResourceStore(const string& _root)
    : root(_root) {
  while (root.length() > 1 && root.back() == '/') {
    root.pop_back();
  }
}

bool DirectoryResourceStore::resolve(const string& path, string* body) {
  if (path.empty() || path[0] != '/') {
    return false;
  }
  for (const string& segment : split(path, '/')) {
    if (segment == "..") {
      LOG(WARNING) << "Refusing path outside of the web root: " << path;
      return false;
    }
  }

  string fullPath = root + path;
  std::error_code ec;
  if (!fs::is_regular_file(fullPath, ec)) {
    VLOG(1) << "No such resource: " << fullPath;
    return false;
  }
  ifstream file(fullPath, ios::in | ios::binary);
  if (!file.is_open()) {
    LOG(WARNING) << "Cannot open resource: " << fullPath;
    return false;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  *body = contents.str();
  return true;
}
}  // namespace ms
