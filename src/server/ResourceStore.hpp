#ifndef __MS_RESOURCE_STORE__
#define __MS_RESOURCE_STORE__

#include "Headers.hpp"

namespace ms {
/**
 * @brief Byte-producing lookup of static web assets by URL path.
 */
class ResourceStore {
 public:
  virtual ~ResourceStore() {}

  /**
   * @brief Looks up a resource.
   * @param path Absolute URL path such as "/index.html".
   * @param body Filled with the resource bytes on success.
   * @return false when no such resource exists.
   */
  virtual bool resolve(const string& path, string* body) = 0;
};

/**
 * @brief Serves files below a root directory.  Paths containing ".."
 * segments never resolve.
 */
class DirectoryResourceStore : public ResourceStore {
 public:
  explicit DirectoryResourceStore(const string& _root);
  virtual ~DirectoryResourceStore() {}

  virtual bool resolve(const string& path, string* body);

  const string& getRoot() const { return root; }

 protected:
  string root;
};
}  // namespace ms

#endif  // __MS_RESOURCE_STORE__
