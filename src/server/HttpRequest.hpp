#ifndef __MS_HTTP_REQUEST__
#define __MS_HTTP_REQUEST__

#include "Headers.hpp"
#include "ServerErrors.hpp"
#include "SocketHandler.hpp"

namespace ms {
/**
 * @brief One parsed HTTP request head.  Header names are stored lower-cased;
 * the body, if any, is never read.
 */
struct HttpRequest {
  string method;
  string path;
  string version;
  map<string, string> headers;

  bool hasHeader(const string& name) const {
    return headers.find(toLower(name)) != headers.end();
  }

  string getHeader(const string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
      return "";
    }
    return it->second;
  }

  /**
   * @brief Parses a request line followed by header lines.
   * @param head Bytes up to (and optionally including) the blank line.
   * @throws MalformedRequestError when the request line is unrecognizable.
   */
  static HttpRequest parse(const string& head);

  /**
   * @brief Reads a request head byte by byte so nothing past the blank line
   * is consumed.
   * @throws MalformedRequestError if the head exceeds maxLength.
   * @throws std::runtime_error on socket failure or timeout.
   */
  static string readHead(SocketHandler* socketHandler, int fd,
                         size_t maxLength, int timeoutSeconds);
};
}  // namespace ms

#endif  // __MS_HTTP_REQUEST__
