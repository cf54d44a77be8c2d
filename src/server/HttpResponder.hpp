#ifndef __MS_HTTP_RESPONDER__
#define __MS_HTTP_RESPONDER__

#include "Headers.hpp"
#include "HttpRequest.hpp"
#include "ResourceStore.hpp"
#include "SocketHandler.hpp"

namespace ms {
/**
 * @brief A complete response, rendered in one piece by serialize().
 */
struct HttpResponse {
  string version = "HTTP/1.0";
  int code = 200;
  string reason = "OK";
  vector<pair<string, string>> headers;
  string body;

  /**
   * @brief Renders the status line, the headers and the body.  Responses
   * with a body also get Content-Length.
   */
  string serialize() const;

  /** @brief A minimal text/plain response such as "404 Not Found". */
  static HttpResponse plainText(int code, const string& reason);
};

/**
 * @brief Answers one HTTP/1.0 GET request with a static resource.
 *
 * Every exchange is a single request followed by a single response; the
 * caller closes the connection afterwards.
 */
class HttpResponder {
 public:
  HttpResponder(shared_ptr<ResourceStore> _resourceStore,
                const string& _defaultResource);

  /** @brief Builds the response for a raw request head.  Never throws. */
  HttpResponse respond(const string& head);

  HttpResponse respond(const HttpRequest& request);

  /**
   * @brief Reads one request from fd and writes the response.  Socket
   * failures are logged; the descriptor stays open for the caller to
   * release.
   */
  void handleConnection(SocketHandler* socketHandler, int fd);

  /** @brief Maps the extension of path to a MIME type. */
  static string contentTypeForPath(const string& path);

 protected:
  shared_ptr<ResourceStore> resourceStore;
  string defaultResource;
};
}  // namespace ms

#endif  // __MS_HTTP_RESPONDER__
