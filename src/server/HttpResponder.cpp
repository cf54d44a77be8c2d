#include "HttpResponder.hpp"

namespace ms {
string HttpResponse::serialize() const {
  stringstream ss;
  ss << version << " " << code << " " << reason << "\r\n";
  for (const auto& it : headers) {
    ss << it.first << ": " << it.second << "\r\n";
  }
  if (code != 101) {
    ss << "Content-Length: " << body.length() << "\r\n";
  }
  ss << "\r\n";
  ss << body;
  return ss.str();
}

HttpResponse HttpResponse::plainText(int code, const string& reason) {
  HttpResponse response;
  response.code = code;
  response.reason = reason;
  response.headers.push_back(make_pair("Content-Type", "text/plain"));
  response.body = to_string(code) + " " + reason + "\n";
  return response;
}

HttpResponder::HttpResponder(shared_ptr<ResourceStore> _resourceStore,
                             const string& _defaultResource)
    : resourceStore(_resourceStore), defaultResource(_defaultResource) {}

HttpResponse HttpResponder::respond(const string& head) {
  try {
    return respond(HttpRequest::parse(head));
  } catch (const MalformedRequestError& mre) {
    LOG(INFO) << "Malformed request: " << mre.what();
    return HttpResponse::plainText(400, "Bad Request");
  }
}

HttpResponse HttpResponder::respond(const HttpRequest& request) {
  if (request.method != "GET") {
    LOG(INFO) << "Unsupported method: " << request.method;
    return HttpResponse::plainText(501, "Not Implemented");
  }

  string path = request.path;
  auto query = path.find_first_of("?#");
  if (query != string::npos) {
    path = path.substr(0, query);
  }
  if (path.empty() || path == "/") {
    path = defaultResource;
  }

  HttpResponse response;
  if (!resourceStore->resolve(path, &response.body)) {
    LOG(INFO) << "Resource '" << path << "' not found";
    return HttpResponse::plainText(404, "Not Found");
  }
  response.headers.push_back(
      make_pair("Content-Type", contentTypeForPath(path)));
  VLOG(1) << "GET " << path << " -> " << response.body.length() << " bytes";
  return response;
}

void HttpResponder::handleConnection(SocketHandler* socketHandler, int fd) {
  HttpResponse response;
  try {
    string head = HttpRequest::readHead(socketHandler, fd, MAX_HTTP_HEAD_LENGTH,
                                        HTTP_TRANSFER_TIMEOUT);
    response = respond(head);
  } catch (const MalformedRequestError& mre) {
    LOG(INFO) << "Malformed request: " << mre.what();
    response = HttpResponse::plainText(400, "Bad Request");
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Gave up reading request on " << fd << ": " << re.what();
    return;
  }

  try {
    socketHandler->writeAllOrThrow(fd, response.serialize(), true);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Could not send response on " << fd << ": " << re.what();
  }
}

string HttpResponder::contentTypeForPath(const string& path) {
  static const map<string, string> CONTENT_TYPES = {
      {".html", "text/html"},
      {".htm", "text/html"},
      {".js", "application/javascript"},
      {".css", "text/css"},
      {".txt", "text/plain"},
      {".json", "application/json"},
      {".png", "image/png"},
      {".ico", "image/x-icon"},
      {".svg", "image/svg+xml"},
  };
  auto slash = path.find_last_of('/');
  auto dot = path.find_last_of('.');
  if (dot == string::npos || (slash != string::npos && dot < slash)) {
    return "application/octet-stream";
  }
  auto it = CONTENT_TYPES.find(toLower(path.substr(dot)));
  if (it == CONTENT_TYPES.end()) {
    return "application/octet-stream";
  }
  return it->second;
}
}  // namespace ms
