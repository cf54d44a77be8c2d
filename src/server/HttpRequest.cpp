#include "HttpRequest.hpp"

namespace ms {
namespace {
string stripLineEnding(const string& line) {
  if (!line.empty() && line.back() == '\r') {
    return line.substr(0, line.length() - 1);
  }
  return line;
}
}  // namespace

HttpRequest HttpRequest::parse(const string& head) {
  vector<string> lines = split(head, '\n');
  if (lines.empty()) {
    throw MalformedRequestError("Empty request");
  }

  HttpRequest request;
  vector<string> tokens = split(stripLineEnding(lines[0]), ' ');
  if (tokens.size() != 3 || tokens[0].empty() || tokens[1].empty() ||
      tokens[2].empty()) {
    throw MalformedRequestError("Bad request line: " + lines[0]);
  }
  if (tokens[1][0] != '/' || tokens[2].compare(0, 5, "HTTP/") != 0) {
    throw MalformedRequestError("Bad request line: " + lines[0]);
  }
  request.method = tokens[0];
  request.path = tokens[1];
  request.version = tokens[2];

  for (size_t a = 1; a < lines.size(); a++) {
    string line = stripLineEnding(lines[a]);
    if (line.empty()) {
      break;
    }
    auto colon = line.find(':');
    if (colon == string::npos) {
      // Not a header, the responder never needs it.
      VLOG(2) << "Skipping malformed header line: " << line;
      continue;
    }
    string name = toLower(trim(line.substr(0, colon)));
    request.headers[name] = trim(line.substr(colon + 1));
  }
  return request;
}

string HttpRequest::readHead(SocketHandler* socketHandler, int fd,
                             size_t maxLength, int timeoutSeconds) {
  string head;
  while (true) {
    char c;
    socketHandler->readAll(fd, &c, 1, timeoutSeconds);
    head.push_back(c);
    if (endsWith(head, "\r\n\r\n") || endsWith(head, "\n\n")) {
      return head;
    }
    if (head.length() >= maxLength) {
      throw MalformedRequestError("Request head too long");
    }
  }
}
}  // namespace ms
