#include "MicroServer.hpp"

#include "LogHandler.hpp"

namespace ms {
MicroServer::MicroServer(std::shared_ptr<SocketHandler> _socketHandler,
                         const ServerConfig& _config,
                         std::shared_ptr<ResourceStore> resourceStore,
                         std::shared_ptr<Peripheral> _peripheral)
    : socketHandler(_socketHandler),
      config(_config),
      httpResponder(resourceStore, _config.default_resource()),
      peripheral(_peripheral),
      listening(false),
      clientHandlerThreadPool(new ThreadPool(_config.session_threads())),
      halt(false) {
  httpFds = socketHandler->listen(config.http_endpoint());
  try {
    websocketFds = socketHandler->listen(config.websocket_endpoint());
  } catch (const std::runtime_error& re) {
    socketHandler->stopListening(config.http_endpoint());
    throw;
  }
  listening = true;
}

MicroServer::~MicroServer() { stop(); }

void MicroServer::run() {
  LOG(INFO) << "Serving files on "
            << endpointUrl("http", config.http_endpoint())
            << ", commands on "
            << endpointUrl("ws", config.websocket_endpoint());
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  for (int i : httpFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }
  for (int i : websocketFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : httpFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i, false);
      }
    }
    for (int i : websocketFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i, true);
      }
    }
  }

  LOG(INFO) << "Shutting down";
  stop();
}

bool MicroServer::acceptNewConnection(int listenFd, bool websocket) {
  int clientFd = socketHandler->accept(listenFd);
  if (clientFd < 0) {
    return false;
  }
  VLOG(1) << "Accepted " << (websocket ? "websocket" : "http")
          << " connection on fd " << clientFd;
  reapSessionThreads();
  lock_guard<std::mutex> guard(connectionMutex);
  activeConnections.insert(clientFd);
  if (websocket) {
    // The session cannot release its fd until this lock is dropped, so the
    // thread is always registered before it is retired.
    sessionThreads[clientFd] = shared_ptr<thread>(
        new thread(&MicroServer::websocketHandler, this, clientFd));
  } else {
    clientHandlerThreadPool->enqueue(
        [this, clientFd]() { this->httpHandler(clientFd); });
  }
  return true;
}

void MicroServer::httpHandler(int clientFd) {
  LogHandler::nameHttpThread(clientFd);
  try {
    httpResponder.handleConnection(socketHandler.get(), clientFd);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Got an unexpected error serving http: " << e.what();
  }
  releaseConnection(clientFd);
}

void MicroServer::websocketHandler(int clientFd) {
  try {
    WebSocketSession session(socketHandler, clientFd, config, peripheral);
    session.run();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Got an unexpected error in websocket session: " << e.what();
  }
  releaseConnection(clientFd);
}

void MicroServer::releaseConnection(int clientFd) {
  lock_guard<std::mutex> guard(connectionMutex);
  activeConnections.erase(clientFd);
  auto it = sessionThreads.find(clientFd);
  if (it != sessionThreads.end()) {
    finishedSessionThreads.push_back(it->second);
    sessionThreads.erase(it);
  }
  socketHandler->close(clientFd);
  VLOG(1) << "Released connection " << clientFd;
}

void MicroServer::reapSessionThreads() {
  vector<shared_ptr<thread>> finished;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    finished.swap(finishedSessionThreads);
  }
  for (auto& t : finished) {
    // stop() may already have joined it
    if (t->joinable()) {
      t->join();
    }
  }
}

string MicroServer::endpointUrl(const string& scheme,
                                const SocketEndpoint& endpoint) {
  string host = endpoint.name().empty() ? "0.0.0.0" : endpoint.name();
  if (host.find(':') != string::npos) {
    host = "[" + host + "]";
  }
  return scheme + "://" + host + ":" + to_string(endpoint.port());
}

void MicroServer::stop() {
  vector<shared_ptr<thread>> sessions;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (listening) {
      socketHandler->stopListening(config.http_endpoint());
      socketHandler->stopListening(config.websocket_endpoint());
      listening = false;
    }
    for (int fd : activeConnections) {
      socketHandler->shutdownSocket(fd);
    }
    for (auto& it : sessionThreads) {
      sessions.push_back(it.second);
    }
  }
  // Sessions release their own connections, which needs connectionMutex
  for (auto& t : sessions) {
    t->join();
  }
  reapSessionThreads();
  // Joins the HTTP workers
  clientHandlerThreadPool.reset();
}
}  // namespace ms
