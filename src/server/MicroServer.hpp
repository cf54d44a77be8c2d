#ifndef __MS_MICRO_SERVER__
#define __MS_MICRO_SERVER__

#include "Headers.hpp"
#include "HttpResponder.hpp"
#include "Peripheral.hpp"
#include "ResourceStore.hpp"
#include "SocketHandler.hpp"
#include "WebSocketSession.hpp"

namespace ms {
/**
 * @brief Owns the HTTP and WebSocket listeners and runs one handler per
 * accepted connection.
 *
 * HTTP connections get a single static-file response from a bounded worker
 * pool.  WebSocket connections live as long as their client, so each one gets
 * a WebSocketSession on its own thread and can never hold up page loads.
 * Every accepted descriptor is closed by the thread that handled it, whatever
 * the outcome.
 */
class MicroServer {
 public:
  /**
   * @brief Binds both endpoints.
   * @throws std::runtime_error if either endpoint cannot be bound.
   */
  MicroServer(std::shared_ptr<SocketHandler> _socketHandler,
              const ServerConfig& _config,
              std::shared_ptr<ResourceStore> resourceStore,
              std::shared_ptr<Peripheral> _peripheral);
  virtual ~MicroServer();

  /**
   * @brief Accept loop.  Returns after shutdown() once the listeners are
   * closed and every worker has finished.
   */
  void run();

  /** @brief Asks run() to stop.  Safe to call from any thread. */
  void shutdown() { halt = true; }

  /**
   * @brief Accepts a pending connection on a listening fd and queues its
   * handler.
   * @return false if nothing could be accepted.
   */
  bool acceptNewConnection(int listenFd, bool websocket);

  int getActiveConnectionCount() {
    lock_guard<std::mutex> guard(connectionMutex);
    return int(activeConnections.size());
  }

  const ServerConfig& getConfig() const { return config; }

  /** @return e.g. "ws://0.0.0.0:8080" for an endpoint without a name. */
  static string endpointUrl(const string& scheme,
                            const SocketEndpoint& endpoint);

 protected:
  shared_ptr<SocketHandler> socketHandler;
  ServerConfig config;
  HttpResponder httpResponder;
  shared_ptr<Peripheral> peripheral;
  set<int> httpFds;
  set<int> websocketFds;
  bool listening;
  /** @brief Accepted descriptors whose handlers have not finished. */
  set<int> activeConnections;
  std::unique_ptr<ThreadPool> clientHandlerThreadPool;
  /** @brief Session threads by connection fd, while the session runs. */
  map<int, shared_ptr<thread>> sessionThreads;
  /** @brief Session threads that released their connection, to be joined. */
  vector<shared_ptr<thread>> finishedSessionThreads;
  std::mutex connectionMutex;
  std::atomic<bool> halt;

  void httpHandler(int clientFd);
  void websocketHandler(int clientFd);
  void releaseConnection(int clientFd);
  void reapSessionThreads();
  /**
   * @brief Closes the listeners, wakes every live connection, then joins the
   * session threads and the HTTP workers.
   */
  void stop();
};
}  // namespace ms

#endif  // __MS_MICRO_SERVER__
