#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "tlsdial/event-fd.hpp"
#include "tlsdial/tcp-connector.hpp"

namespace tlsdial {

// Pool of worker threads running blocking getaddrinfo calls on behalf of non-blocking connect operations.
// Completion of each request is signalled through its own eventfd, so a pending operation can be
// registered in an event loop like any socket.
//
// The resolver is thread safe: requests may be submitted from any thread.
class DnsResolver {
 public:
  class Request {
   public:
    Request(std::string host, std::string port, int family);

    // True once the result is available. Acquire semantics: result() can then be read.
    [[nodiscard]] bool done() const noexcept { return _done.load(std::memory_order_acquire); }

    // fd readable once done() is true.
    [[nodiscard]] int fd() const noexcept { return _doneEvent.fd(); }

    // Valid only once done() returned true.
    [[nodiscard]] ResolveResult& result() noexcept { return _result; }

    [[nodiscard]] const std::string& host() const noexcept { return _host; }

   private:
    friend class DnsResolver;

    void complete(ResolveResult result) noexcept;

    std::string _host;
    std::string _port;
    int _family;
    EventFd _doneEvent;
    ResolveResult _result{AddrInfoPtr(nullptr, nullptr), 0, 0};
    std::atomic<bool> _done{false};
  };

  // Throws std::invalid_argument if nbThreads is 0.
  explicit DnsResolver(uint32_t nbThreads);

  DnsResolver(const DnsResolver&) = delete;
  DnsResolver(DnsResolver&&) noexcept = delete;
  DnsResolver& operator=(const DnsResolver&) = delete;
  DnsResolver& operator=(DnsResolver&&) noexcept = delete;

  // Stops the workers. Requests still queued complete with EAI_CANCELED.
  ~DnsResolver();

  // Queue a resolution. The returned request stays valid even if the caller drops it before completion.
  std::shared_ptr<Request> resolve(std::string host, std::string port, int family = 0);

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _workers.size(); }

 private:
  void workerLoop(std::stop_token stopToken);

  std::mutex _mutex;
  std::condition_variable_any _cv;
  std::deque<std::shared_ptr<Request>> _queue;
  std::vector<std::jthread> _workers;
};

}  // namespace tlsdial
