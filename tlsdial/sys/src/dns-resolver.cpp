#include "tlsdial/dns-resolver.hpp"

#include <netdb.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>

#include "tlsdial/log.hpp"
#include "tlsdial/tcp-connector.hpp"

namespace tlsdial {

DnsResolver::Request::Request(std::string host, std::string port, int family)
    : _host(std::move(host)), _port(std::move(port)), _family(family) {}

void DnsResolver::Request::complete(ResolveResult result) noexcept {
  _result = std::move(result);
  _done.store(true, std::memory_order_release);
  _doneEvent.send();
}

DnsResolver::DnsResolver(uint32_t nbThreads) {
  if (nbThreads == 0) {
    throw std::invalid_argument("DnsResolver needs at least one worker thread");
  }
  _workers.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _workers.emplace_back([this](std::stop_token stopToken) { workerLoop(std::move(stopToken)); });
  }
  log::debug("DnsResolver started with {} worker thread(s)", nbThreads);
}

DnsResolver::~DnsResolver() {
  for (auto& worker : _workers) {
    worker.request_stop();
  }
  _cv.notify_all();
  _workers.clear();  // joins

  for (auto& request : _queue) {
    request->complete(ResolveResult{AddrInfoPtr(nullptr, nullptr), EAI_CANCELED, 0});
  }
}

std::shared_ptr<DnsResolver::Request> DnsResolver::resolve(std::string host, std::string port, int family) {
  auto request = std::make_shared<Request>(std::move(host), std::move(port), family);
  {
    std::scoped_lock lock(_mutex);
    _queue.push_back(request);
  }
  _cv.notify_one();
  return request;
}

void DnsResolver::workerLoop(std::stop_token stopToken) {
  while (true) {
    std::shared_ptr<Request> request;
    {
      std::unique_lock lock(_mutex);
      if (!_cv.wait(lock, stopToken, [this] { return !_queue.empty(); })) {
        return;  // stop requested
      }
      request = std::move(_queue.front());
      _queue.pop_front();
    }
    if (request.use_count() == 1) {
      // Abandoned by its connect operation while queued.
      log::trace("DnsResolver: skipping abandoned resolution of '{}'", request->_host);
      continue;
    }
    request->complete(ResolveTCP(request->_host.c_str(), request->_port.c_str(), request->_family));
  }
}

}  // namespace tlsdial
