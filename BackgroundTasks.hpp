#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

// Owns the UI's worker threads. A jthread stays joinable after its function
// returns, so each worker carries its own completion flag and finished workers
// are joined and dropped on the next start().
class BackgroundTasks {
 public:
  using Task = std::function<void(std::stop_token)>;

  void start(Task task) {
    reap();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::jthread thread(
        [task = std::move(task), done](std::stop_token stoken) {
          task(stoken);
          done->store(true);
        });
    m_workers.push_back({std::move(thread), std::move(done)});
  }

  void request_stop() {
    for (auto& worker : m_workers) {
      worker.thread.request_stop();
    }
  }

  // Blocks until every worker has returned.
  void join_all() { m_workers.clear(); }

  size_t size() const { return m_workers.size(); }

  size_t running() const {
    return std::count_if(m_workers.begin(), m_workers.end(),
                         [](const Worker& w) { return !w.done->load(); });
  }

 private:
  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap() {
    std::erase_if(m_workers, [](const Worker& w) { return w.done->load(); });
  }

  std::vector<Worker> m_workers;
};
