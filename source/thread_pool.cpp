#include <depgraph/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace depgraph {

ThreadPool::ThreadPool(unsigned n, std::size_t cap){
  if (n==0) n = std::thread::hardware_concurrency();
  if (n==0) n = 1;
  capacity = cap ? cap : 2 * static_cast<std::size_t>(n);
  for (unsigned i=0;i<n;i++){
    workers.emplace_back([this]{
      for(;;){
        std::function<void()> job;
        { std::unique_lock<std::mutex> lk(m);
          cv_job.wait(lk,[&]{ return stop || !q.empty(); });
          if (stop && q.empty()) return;
          job = std::move(q.front()); q.pop();
          ++active;
        }
        cv_space.notify_one();
        try {
          job();
        } catch (const std::exception& e) {
          failed++;
          spdlog::error("worker task failed: {}", e.what());
        }
        { std::lock_guard<std::mutex> lk(m);
          --active;
          if (q.empty() && active==0) cv_idle.notify_all();
        }
      }
    });
  }
}

ThreadPool::~ThreadPool(){
  { std::lock_guard<std::mutex> lk(m); stop=true; }
  cv_job.notify_all();
  for(auto& t:workers) t.join();
}

void ThreadPool::submit(std::function<void()> fn){
  { std::unique_lock<std::mutex> lk(m);
    cv_space.wait(lk,[&]{ return q.size() < capacity; });
    q.emplace(std::move(fn));
  }
  cv_job.notify_one();
}

void ThreadPool::wait_idle(){
  std::unique_lock<std::mutex> lk(m);
  cv_idle.wait(lk,[&]{ return q.empty() && active==0; });
}

} // namespace depgraph
