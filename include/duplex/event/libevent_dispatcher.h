#ifndef DUPLEX_EVENT_LIBEVENT_DISPATCHER_H
#define DUPLEX_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "duplex/event/event_loop.h"

struct event_base;
struct event;

namespace duplex {
namespace event {

/**
 * @brief Dispatcher on a libevent event_base.
 *
 * Posted callbacks travel through a self-pipe watched by the base, so a
 * post from any thread wakes a blocked loop. base() is shared with evhttp.
 * Construction throws std::runtime_error when libevent cannot be set up.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  LibeventDispatcher(const LibeventDispatcher&) = delete;
  LibeventDispatcher& operator=(const LibeventDispatcher&) = delete;

  // Dispatcher
  const std::string& name() override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;
  void exit() override;
  void run(RunType type) override;

  event_base* base() { return base_; }

 private:
  class LibeventSignal : public SignalEvent {
   public:
    LibeventSignal(event_base* base, int signal_num, SignalCb cb);
    ~LibeventSignal() override;

   private:
    static void onSignal(int fd, short events, void* arg);

    SignalCb cb_;
    struct event* event_{nullptr};
  };

  void openWakeupPipe();
  void release();
  void signalWakeup();
  void drainPosted();
  static void onWakeup(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> loop_thread_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex posted_mutex_;
  std::vector<PostCb> posted_;
  int wakeup_read_fd_{-1};
  int wakeup_write_fd_{-1};
  struct event* wakeup_event_{nullptr};
};

}  // namespace event
}  // namespace duplex

#endif  // DUPLEX_EVENT_LIBEVENT_DISPATCHER_H
