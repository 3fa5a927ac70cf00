#define DUPLEX_LOG_COMPONENT "event.libevent"

#include "duplex/event/libevent_dispatcher.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "duplex/logging/log_macros.h"

namespace duplex {
namespace event {

namespace {

// evthread locking must be on before the first event_base is created
void useLibeventPthreads() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent built without pthread support");
    }
  });
}

event_base* newEventBase() {
  event_config* config = event_config_new();
  if (!config) {
    return event_base_new();
  }
#ifdef __linux__
  event_config_avoid_method(config, "select");
  event_config_avoid_method(config, "poll");
#endif
  event_base* base = event_base_new_with_config(config);
  event_config_free(config);
  return base;
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  useLibeventPthreads();

  base_ = newEventBase();
  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }
  const char* backend = event_base_get_method(base_);
  DUPLEX_LOG(Debug, "dispatcher {} running on {}", name_,
             backend ? backend : "unknown");

  try {
    openWakeupPipe();
  } catch (...) {
    // The destructor does not run for a throwing constructor
    release();
    throw;
  }
}

LibeventDispatcher::~LibeventDispatcher() { release(); }

void LibeventDispatcher::release() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
    wakeup_event_ = nullptr;
  }
  for (int* fd : {&wakeup_read_fd_, &wakeup_write_fd_}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }
  if (base_) {
    event_base_free(base_);
    base_ = nullptr;
  }
}

void LibeventDispatcher::openWakeupPipe() {
  int fds[2];
  if (::pipe(fds) != 0) {
    throw std::runtime_error(std::string("Failed to create wakeup pipe: ") +
                             std::strerror(errno));
  }
  wakeup_read_fd_ = fds[0];
  wakeup_write_fd_ = fds[1];
  evutil_make_socket_nonblocking(wakeup_read_fd_);
  evutil_make_socket_nonblocking(wakeup_write_fd_);
  evutil_make_socket_closeonexec(wakeup_read_fd_);
  evutil_make_socket_closeonexec(wakeup_write_fd_);

  wakeup_event_ = event_new(base_, wakeup_read_fd_, EV_READ | EV_PERSIST,
                            &LibeventDispatcher::onWakeup, this);
  if (!wakeup_event_ || event_add(wakeup_event_, nullptr) != 0) {
    throw std::runtime_error("Failed to register wakeup event");
  }
}

void LibeventDispatcher::post(PostCb callback) {
  bool was_empty;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    was_empty = posted_.empty();
    posted_.push_back(std::move(callback));
  }

  // A non-empty queue already has a wakeup byte in flight. The loop thread
  // signals too, so a post from a callback is not held up behind other I/O.
  if (was_empty) {
    signalWakeup();
  }
}

void LibeventDispatcher::signalWakeup() {
  const char byte = 1;
  if (::write(wakeup_write_fd_, &byte, 1) < 0 && errno != EAGAIN &&
      errno != EWOULDBLOCK) {
    DUPLEX_LOG(Error, "dispatcher {} wakeup write failed: {}", name_,
               std::strerror(errno));
  }
}

void LibeventDispatcher::onWakeup(int fd, short, void* arg) {
  char sink[64];
  while (::read(fd, sink, sizeof(sink)) > 0) {
  }
  static_cast<LibeventDispatcher*>(arg)->drainPosted();
}

void LibeventDispatcher::drainPosted() {
  std::vector<PostCb> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  // Callbacks posted while this batch runs wait for the next wakeup
  for (auto& callback : batch) {
    callback();
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = loop_thread_.load();
  return owner != std::thread::id() && owner == std::this_thread::get_id();
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<LibeventSignal>(base_, signal_num, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    // Wake the loop so it observes the flag
    post([]() {});
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  loop_thread_ = std::this_thread::get_id();

  drainPosted();

  if (type == RunType::RunUntilExit) {
    while (!exit_requested_) {
      if (event_base_loop(base_, EVLOOP_ONCE) < 0) {
        DUPLEX_LOG(Error, "dispatcher {} loop iteration failed", name_);
        break;
      }
      drainPosted();
    }
    return;
  }

  int flags = type == RunType::NonBlock ? EVLOOP_NONBLOCK : 0;
  if (event_base_loop(base_, flags) < 0) {
    DUPLEX_LOG(Error, "dispatcher {} loop failed", name_);
  }
  drainPosted();
}

LibeventDispatcher::LibeventSignal::LibeventSignal(event_base* base,
                                                   int signal_num,
                                                   SignalCb cb)
    : cb_(std::move(cb)) {
  event_ = evsignal_new(base, signal_num, &LibeventSignal::onSignal, this);
  if (!event_ || event_add(event_, nullptr) != 0) {
    if (event_) {
      event_free(event_);
    }
    throw std::runtime_error("Failed to listen for signal " +
                             std::to_string(signal_num));
  }
}

LibeventDispatcher::LibeventSignal::~LibeventSignal() {
  event_del(event_);
  event_free(event_);
}

void LibeventDispatcher::LibeventSignal::onSignal(int, short, void* arg) {
  static_cast<LibeventSignal*>(arg)->cb_();
}

}  // namespace event
}  // namespace duplex
