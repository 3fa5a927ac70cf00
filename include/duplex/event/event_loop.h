#ifndef DUPLEX_EVENT_EVENT_LOOP_H
#define DUPLEX_EVENT_EVENT_LOOP_H

#include <functional>
#include <memory>
#include <string>

namespace duplex {
namespace event {

class SignalEvent;

using SignalEventPtr = std::unique_ptr<SignalEvent>;

using PostCb = std::function<void()>;
using SignalCb = std::function<void()>;

enum class RunType {
  Block,        // Until no events remain or exit() is called
  NonBlock,     // One pass over ready events, never waits
  RunUntilExit  // Until exit(), even with nothing registered
};

/**
 * @brief Signal registration; the handler is removed on destruction.
 */
class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * @brief Single-threaded event loop.
 *
 * All transport and HTTP callbacks run on the dispatcher thread. post() is
 * the only operation that may be called from other threads.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Queue a callback to run on the dispatcher thread in a later loop
   * iteration. Never runs the callback inline.
   */
  virtual void post(PostCb callback) = 0;

  // True on the thread currently running the loop
  virtual bool isThreadSafe() const = 0;

  /**
   * Listen for a signal. Only one dispatcher per process should listen for
   * signals.
   */
  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

}  // namespace event
}  // namespace duplex

#endif  // DUPLEX_EVENT_EVENT_LOOP_H
