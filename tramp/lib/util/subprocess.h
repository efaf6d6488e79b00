#ifndef STACKLESS_TRAMP_LIB_UTIL_SUBPROCESS_H_
#define STACKLESS_TRAMP_LIB_UTIL_SUBPROCESS_H_
#include <chrono>
#include <functional>
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>

namespace util {

class subprocess {
  /*
    Runs a callable in a forked child, so that work which may never return can be observed and stopped.
    Invariants:
     if pid_==0, the subprocess is not assigned to anything, and status_ can be any value.
     if pid_!=0, the subprocess is responsible of the child, and status_ holds the last waitpid() result. w_ holds
     the last return value of waitpid(), or 1 once the child is gone.
     Duties: unless w_==1, the subprocess needs either to kill or to wait the child before it is destroyed.
  */
 private:
  static pid_t spawn(const std::function<void()> &body);
  void poll_state_(int opts = WNOHANG);
 public:
  subprocess() : pid_(0), status_(0), w_(0) {}
  explicit subprocess(const std::function<void()> &body) : pid_(spawn(body)), status_(0), w_(0) {}
  subprocess(const subprocess &) = delete;
  subprocess(subprocess &&o) noexcept : pid_(o.pid_), status_(o.status_), w_(o.w_) { o.pid_ = 0; }
  ~subprocess();
  explicit operator bool() const noexcept { return bool(pid_); }
  [[nodiscard]] pid_t pid() const noexcept { return pid_; }
  [[nodiscard]] bool running();
  bool exited();
  int exit_code(); // throws if the child did not exit
  bool terminated();
  int terminating_signal(); // throws if the child was not terminated by a signal
  // polls for up to `timeout`; true iff the child finished meanwhile
  bool wait_for(std::chrono::milliseconds timeout);
  void wait();
  void kill(int sig = SIGTERM, int escalate_sig = SIGKILL,
            std::chrono::microseconds timeout = std::chrono::seconds(2));
 private:
  pid_t pid_;
  int status_, w_;
};

}

#endif //STACKLESS_TRAMP_LIB_UTIL_SUBPROCESS_H_
