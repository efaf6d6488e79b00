#include <util/subprocess.h>
#include <util/message.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>

namespace util {

pid_t subprocess::spawn(const std::function<void()> &body) {
  std::cout.flush();
  std::cerr.flush();
  pid_t pid = fork();
  if (pid == -1)throw std::system_error(errno, std::generic_category(), "subprocess: fork() failed");
  if (pid == 0) {
    int code = 0;
    try {
      body();
    } catch (const std::exception &e) {
      message::emit(message::error_string(e.what()));
      code = 1;
    }
    std::cout.flush();
    std::cerr.flush();
    _exit(code);
  }
  return pid;
}

void subprocess::poll_state_(int opts) {
  if (pid_ == 0)throw std::logic_error("subprocess: no process is currently managed");
  if (w_ == 1)return;
  w_ = waitpid(pid_, &status_, opts);
  if (w_ == -1)throw std::system_error(errno, std::generic_category(), "subprocess: waitpid() failed");
  if (w_ == pid_ && (WIFEXITED(status_) || WIFSIGNALED(status_)))w_ = 1;
}

subprocess::~subprocess() {
  if (pid_ == 0 || w_ == 1)return;
  // a child still running is not left behind
  if (::kill(pid_, SIGKILL) == 0) {
    int status;
    waitpid(pid_, &status, 0);
  } else {
    std::perror("subprocess: kill() failed while releasing the child");
  }
}

bool subprocess::running() {
  poll_state_();
  return w_ != 1;
}

bool subprocess::exited() {
  poll_state_();
  return w_ == 1 && WIFEXITED(status_);
}

int subprocess::exit_code() {
  if (!exited())throw std::logic_error("subprocess: child did not exit");
  return WEXITSTATUS(status_);
}

bool subprocess::terminated() {
  poll_state_();
  return w_ == 1 && WIFSIGNALED(status_);
}

int subprocess::terminating_signal() {
  if (!terminated())throw std::logic_error("subprocess: child was not terminated by a signal");
  return WTERMSIG(status_);
}

bool subprocess::wait_for(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const auto tick = std::max(std::chrono::milliseconds(1), timeout / 100);
  while (running()) {
    if (std::chrono::steady_clock::now() >= deadline)return false;
    std::this_thread::sleep_for(tick);
  }
  return true;
}

void subprocess::wait() {
  poll_state_(0);
}

void subprocess::kill(int sig, int escalate_sig, std::chrono::microseconds timeout) {
  if (pid_ == 0)throw std::logic_error("subprocess: kill() failed: no process is currently managed");
  if (!running())return;

  if (::kill(pid_, sig) == -1)throw std::system_error(errno, std::generic_category(), "subprocess: kill() failed");

  if (timeout.count())
    for (int i = 0; i < 100 && w_ != 1; i++) {
      std::this_thread::sleep_for(timeout / 100);
      poll_state_();
    }
  if (w_ == 1)return;

  if (::kill(pid_, escalate_sig) == -1 && errno != ESRCH)
    throw std::system_error(errno, std::generic_category(), "subprocess: kill() failed: could not escalate");

  poll_state_(0);
}

}
