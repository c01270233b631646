#include "runner/process_registry.hpp"

#include <thread>

#include <kj/debug.h>
#include <kj/exception.h>

#include "util/log_manager.hpp"

namespace runner {

namespace {
const constexpr char* kStopped = "Local process stopped.";
const constexpr char* kNothingRunning = "No local process was running.";
}  // namespace

sandbox::ExecutionInfo ForegroundSession::Wait() {
  sandbox::ExecutionInfo info;
  process_->Wait(&info);
  return info;
}

ProcessRegistry::ProcessRegistry(int64_t stop_grace_millis)
    : stop_grace_millis_(stop_grace_millis), state_(std::make_shared<State>()) {}

ProcessRegistry::~ProcessRegistry() { Stop(); }

std::shared_ptr<ForegroundSession> ProcessRegistry::Replace(
    std::shared_ptr<ForegroundSession> session) {
  std::lock_guard<std::mutex> lck(state_->mutex);
  std::swap(state_->active, session);
  return session;
}

bool ProcessRegistry::ClearIf(State* state, const ForegroundSession* session) {
  std::lock_guard<std::mutex> lck(state->mutex);
  if (state->active.get() != session) return false;
  state->active.reset();
  return true;
}

bool ProcessRegistry::ClearIf(const ForegroundSession* session) {
  return ClearIf(state_.get(), session);
}

std::shared_ptr<ForegroundSession> ProcessRegistry::Take() {
  std::lock_guard<std::mutex> lck(state_->mutex);
  std::shared_ptr<ForegroundSession> session;
  std::swap(state_->active, session);
  return session;
}

std::shared_ptr<const ForegroundSession> ProcessRegistry::Current() const {
  std::lock_guard<std::mutex> lck(state_->mutex);
  return state_->active;
}

StopResult ProcessRegistry::Stop() {
  StopResult result;
  std::shared_ptr<ForegroundSession> session = Take();
  if (!session) {
    result.message = kNothingRunning;
    return result;
  }
  KJ_LOG(INFO, "Stopping foreground program", session->Pid());
  if (!session->Terminate(stop_grace_millis_)) {
    KJ_LOG(INFO, "Foreground program had already exited", session->Pid());
  }
  result.stopped = true;
  result.message = kStopped;
  return result;
}

void ProcessRegistry::Install(std::shared_ptr<ForegroundSession> session) {
  // Registered before the watcher starts, so that a program exiting right away
  // does not leave a stale session behind.
  std::shared_ptr<ForegroundSession> superseded = Replace(session);
  Watch(std::move(session));
  if (superseded) {
    KJ_LOG(WARNING, "Replacing a foreground program", superseded->Pid());
    superseded->Terminate(stop_grace_millis_);
  }
}

void ProcessRegistry::Watch(std::shared_ptr<ForegroundSession> session) {
  std::weak_ptr<State> weak_state = state_;
  std::thread([weak_state, session]() mutable {
    util::ThreadLogger logger;
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                  sandbox::ExecutionInfo info = session->Wait();
                  KJ_LOG(INFO, "Foreground program exited", session->Pid(),
                         info.status_code, info.signal);
                })) {
      KJ_LOG(ERROR, "Failed to wait for the foreground program",
             session->Pid(), exc->getDescription());
    }
    if (std::shared_ptr<State> state = weak_state.lock()) {
      ClearIf(state.get(), session.get());
    }
    // Removes the workspace, unless a concurrent Stop still holds the session.
    session.reset();
  }).detach();
}

}  // namespace runner
