#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "core/config.hpp"
#include "ide/command_bridge.hpp"
#include "ide/server.hpp"
#include "ide/state.hpp"
#include "model/review.hpp"
#include "sinks/status_line.hpp"

namespace revue::core {

struct HostStats {
  std::size_t frames_executed{0};
  std::size_t commands_applied{0};
  std::size_t commands_unmatched{0};
  std::size_t syncs_published{0};
  std::size_t syncs_skipped{0};
};

// Single-threaded, frame-driven review loop. Owns the session model and the
// two channels the IDE server shares with it.
class ReviewHost {
 public:
  ReviewHost(HostConfig config, model::ReviewSession session);
  ~ReviewHost();

  ReviewHost(const ReviewHost&) = delete;
  ReviewHost& operator=(const ReviewHost&) = delete;

  // Starts the IDE server when enabled. Startup failures are logged and the
  // host keeps running without it.
  std::optional<std::uint16_t> start_ide();

  // total_frames == 0 runs until request_shutdown().
  HostStats run_for_frames(std::size_t total_frames);

  void request_shutdown() noexcept { shutdown_requested_ = true; }
  void shutdown();

  bool open_file(const ide::OpenFileCommand& command);

  [[nodiscard]] const model::ReviewSession& session() const noexcept { return session_; }
  // Mutable access marks the snapshot stale.
  model::ReviewSession& edit_session();

  ide::SharedStateStore& state() noexcept { return state_; }
  ide::CommandBridge& commands() noexcept { return commands_; }
  [[nodiscard]] const ide::Server* server() const noexcept { return server_.get(); }

 private:
  void render_status();
  void apply_commands(HostStats& stats);
  void sync_state(HostStats& stats);

  HostConfig config_;
  model::ReviewSession session_;
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_frame_{true};
  bool state_dirty_{true};
  std::atomic<bool> shutdown_requested_{false};

  sinks::StatusLineSink status_sink_{};

  ide::SharedStateStore state_{};
  ide::CommandBridge commands_;
  std::unique_ptr<ide::Server> server_{};
};

}  // namespace revue::core
