#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint_store.hpp"
#include "errors.hpp"
#include "key_source.hpp"
#include "pipeline.hpp"
#include "transfer_config.hpp"
#include "validator.hpp"

class Confirmer;
class KeySource;
class Logger;
class NotificationSink;
class RemoteExecutor;
class RemoteProcess;

enum class TransferState {
  Idle,
  ListenerStarting,
  ListenerReady,
  SenderRunning,
  Completed,
  Failed
};

enum class FailureCause {
  None,
  InsufficientCapacity,
  MisalignedOffset,
  StateMismatch,
  InvalidConfiguration,
  DependencyMissing,
  ListenerUnreachable,
  SenderFailed,
  ReceiverFailed,
  ValidationMismatch
};

const char* transfer_state_name(TransferState state);
const char* failure_cause_name(FailureCause cause);

struct TransferOutcome {
  enum class Kind { Completed, Cancelled, DryRun, Failed };

  Kind kind = Kind::Failed;
  TransferState final_state = TransferState::Idle;
  FailureCause cause = FailureCause::None;
  std::string message;

  std::uint64_t source_bytes = 0;
  std::uint64_t dest_bytes = 0;
  std::uint64_t resume_offset = 0;
  std::uint64_t bytes_transferred = 0;
  PipelinePair pipelines;
  std::optional<ValidationReport> validation;
  std::chrono::milliseconds elapsed{0};

  // 0 completed/cancelled/dry-run, 1 configuration or dependency,
  // 2 transport, 3 validation mismatch.
  int exit_code() const;
};

// Drives one transfer attempt from preflight to validation. The remote side
// is reached only through RemoteExecutor, so the whole flow runs in-process
// in tests.
class TransferCoordinator {
public:
  TransferCoordinator(TransferConfiguration config,
                      RemoteExecutor& executor,
                      Confirmer& confirmer,
                      NotificationSink& notifier,
                      KeySource& key_source,
                      std::shared_ptr<Logger> logger = nullptr);

  TransferOutcome run();

  TransferState state() const { return state_; }
  const std::vector<TransferState>& history() const { return history_; }

private:
  struct Preflight {
    std::string source_path;
    std::uint64_t source_bytes = 0;
    std::uint64_t dest_bytes = 0;
    std::uint64_t resume_offset = 0;
    PipelinePair pipelines;
  };

  // Thrown inside the transfer phase; carries the cause to report.
  class PhaseFailure : public MigrationError {
  public:
    PhaseFailure(FailureCause failure_cause, const std::string& msg)
      : MigrationError(msg), cause(failure_cause) {}
    FailureCause cause;
  };

  void transition(TransferState next);
  Preflight preflight();
  void probe_agent();
  std::uint64_t measure_destination();
  std::uint64_t resolve_resume_offset(std::uint64_t source_bytes);
  void backup_metadata(const Preflight& plan);
  std::uint64_t transfer(const Preflight& plan);
  std::uint16_t await_ready(RemoteProcess& listener);
  std::uint64_t await_done(RemoteProcess& listener);
  std::string drain_agent_error(RemoteProcess& listener);
  ValidationReport validate(const Preflight& plan);

  TransferOutcome fail(TransferOutcome outcome, FailureCause cause, const std::string& message);
  void notify(const std::string& subject, const std::string& body);
  void clear_checkpoint();

  const TransferConfiguration config_;
  RemoteExecutor& executor_;
  Confirmer& confirmer_;
  NotificationSink& notifier_;
  KeySource& key_source_;
  std::shared_ptr<Logger> logger_;

  CheckpointStore store_;
  KeyRing keys_;
  TransferState state_ = TransferState::Idle;
  std::vector<TransferState> history_;
  bool notifications_armed_ = false;
};
