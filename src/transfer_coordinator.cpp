#include "transfer_coordinator.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "agent.hpp"
#include "capacity_validator.hpp"
#include "errors.hpp"
#include "extent.hpp"
#include "log.hpp"
#include "notifier.hpp"
#include "progress_monitor.hpp"
#include "prompt.hpp"
#include "protocol.hpp"
#include "remote_executor.hpp"
#include "sender.hpp"

namespace {

std::uint64_t parse_decimal(const std::string& text) {
  if(text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw TransportError("expected a byte count, got '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch(const std::out_of_range&) {
    throw TransportError("byte count '" + text + "' is out of range");
  }
}

std::string bool_flag(bool value) {
  return value ? "true" : "false";
}

} // namespace

const char* transfer_state_name(TransferState state) {
  switch(state) {
    case TransferState::Idle: return "Idle";
    case TransferState::ListenerStarting: return "ListenerStarting";
    case TransferState::ListenerReady: return "ListenerReady";
    case TransferState::SenderRunning: return "SenderRunning";
    case TransferState::Completed: return "Completed";
    case TransferState::Failed: return "Failed";
  }
  return "Unknown";
}

const char* failure_cause_name(FailureCause cause) {
  switch(cause) {
    case FailureCause::None: return "None";
    case FailureCause::InsufficientCapacity: return "InsufficientCapacity";
    case FailureCause::MisalignedOffset: return "MisalignedOffset";
    case FailureCause::StateMismatch: return "StateMismatch";
    case FailureCause::InvalidConfiguration: return "InvalidConfiguration";
    case FailureCause::DependencyMissing: return "DependencyMissing";
    case FailureCause::ListenerUnreachable: return "ListenerUnreachable";
    case FailureCause::SenderFailed: return "SenderFailed";
    case FailureCause::ReceiverFailed: return "ReceiverFailed";
    case FailureCause::ValidationMismatch: return "ValidationMismatch";
  }
  return "Unknown";
}

int TransferOutcome::exit_code() const {
  if(kind != Kind::Failed) return 0;
  switch(cause) {
    case FailureCause::ListenerUnreachable:
    case FailureCause::SenderFailed:
    case FailureCause::ReceiverFailed:
      return 2;
    case FailureCause::ValidationMismatch:
      return 3;
    default:
      return 1;
  }
}

TransferCoordinator::TransferCoordinator(TransferConfiguration config,
                                         RemoteExecutor& executor,
                                         Confirmer& confirmer,
                                         NotificationSink& notifier,
                                         KeySource& key_source,
                                         std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    executor_(executor),
    confirmer_(confirmer),
    notifier_(notifier),
    key_source_(key_source),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")),
    store_(config_.state_dir, logger_) {
  history_.push_back(state_);
}

void TransferCoordinator::transition(TransferState next) {
  log_debug(logger_.get(), "State {} -> {}", transfer_state_name(state_), transfer_state_name(next));
  state_ = next;
  history_.push_back(next);
}

TransferOutcome TransferCoordinator::fail(TransferOutcome outcome, FailureCause cause, const std::string& message) {
  transition(TransferState::Failed);
  outcome.kind = TransferOutcome::Kind::Failed;
  outcome.final_state = TransferState::Failed;
  outcome.cause = cause;
  outcome.message = message;
  log_error(logger_.get(), "Migration {} failed ({}): {}", config_.describe(), failure_cause_name(cause), message);
  return outcome;
}

void TransferCoordinator::notify(const std::string& subject, const std::string& body) {
  if(notifications_armed_) {
    notifier_.notify(subject, body);
  }
}

void TransferCoordinator::clear_checkpoint() {
  try {
    store_.clear(config_.source_id, config_.dest_id, config_.host);
  } catch(const MigrationError& e) {
    log_warn(logger_.get(), "Could not clear checkpoint: {}", e.what());
  }
}

void TransferCoordinator::probe_agent() {
  auto result = executor_.execute(config_.host, agent_command(config_.remote_binary, "probe", {}));
  if(result.exit_code != 0 || result.first_line() != "ok") {
    throw DependencyError("'" + config_.remote_binary + "' is not usable on " + config_.host +
                          " (exit " + std::to_string(result.exit_code) + "); install it on the destination");
  }
}

std::uint64_t TransferCoordinator::measure_destination() {
  auto result = executor_.execute(config_.host,
                                  agent_command(config_.remote_binary, "size", {{"path", config_.dest_id}}));
  auto line = parse_agent_line(result.first_line());
  if(result.exit_code != 0 || line.kind == AgentLine::Kind::Error) {
    throw ConfigurationError("cannot measure " + config_.host + ":" + config_.dest_id + ": " +
                             (line.payload.empty() ? std::string("no output") : line.payload));
  }
  return parse_decimal(line.payload);
}

std::uint64_t TransferCoordinator::resolve_resume_offset(std::uint64_t source_bytes) {
  if(config_.offset_override) {
    log_info(logger_.get(), "Using explicit offset {}", *config_.offset_override);
    return *config_.offset_override;
  }
  if(!config_.resume) return 0;

  auto record = store_.load(config_.source_id, config_.dest_id, config_.host);
  if(!record) {
    log_info(logger_.get(), "No checkpoint for {}, starting from the beginning", config_.describe());
    return 0;
  }
  if(record->total_bytes != source_bytes) {
    throw ConfigurationError("checkpoint was taken for a " + std::to_string(record->total_bytes) +
                             " byte source but the source now has " + std::to_string(source_bytes) + " bytes");
  }
  log_info(logger_.get(), "Resuming {} from offset {}", config_.describe(), record->byte_offset);
  return record->byte_offset;
}

TransferCoordinator::Preflight TransferCoordinator::preflight() {
  Preflight plan;
  probe_agent();

  plan.source_path = resolve_extent_path(config_.source_id);
  plan.source_bytes = extent_size(plan.source_path);
  plan.dest_bytes = measure_destination();
  log_info(logger_.get(), "Source {}: {} bytes, destination {}:{}: {} bytes",
           plan.source_path, plan.source_bytes, config_.host, config_.dest_id, plan.dest_bytes);

  CapacityValidator::validate(Extent{config_.source_id, plan.source_bytes},
                              Extent{config_.dest_id, plan.dest_bytes});

  plan.resume_offset = resolve_resume_offset(plan.source_bytes);
  if(plan.resume_offset % config_.block_size != 0) {
    throw MisalignedOffsetError(plan.resume_offset, config_.block_size);
  }
  if(plan.resume_offset > plan.source_bytes) {
    throw ConfigurationError("offset " + std::to_string(plan.resume_offset) +
                             " is past the end of the source (" + std::to_string(plan.source_bytes) + " bytes)");
  }

  PipelineBuilder builder(keys_, key_source_);
  plan.pipelines = builder.build(config_);
  log_info(logger_.get(), "Sender pipeline: {}", describe_stages(plan.pipelines.sender));
  log_info(logger_.get(), "Receiver pipeline: {}", describe_stages(plan.pipelines.receiver));
  return plan;
}

void TransferCoordinator::backup_metadata(const Preflight& plan) {
  auto local = backup_extent_head(plan.source_path, config_.backup_dir);
  log_info(logger_.get(), "Backed up source partition table to {}", local.string());

  auto result = executor_.execute(config_.host, agent_command(config_.remote_binary, "backup", {
    {"path", config_.dest_id},
    {"backup_dir", config_.backup_dir.string()}
  }));
  auto line = parse_agent_line(result.first_line());
  if(result.exit_code != 0 || line.kind == AgentLine::Kind::Error) {
    throw ExtentIoError("destination metadata backup failed: " + line.payload);
  }
  log_info(logger_.get(), "Backed up destination partition table to {}:{}", config_.host, line.payload);
}

std::uint16_t TransferCoordinator::await_ready(RemoteProcess& listener) {
  auto deadline = std::chrono::steady_clock::now() + config_.listener_timeout;
  for(;;) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if(remaining.count() <= 0) remaining = std::chrono::milliseconds(0);
    auto read = listener.read_line(remaining);
    if(read.status == LineRead::Status::Timeout) {
      throw PhaseFailure{FailureCause::ListenerUnreachable,
        "receiver did not report ready within " + std::to_string(config_.listener_timeout.count()) + " ms"};
    }
    if(read.status == LineRead::Status::Closed) {
      int status = listener.wait();
      throw PhaseFailure{FailureCause::ListenerUnreachable,
        "receiver exited with status " + std::to_string(status) + " before becoming ready"};
    }
    auto line = parse_agent_line(read.line);
    if(line.kind == AgentLine::Kind::Ready) {
      try {
        auto port = parse_decimal(line.payload);
        if(port == 0 || port > 65535) throw TransportError("port out of range");
        return static_cast<std::uint16_t>(port);
      } catch(const TransportError& e) {
        throw PhaseFailure{FailureCause::ListenerUnreachable,
          "receiver sent a bad ready line '" + read.line + "': " + e.what()};
      }
    }
    if(line.kind == AgentLine::Kind::Error) {
      throw PhaseFailure{FailureCause::ListenerUnreachable, "receiver failed to start: " + line.payload};
    }
    log_debug(logger_.get(), "receiver: {}", read.line);
  }
}

std::uint64_t TransferCoordinator::await_done(RemoteProcess& listener) {
  for(;;) {
    auto read = listener.read_line(config_.listener_timeout);
    if(read.status == LineRead::Status::Timeout) {
      throw PhaseFailure{FailureCause::ReceiverFailed, "receiver did not confirm completion"};
    }
    if(read.status == LineRead::Status::Closed) {
      throw PhaseFailure{FailureCause::ReceiverFailed,
        "receiver exited with status " + std::to_string(listener.wait()) + " without confirming"};
    }
    auto line = parse_agent_line(read.line);
    if(line.kind == AgentLine::Kind::Done) {
      try {
        return parse_decimal(line.payload);
      } catch(const TransportError& e) {
        throw PhaseFailure{FailureCause::ReceiverFailed, e.what()};
      }
    }
    if(line.kind == AgentLine::Kind::Error) {
      throw PhaseFailure{FailureCause::ReceiverFailed, "receiver: " + line.payload};
    }
    log_debug(logger_.get(), "receiver: {}", read.line);
  }
}

std::string TransferCoordinator::drain_agent_error(RemoteProcess& listener) {
  auto read = listener.read_line(std::chrono::milliseconds(2000));
  while(read.status == LineRead::Status::Line) {
    auto line = parse_agent_line(read.line);
    if(line.kind == AgentLine::Kind::Error) return line.payload;
    read = listener.read_line(std::chrono::milliseconds(2000));
  }
  return {};
}

std::uint64_t TransferCoordinator::transfer(const Preflight& plan) {
  const std::uint64_t length = plan.source_bytes - plan.resume_offset;
  const bool encrypt = config_.encrypt;
  const auto key_ref = PipelineBuilder::key_reference(config_);

  transition(TransferState::ListenerStarting);
  AgentOptions options{
    {"dest", config_.dest_id},
    {"offset", std::to_string(plan.resume_offset)},
    {"length", std::to_string(length)},
    {"block_size", std::to_string(config_.block_size)},
    {"compress", bool_flag(config_.compress)},
    {"encrypt", bool_flag(encrypt)},
    {"transfer_port", std::to_string(config_.transfer_port)},
    {"listen_ip", config_.listen_ip},
    {"accept_timeout_ms", std::to_string(config_.accept_timeout.count())},
    {"progress_interval", std::to_string(config_.progress_interval)}
  };
  if(encrypt) options.emplace_back("key_id", key_ref);

  std::unique_ptr<RemoteProcess> listener;
  try {
    listener = executor_.start(config_.host, agent_command(config_.remote_binary, "receive", options));
    if(encrypt) {
      listener->write_stdin(keys_.at(key_ref).to_hex() + "\n");
    }
    listener->close_stdin();
  } catch(const MigrationError& e) {
    throw PhaseFailure{FailureCause::ListenerUnreachable, e.what()};
  }

  std::uint16_t port = 0;
  try {
    port = await_ready(*listener);
  } catch(const PhaseFailure&) {
    listener->terminate();
    throw;
  } catch(const MigrationError& e) {
    listener->terminate();
    throw PhaseFailure{FailureCause::ListenerUnreachable, e.what()};
  }
  transition(TransferState::ListenerReady);
  log_info(logger_.get(), "Receiver ready on {}:{}", config_.host, port);

  transition(TransferState::SenderRunning);
  CheckpointRecord base;
  base.source_id = config_.source_id;
  base.dest_id = config_.dest_id;
  base.host = config_.host;
  base.byte_offset = plan.resume_offset;
  base.total_bytes = plan.source_bytes;
  base.block_size = config_.block_size;
  ProgressMonitor monitor(store_, base, config_.checkpoint_interval, logger_);
  monitor.start();

  SenderOptions sender_options;
  sender_options.host = config_.host;
  sender_options.port = port;
  sender_options.source_path = plan.source_path;
  sender_options.offset = plan.resume_offset;
  sender_options.length = length;
  sender_options.stages = plan.pipelines.sender;
  ExtentSender sender(sender_options, keys_, logger_);

  SenderResult sent;
  try {
    sent = sender.run([&monitor](std::uint64_t confirmed){
      monitor.observe(confirmed);
    });
  } catch(const MigrationError& e) {
    monitor.stop();
    // keep whatever the receiver confirmed since the last timer tick
    monitor.tick();
    std::string message = e.what();
    auto remote = drain_agent_error(*listener);
    listener->terminate();
    if(!remote.empty()) {
      throw PhaseFailure{FailureCause::ReceiverFailed, remote + " (sender: " + message + ")"};
    }
    throw PhaseFailure{FailureCause::SenderFailed, message};
  }
  monitor.stop();

  std::uint64_t written = 0;
  try {
    written = await_done(*listener);
  } catch(const PhaseFailure&) {
    listener->terminate();
    throw;
  } catch(const MigrationError& e) {
    listener->terminate();
    throw PhaseFailure{FailureCause::ReceiverFailed, e.what()};
  }
  int status = listener->wait();
  if(status != 0) {
    throw PhaseFailure{FailureCause::ReceiverFailed, "receiver exited with status " + std::to_string(status)};
  }
  if(written != length) {
    throw PhaseFailure{FailureCause::ReceiverFailed,
      "receiver wrote " + std::to_string(written) + " of " + std::to_string(length) + " bytes"};
  }
  keys_.erase(key_ref);
  log_debug(logger_.get(), "{} bytes on the wire for {} source bytes", sent.bytes_on_wire, sent.bytes_consumed);
  return written;
}

ValidationReport TransferCoordinator::validate(const Preflight& plan) {
  log_info(logger_.get(), "Validating transfer with sampled checksums (this may take a while)");
  LocalDigestSource source(plan.source_path);
  RemoteDigestSource dest(executor_, config_.host, config_.remote_binary, config_.dest_id);
  Validator validator(source, dest, config_.sample_size, config_.sample_block, logger_);
  return validator.validate(plan.source_bytes);
}

TransferOutcome TransferCoordinator::run() {
  auto started = std::chrono::steady_clock::now();
  TransferOutcome outcome;
  const std::string what = config_.describe();

  std::optional<TransferLock> lock;
  Preflight plan;
  try {
    config_.require_migration_fields();
    if(!config_.dry_run) {
      lock.emplace(config_.state_dir, config_.source_id, config_.dest_id, config_.host);
    }
    plan = preflight();
  } catch(const InsufficientCapacityError& e) {
    return fail(outcome, FailureCause::InsufficientCapacity, e.what());
  } catch(const MisalignedOffsetError& e) {
    return fail(outcome, FailureCause::MisalignedOffset, e.what());
  } catch(const StateMismatchError& e) {
    return fail(outcome, FailureCause::StateMismatch, e.what());
  } catch(const ConfigurationError& e) {
    return fail(outcome, FailureCause::InvalidConfiguration, e.what());
  } catch(const DependencyError& e) {
    return fail(outcome, FailureCause::DependencyMissing, e.what());
  } catch(const ExtentIoError& e) {
    return fail(outcome, FailureCause::InvalidConfiguration, e.what());
  } catch(const TransportError& e) {
    return fail(outcome, FailureCause::ListenerUnreachable, e.what());
  } catch(const PipelineError& e) {
    return fail(outcome, FailureCause::InvalidConfiguration, e.what());
  }

  outcome.source_bytes = plan.source_bytes;
  outcome.dest_bytes = plan.dest_bytes;
  outcome.resume_offset = plan.resume_offset;
  outcome.pipelines = plan.pipelines;

  if(config_.dry_run) {
    log_info(logger_.get(), "DRY RUN: would send {} bytes of {} from offset {} to {}:{} on port {}",
             plan.source_bytes - plan.resume_offset, plan.source_path, plan.resume_offset,
             config_.host, config_.dest_id, config_.transfer_port);
    log_info(logger_.get(), "DRY RUN completed. No data was transferred.");
    outcome.kind = TransferOutcome::Kind::DryRun;
    outcome.final_state = state_;
    return outcome;
  }

  if(!config_.assume_yes) {
    auto question = fmt::format("Proceed with cloning {} ({} bytes from offset {}) to {}:{}? "
                                "Everything on the destination will be overwritten.",
                                plan.source_path, plan.source_bytes, plan.resume_offset,
                                config_.host, config_.dest_id);
    if(!confirmer_.confirm(question)) {
      log_info(logger_.get(), "Operation cancelled by user.");
      outcome.kind = TransferOutcome::Kind::Cancelled;
      outcome.final_state = state_;
      return outcome;
    }
  }
  notifications_armed_ = true;

  if(config_.backup_metadata) {
    try {
      backup_metadata(plan);
    } catch(const MigrationError& e) {
      auto failed = fail(outcome, FailureCause::InvalidConfiguration,
                         std::string(e.what()) + " (pass --backup_metadata=false to skip)");
      notify("Disk Migration Failed", "Disk migration from " + what + " did not start: " + failed.message);
      return failed;
    }
  }

  try {
    outcome.bytes_transferred = transfer(plan);
  } catch(const PhaseFailure& failure) {
    auto failed = fail(outcome, failure.cause, failure.what());
    notify("Disk Migration Failed", "Disk migration from " + what + " failed: " + failed.message +
           ". Resume with --continue.");
    return failed;
  }

  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  double seconds = std::max(0.001, static_cast<double>(outcome.elapsed.count()) / 1000.0);
  double rate = static_cast<double>(outcome.bytes_transferred) / seconds / (1024.0 * 1024.0);
  auto timing = fmt::format("{:.1f}s ({:.2f} MB/s)", seconds, rate);
  log_info(logger_.get(), "Transfer completed in {}", timing);

  clear_checkpoint();

  if(config_.validate) {
    outcome.validation = validate(plan);
    log_info(logger_.get(), "Validation: {}", outcome.validation->summary());
    if(!outcome.validation->passed()) {
      std::string failed_positions;
      for(auto position : outcome.validation->failures()) {
        if(!failed_positions.empty()) failed_positions += ", ";
        failed_positions += sample_position_name(position);
      }
      auto failed = fail(outcome, FailureCause::ValidationMismatch,
                         "checksum mismatch in " + failed_positions + " window(s)");
      notify("Disk Migration Failed", "Disk migration from " + what + " failed validation: " +
             outcome.validation->summary());
      return failed;
    }
    log_info(logger_.get(), "Transfer validation passed for all sample sections.");
  }

  transition(TransferState::Completed);
  outcome.kind = TransferOutcome::Kind::Completed;
  outcome.final_state = TransferState::Completed;
  outcome.message = "completed in " + timing;
  notify("Disk Migration Complete", "Disk migration from " + what + " completed successfully in " + timing + ".");
  return outcome;
}
