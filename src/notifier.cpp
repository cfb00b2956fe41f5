#include "notifier.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "process.hpp"

MailNotifier::MailNotifier(std::string address, std::shared_ptr<Logger> logger)
  : address_(std::move(address)), logger_(std::move(logger)) {}

void MailNotifier::notify(const std::string& subject, const std::string& body) {
  if(address_.empty()) return;
  if(!executable_in_path("mail")) {
    log_warn(logger_.get(), "Cannot send notification to {}: 'mail' is not installed", address_);
    return;
  }
  try {
    auto child = ChildProcess::spawn({"mail", "-s", subject, address_});
    child->write_stdin(body + "\n");
    child->close_stdin();
    int status = child->wait();
    if(status != 0) {
      log_warn(logger_.get(), "mail exited with status {} while notifying {}", status, address_);
    } else {
      log_info(logger_.get(), "Notification sent to {}", address_);
    }
  } catch(const MigrationError& e) {
    log_warn(logger_.get(), "Notification to {} failed: {}", address_, e.what());
  }
}
