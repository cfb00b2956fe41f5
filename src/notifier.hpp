#pragma once

#include <memory>
#include <string>

class Logger;

// Fire-and-forget; implementations never throw.
class NotificationSink {
public:
  virtual ~NotificationSink() = default;
  virtual void notify(const std::string& subject, const std::string& body) = 0;
};

// Pipes the body into `mail -s <subject> <address>`. Does nothing when no
// address is configured; failures are logged as warnings.
class MailNotifier : public NotificationSink {
public:
  MailNotifier(std::string address, std::shared_ptr<Logger> logger = nullptr);
  void notify(const std::string& subject, const std::string& body) override;

private:
  std::string address_;
  std::shared_ptr<Logger> logger_;
};
