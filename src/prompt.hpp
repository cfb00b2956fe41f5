#pragma once

#include <string>

class Confirmer {
public:
  virtual ~Confirmer() = default;
  // True only for an explicit "yes".
  virtual bool confirm(const std::string& question) = 0;
};

// Asks on the terminal through GNU readline.
class ReadlineConfirmer : public Confirmer {
public:
  bool confirm(const std::string& question) override;
};

// For --yes and for tests.
class AutoConfirmer : public Confirmer {
public:
  explicit AutoConfirmer(bool answer = true) : answer_(answer) {}
  bool confirm(const std::string&) override {
    ++asked_;
    return answer_;
  }
  int asked() const { return asked_; }

private:
  bool answer_;
  int asked_ = 0;
};
