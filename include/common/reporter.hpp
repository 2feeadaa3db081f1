#pragma once
#include <string>

// Reporting capability handed to every component instead of a global logger,
// so each one can be driven and observed in isolation.
class Reporter {
public:
  virtual ~Reporter() = default;
  virtual void Debug(const std::string& message) = 0;
  virtual void Info(const std::string& message) = 0;
  virtual void Warning(const std::string& message) = 0;
  virtual void Error(const std::string& message) = 0;
};

// Forwards to the process-wide Logger, tagging each line with a component name.
class LogReporter : public Reporter {
public:
  explicit LogReporter(std::string component) : component_(std::move(component)) {}
  void Debug(const std::string& message) override;
  void Info(const std::string& message) override;
  void Warning(const std::string& message) override;
  void Error(const std::string& message) override;
private:
  std::string component_;
  std::string Tag(const std::string& message) const { return "[" + component_ + "] " + message; }
};
