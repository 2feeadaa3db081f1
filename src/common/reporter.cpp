#include "common/reporter.hpp"
#include "common/logger.hpp"

void LogReporter::Debug(const std::string& message) { Logger::Debug(Tag(message), component_, 0); }
void LogReporter::Info(const std::string& message) { Logger::Info(Tag(message), component_, 0); }
void LogReporter::Warning(const std::string& message) { Logger::Warning(Tag(message), component_, 0); }
void LogReporter::Error(const std::string& message) { Logger::Error(Tag(message), component_, 0); }
