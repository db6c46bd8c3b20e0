#include "util/event_sink.hpp"

#include <exception>

#include "absl/strings/str_join.h"
#include "glog/logging.h"

namespace util {

namespace {
std::string FormatFields(const EventSink::Fields& fields) {
  return absl::StrJoin(fields, " ", absl::PairFormatter("="));
}
}  // namespace

void LoggingEventSink::Log(const std::string& event, const Fields& fields) {
  LOG(INFO) << "event=" << event << " " << FormatFields(fields);
}

void LoggingEventSink::RecordMetric(const std::string& name, double value,
                                    const Fields& tags) {
  LOG(INFO) << "metric=" << name << " value=" << value << " "
            << FormatFields(tags);
}

std::shared_ptr<EventSink> DefaultEventSink() {
  static std::shared_ptr<EventSink> sink =
      std::make_shared<LoggingEventSink>();
  return sink;
}

void SafeLog(EventSink* sink, const std::string& event,
             const EventSink::Fields& fields) {
  if (sink == nullptr) return;
  try {
    sink->Log(event, fields);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Dropping event " << event << ": " << e.what();
  }
}

void SafeRecordMetric(EventSink* sink, const std::string& name, double value,
                      const EventSink::Fields& tags) {
  if (sink == nullptr) return;
  try {
    sink->RecordMetric(name, value, tags);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Dropping metric " << name << ": " << e.what();
  }
}

}  // namespace util
