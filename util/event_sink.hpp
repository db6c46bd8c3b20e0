#ifndef UTIL_EVENT_SINK_HPP
#define UTIL_EVENT_SINK_HPP

#include <map>
#include <memory>
#include <string>

namespace util {

// Destination for structured events and metrics. Implementations may throw;
// callers go through SafeLog and SafeRecordMetric, which never do.
class EventSink {
 public:
  using Fields = std::map<std::string, std::string>;

  virtual void Log(const std::string& event, const Fields& fields) = 0;
  virtual void RecordMetric(const std::string& name, double value,
                            const Fields& tags) = 0;

  EventSink() = default;
  virtual ~EventSink() = default;
  EventSink(const EventSink&) = delete;
  EventSink& operator=(const EventSink&) = delete;
  EventSink(EventSink&&) = delete;
  EventSink& operator=(EventSink&&) = delete;
};

// Writes events and metrics to the glog INFO log, one line each.
class LoggingEventSink : public EventSink {
 public:
  void Log(const std::string& event, const Fields& fields) override;
  void RecordMetric(const std::string& name, double value,
                    const Fields& tags) override;
};

// Shared default sink.
std::shared_ptr<EventSink> DefaultEventSink();

// Fire-and-forget wrappers: failures of the sink are logged and dropped.
void SafeLog(EventSink* sink, const std::string& event,
             const EventSink::Fields& fields);
void SafeRecordMetric(EventSink* sink, const std::string& name, double value,
                      const EventSink::Fields& tags);

}  // namespace util

#endif
