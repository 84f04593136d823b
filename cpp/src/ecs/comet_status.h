#ifndef COMET_STATUS_H
#define COMET_STATUS_H

#include <stdexcept>
#include <string>

namespace comet {

// Outcome of pool and lookup operations. Routine conditions (cooldown
// active, pool empty, stale handle) are values, never exceptions.
enum class Status {
  Ok,
  ResourceExhausted, // Pool empty or owner still cooling down
  UnknownEntity      // Handle has no backing entity (already recycled)
};

template <class T> struct [[nodiscard]] Result {
  Status status;
  T value;

  bool ok() const { return status == Status::Ok; }
};

inline const char *status_name(Status s) {
  switch (s) {
  case Status::Ok:
    return "Ok";
  case Status::ResourceExhausted:
    return "ResourceExhausted";
  case Status::UnknownEntity:
    return "UnknownEntity";
  }
  return "?";
}

// InvalidConfiguration: thrown at construction only. A bad pool size or a
// malformed tier table is a setup error, not a runtime condition.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &what)
      : std::invalid_argument("[CometEngine] invalid configuration: " + what) {
  }
};

} // namespace comet

#endif // COMET_STATUS_H
