#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

class build_trigger;

struct schedule_rule {
  std::string name;
  std::string description;
  std::string expression;  // rate(...)
  std::string target_job;
};

// Whatever fires rules: a cloud event bus, cron, or a file another tool reads.
class schedule_backend {
 public:
  virtual ~schedule_backend() = default;
  virtual void create_rule(schedule_rule const &rule) = 0;
};

// rate(N minute|minutes|hour|hours|day|days) in the largest whole unit. Throws
// configuration_error for intervals under a minute or not a whole number of minutes.
std::string schedule_rate_expression(std::chrono::seconds interval);

// Zero interval: nothing is created and nullopt is returned. Otherwise binds the trigger
// and creates exactly one rule firing its job. Firings never check whether the recipe
// changed.
std::optional<schedule_rule> rebuild_schedule_arm(build_trigger &trigger,
                                                  schedule_backend &backend);

// Persists rules as a JSON array.
class file_schedule_backend : public schedule_backend {
 public:
  explicit file_schedule_backend(std::filesystem::path path);

  void create_rule(schedule_rule const &rule) override;
  std::vector<schedule_rule> const &rules() const { return rules_; }

 private:
  void flush() const;

  std::filesystem::path path_;
  std::vector<schedule_rule> rules_;
};

}  // namespace kiln
