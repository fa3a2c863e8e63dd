#include <edgekit/data/log.hpp>

//
// ... Standard header files
//
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

//
// ... edgekit header files
//
#include <edgekit/config.hpp>

namespace edgekit::data::detail {

  namespace {

    Log_level
    initial_level()
    {
      if (char const* env = std::getenv("EDGEKIT_LOG_LEVEL")) {
        if (auto level = log_level_from_string(env)) { return *level; }
      }
      return log_level_from_string(config::default_log_level).value_or(Log_level::warning);
    }

  } // end of anonymous namespace

  char const*
  to_string(Log_level level)
  {
    switch (level) {
      case Log_level::debug: return "DEBUG";
      case Log_level::info: return "INFO";
      case Log_level::warning: return "WARN";
      case Log_level::error: return "ERROR";
      case Log_level::off: return "OFF";
    }
    return "UNKNOWN";
  }

  std::optional<Log_level>
  log_level_from_string(std::string_view name)
  {
    std::string lower(name);
    std::transform(begin(lower), end(lower), begin(lower), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") { return Log_level::debug; }
    if (lower == "info") { return Log_level::info; }
    if (lower == "warning" || lower == "warn") { return Log_level::warning; }
    if (lower == "error") { return Log_level::error; }
    if (lower == "off") { return Log_level::off; }
    return std::nullopt;
  }

  Logger&
  Logger::instance()
  {
    static Logger logger;
    return logger;
  }

  Logger::Logger()
    : level_(initial_level())
    , sink_(&std::clog)
  {}

  void
  Logger::set_level(Log_level level)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
  }

  Log_level
  Logger::level() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
  }

  bool
  Logger::enabled(Log_level level) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != Log_level::off && level >= level_;
  }

  void
  Logger::set_sink(std::ostream* sink)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
  }

  void
  Logger::add_handler(Handler handler)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
  }

  void
  Logger::clear_handlers()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
  }

  void
  Logger::log(Log_level level, std::string const& message, char const* file, int line)
  {
    std::vector<Handler> handlers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (level == Log_level::off || level < level_) { return; }

      if (sink_) {
        *sink_ << "[edgekit] [" << to_string(level) << "] " << message << '\n';
      }
      handlers = handlers_;
    }

    // Handlers run unlocked so that they may log themselves.
    Log_record record{level, message, file, line};
    for (auto const& handler : handlers) {
      handler(record);
    }
  }

} // end of namespace edgekit::data::detail
