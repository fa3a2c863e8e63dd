#pragma once

//
// ... Standard header files
//
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace edgekit::data::detail {

  enum class Log_level : int { debug = 0, info = 1, warning = 2, error = 3, off = 4 };

  char const*
  to_string(Log_level level);

  /**
   * @brief Parse a level name ("debug", "info", "warning"/"warn",
   *        "error", "off"), ignoring case.
   */
  std::optional<Log_level>
  log_level_from_string(std::string_view name);

  struct Log_record {
    Log_level level;
    std::string message;
    char const* file;
    int line;
  };

  /**
   * @brief Process-wide logger.
   *
   * The initial level comes from the EDGEKIT_LOG_LEVEL environment
   * variable, falling back to config::default_log_level. Records at or
   * above the level are written to the sink stream (std::clog unless
   * replaced) and passed to every installed handler.
   */
  class Logger final {
  public:
    using Handler = std::function<void(Log_record const&)>;

    static Logger&
    instance();

    Logger(Logger const&) = delete;
    Logger&
    operator=(Logger const&) = delete;

    void
    set_level(Log_level level);

    Log_level
    level() const;

    bool
    enabled(Log_level level) const;

    /// Replace the output stream; nullptr silences stream output.
    void
    set_sink(std::ostream* sink);

    void
    add_handler(Handler handler);

    void
    clear_handlers();

    void
    log(Log_level level, std::string const& message, char const* file = "", int line = 0);

  private:
    Logger();

    mutable std::mutex mutex_;
    Log_level level_;
    std::ostream* sink_;
    std::vector<Handler> handlers_;

  }; // end of class Logger

} // end of namespace edgekit::data::detail

#define EDGEKIT_LOG(level, message)                                                \
  do {                                                                             \
    auto& edgekit_logger_ = ::edgekit::data::detail::Logger::instance();           \
    if (edgekit_logger_.enabled(level)) {                                          \
      std::ostringstream edgekit_log_stream_;                                      \
      edgekit_log_stream_ << message;                                              \
      edgekit_logger_.log(level, edgekit_log_stream_.str(), __FILE__, __LINE__);   \
    }                                                                              \
  } while (false)

#define EDGEKIT_LOG_DEBUG(message) \
  EDGEKIT_LOG(::edgekit::data::detail::Log_level::debug, message)
#define EDGEKIT_LOG_INFO(message) \
  EDGEKIT_LOG(::edgekit::data::detail::Log_level::info, message)
#define EDGEKIT_LOG_WARNING(message) \
  EDGEKIT_LOG(::edgekit::data::detail::Log_level::warning, message)
#define EDGEKIT_LOG_ERROR(message) \
  EDGEKIT_LOG(::edgekit::data::detail::Log_level::error, message)
