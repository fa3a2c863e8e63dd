//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

//
// ... edgekit header files
//
#include <edgekit/data/Edge_index.hpp>
#include <edgekit/data/log.hpp>

namespace edgekit::testing {

  using edgekit::data::detail::Edge_index;
  using edgekit::data::detail::Log_level;
  using edgekit::data::detail::Log_record;
  using edgekit::data::detail::Logger;
  using edgekit::data::detail::Sort_order;
  using edgekit::data::detail::Validation_error;

  using edgekit::data::detail::log_level_from_string;

  namespace {

    // Captures records for the duration of a test and restores the
    // logger afterwards.
    class Log_capture {
    public:
      explicit Log_capture(Log_level level)
          : previous_(Logger::instance().level()) {
        auto& logger = Logger::instance();
        logger.set_level(level);
        logger.set_sink(&stream_);
        logger.add_handler([this](Log_record const& record) { records_.push_back(record); });
      }

      ~Log_capture() {
        auto& logger = Logger::instance();
        logger.clear_handlers();
        logger.set_sink(&std::clog);
        logger.set_level(previous_);
      }

      std::vector<Log_record> const&
      records() const { return records_; }

      std::string
      text() const { return stream_.str(); }

    private:
      Log_level previous_;
      std::ostringstream stream_;
      std::vector<Log_record> records_;
    };

  } // end of anonymous namespace

  TEST_CASE("log - level names", "[log]")
  {
    CHECK(log_level_from_string("debug") == Log_level::debug);
    CHECK(log_level_from_string("INFO") == Log_level::info);
    CHECK(log_level_from_string("warn") == Log_level::warning);
    CHECK(log_level_from_string("Warning") == Log_level::warning);
    CHECK(log_level_from_string("error") == Log_level::error);
    CHECK(log_level_from_string("off") == Log_level::off);
    CHECK_FALSE(log_level_from_string("verbose").has_value());
  }

  TEST_CASE("log - records at or above the level", "[log]")
  {
    Log_capture capture{Log_level::warning};

    EDGEKIT_LOG_DEBUG("hidden " << 1);
    EDGEKIT_LOG_INFO("hidden " << 2);
    EDGEKIT_LOG_WARNING("shown " << 3);
    EDGEKIT_LOG_ERROR("shown " << 4);

    REQUIRE(capture.records().size() == 2);
    CHECK(capture.records()[0].level == Log_level::warning);
    CHECK(capture.records()[0].message == "shown 3");
    CHECK(capture.records()[1].level == Log_level::error);
    CHECK(capture.records()[1].line > 0);
    CHECK(capture.text() == "[edgekit] [WARN] shown 3\n[edgekit] [ERROR] shown 4\n");
  }

  TEST_CASE("log - off silences everything", "[log]")
  {
    Log_capture capture{Log_level::off};
    EDGEKIT_LOG_ERROR("never");
    CHECK(capture.records().empty());
    CHECK_FALSE(Logger::instance().enabled(Log_level::error));
  }

  TEST_CASE("log - handlers may log", "[log]")
  {
    Log_capture capture{Log_level::info};
    Logger::instance().add_handler([](Log_record const& record) {
      if (record.level == Log_level::error) {
        EDGEKIT_LOG_INFO("forwarded: " << record.message);
      }
    });

    EDGEKIT_LOG_ERROR("boom");

    CHECK(capture.text().find("[edgekit] [ERROR] boom") != std::string::npos);
    CHECK(capture.text().find("[edgekit] [INFO] forwarded: boom") != std::string::npos);
    REQUIRE(capture.records().size() == 2);
    CHECK(capture.records()[0].message == "boom");
    CHECK(capture.records()[1].message == "forwarded: boom");
  }

  TEST_CASE("log - cache fills are logged at debug", "[log]")
  {
    Log_capture capture{Log_level::debug};

    Edge_index<> index{{{0, 1, 1, 2}, {1, 0, 2, 1}}, {3, 3}, Sort_order::row};
    index.get_indptr();

    REQUIRE_FALSE(capture.records().empty());
    CHECK(capture.records().front().level == Log_level::debug);
    CHECK(capture.records().front().message.find("indptr") != std::string::npos);
  }

  TEST_CASE("log - failed validation is logged at info", "[log]")
  {
    Log_capture capture{Log_level::info};

    Edge_index<> index{{{0, 3}, {1, 0}}, {3, 3}};
    CHECK_THROWS_AS(index.validate(), Validation_error);

    REQUIRE(capture.records().size() == 1);
    CHECK(capture.records()[0].level == Log_level::info);
    CHECK(capture.records()[0].message.find("bounds") != std::string::npos);
  }

} // end of namespace edgekit::testing
