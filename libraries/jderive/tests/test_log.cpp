#include "test_util.hpp"

#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace jderive;

namespace logged
{
   struct Sample
   {
      std::int32_t a;
   };
   JDERIVE_REFLECT(Sample, a)

   struct Clash
   {
      std::int32_t a;
      std::int32_t b;
   };
   JDERIVE_REFLECT(Clash, a, key(b, "a"))
}  // namespace logged

namespace
{
   struct log_entry
   {
      std::string channel;
      std::string message;
   };

   class capture_backend
       : public boost::log::sinks::basic_sink_backend<boost::log::sinks::synchronized_feeding>
   {
     public:
      void consume(const boost::log::record_view& rec)
      {
         log_entry entry;
         if (auto channel = boost::log::extract<std::string>("Channel", rec))
            entry.channel = *channel;
         if (auto message = boost::log::extract<std::string>("Message", rec))
            entry.message = *message;
         entries.push_back(std::move(entry));
      }

      std::vector<log_entry> entries;
   };

   // Collects every record that reaches the core while it is alive
   struct captured_log
   {
      using sink_t = boost::log::sinks::synchronous_sink<capture_backend>;

      captured_log() : backend(boost::make_shared<capture_backend>())
      {
         sink = boost::make_shared<sink_t>(backend);
         boost::log::core::get()->add_sink(sink);
      }
      ~captured_log() { boost::log::core::get()->remove_sink(sink); }

      bool contains(const std::string& channel, const std::string& text) const
      {
         return std::any_of(backend->entries.begin(), backend->entries.end(),
                            [&](const log_entry& e)
                            {
                               return e.channel == channel &&
                                      e.message.find(text) != std::string::npos;
                            });
      }

      std::size_t count(const std::string& channel) const
      {
         return std::count_if(backend->entries.begin(), backend->entries.end(),
                              [&](const log_entry& e) { return e.channel == channel; });
      }

      boost::shared_ptr<capture_backend> backend;
      boost::shared_ptr<sink_t>          sink;
   };
}  // namespace

TEST_CASE("log level does not filter application records")
{
   captured_log       log;
   derivation_session session;
   load_options(R"({"log_level":"error"})");

   boost::log::sources::logger host;
   BOOST_LOG(host) << "application record";
   CHECK(log.contains("", "application record"));

   loggers::configure(loggers::level::warning);
}

TEST_CASE("derivation records carry the jderive channel")
{
   captured_log log;
   loggers::configure(loggers::level::debug);
   derivation_session session;
   session.derive<logged::Sample>();
   CHECK(log.contains("jderive", "Deriving logged::Sample"));
   CHECK(log.contains("jderive", "Derived logged::Sample"));

   loggers::configure(loggers::level::warning);
}

TEST_CASE("log level suppresses jderive records below it")
{
   captured_log log;
   loggers::configure(loggers::level::error);
   CHECK(!loggers::enabled(loggers::level::warning));
   CHECK(loggers::enabled(loggers::level::error));

   derivation_session session;
   CHECK_THROWS_AS(session.derive<logged::Clash>(), derivation_error);
   CHECK(log.count("jderive") == 0);

   loggers::configure(loggers::level::warning);
   CHECK(loggers::enabled(loggers::level::warning));
   CHECK(!loggers::enabled(loggers::level::info));
   CHECK_THROWS_AS(session.derive<logged::Clash>(), derivation_error);
   CHECK(log.count("jderive") == 1);
}
