#include <catch2/catch_all.hpp>

#include "Error.h"
#include "LogManager.h"
#include "Logging/Logging.h"

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace cambus {
namespace logging {

namespace {

class StringLogSink : public LogSink
{
   std::mutex mutex_;
   std::string text_;

public:
   std::string GetText()
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return text_;
   }

protected:
   void Write(const std::string& formatted) override
   {
      std::lock_guard<std::mutex> lock(mutex_);
      text_ += formatted;
   }
};

std::string
ReadFile(const std::string& filename)
{
   std::ifstream file(filename.c_str());
   std::ostringstream contents;
   contents << file.rdbuf();
   return contents.str();
}

} // anonymous namespace

TEST_CASE("synchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeSynchronous);

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 1000; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("asynchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeAsynchronous);

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 1000; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("log stream basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   auto sink = std::make_shared<StringLogSink>();
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("mylabel");
   CHECK(lgr.GetLabel() == "mylabel");

   LOG_INFO(lgr) << 123 << "ABC" << 456;
   CHECK_THAT(sink->GetText(),
         Catch::Matchers::ContainsSubstring("[IFO,mylabel] 123ABC456"));
}


TEST_CASE("level filter drops lower levels", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   auto sink = std::make_shared<StringLogSink>();
   sink->SetFilter(std::make_shared<LevelFilter>(LogLevelWarning));
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("filtered");
   LOG_DEBUG(lgr) << "quiet";
   LOG_ERROR(lgr) << "loud";

   CHECK_THAT(sink->GetText(), !Catch::Matchers::ContainsSubstring("quiet"));
   CHECK_THAT(sink->GetText(), Catch::Matchers::ContainsSubstring(
            "[ERR,filtered] loud"));
}


TEST_CASE("flush waits for asynchronous sinks", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   auto sink = std::make_shared<StringLogSink>();
   c->AddSink(sink, SinkModeAsynchronous);

   Logger lgr = c->NewLogger("async");
   for (int i = 0; i < 100; ++i)
      LOG_INFO(lgr) << "entry " << i;
   c->Flush();
   CHECK_THAT(sink->GetText(), Catch::Matchers::ContainsSubstring("entry 99"));

   c->RemoveSink(sink, SinkModeAsynchronous);
   LOG_INFO(lgr) << "after removal";
   c->Flush();
   CHECK_THAT(sink->GetText(),
         !Catch::Matchers::ContainsSubstring("after removal"));
}


class LoggerTestThreadFunc
{
   unsigned n_;
   std::shared_ptr<LoggingCore> c_;

public:
   LoggerTestThreadFunc(unsigned n,
         std::shared_ptr<LoggingCore> c) :
      n_(n), c_(c)
   {}

   void Run()
   {
      Logger lgr =
         c_->NewLogger("thread" + std::to_string(n_));
      auto ch = '0' + n_;
      if (ch < '0' || ch > 'z')
         ch = '~';
      for (size_t j = 0; j < 50; ++j)
      {
         LOG_TRACE(lgr) << j << ' ' << std::string(n_ * j, char(ch));
      }
   }
};


TEST_CASE("sync logger on thread", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeSynchronous);

   std::vector< std::shared_ptr<std::thread> > threads;
   std::vector< std::shared_ptr<LoggerTestThreadFunc> > funcs;
   for (unsigned i = 0; i < 10; ++i)
   {
      funcs.push_back(std::make_shared<LoggerTestThreadFunc>(i, c));
      threads.push_back(std::make_shared<std::thread>(
               &LoggerTestThreadFunc::Run, funcs[i].get()));
   }
   for (unsigned i = 0; i < threads.size(); ++i)
      threads[i]->join();
}


TEST_CASE("async logger on thread", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeAsynchronous);

   std::vector< std::shared_ptr<std::thread> > threads;
   std::vector< std::shared_ptr<LoggerTestThreadFunc> > funcs;
   for (unsigned i = 0; i < 10; ++i)
   {
      funcs.push_back(std::make_shared<LoggerTestThreadFunc>(i, c));
      threads.push_back(std::make_shared<std::thread>(
               &LoggerTestThreadFunc::Run, funcs[i].get()));
   }
   for (unsigned i = 0; i < threads.size(); ++i)
      threads[i]->join();
}

} // namespace logging


TEST_CASE("log manager writes the configured file", "[LogManager]")
{
   const std::string filename = "cambus-logmanager-test.log";
   {
      LogManager mgr;
      CHECK(mgr.GetConfig().filename.empty());

      LoggingConfig config;
      config.filename = filename;
      mgr.Configure(config);
      CHECK(mgr.GetConfig().filename == filename);

      logging::Logger lgr = mgr.NewLogger("cam:camera1");
      LOG_DEBUG(lgr) << "hidden at info level";
      LOG_INFO(lgr) << "shown at info level";

      config.level = logging::LogLevelDebug;
      mgr.Configure(config);
      CHECK(mgr.GetConfig().level == logging::LogLevelDebug);
      LOG_DEBUG(lgr) << "shown at debug level";

      mgr.Flush();
      const std::string contents = logging::ReadFile(filename);
      CHECK_THAT(contents, !Catch::Matchers::ContainsSubstring(
               "hidden at info level"));
      CHECK_THAT(contents, Catch::Matchers::ContainsSubstring(
               "[IFO,cam:camera1] shown at info level"));
      CHECK_THAT(contents, Catch::Matchers::ContainsSubstring(
               "[dbg,cam:camera1] shown at debug level"));

      mgr.Configure(LoggingConfig());
      LOG_INFO(lgr) << "after closing the file";
      mgr.Flush();
      CHECK(mgr.GetConfig().filename.empty());
      CHECK_THAT(logging::ReadFile(filename),
            !Catch::Matchers::ContainsSubstring("after closing the file"));
   }
   std::remove(filename.c_str());
}


TEST_CASE("log manager keeps its configuration if the file cannot be opened",
      "[LogManager]")
{
   LogManager mgr;
   LoggingConfig good;
   good.level = logging::LogLevelWarning;
   mgr.Configure(good);

   LoggingConfig bad;
   bad.level = logging::LogLevelTrace;
   bad.useStdErr = true;
   bad.filename = "/nonexistent-dir/cambus.log";
   try
   {
      mgr.Configure(bad);
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_FILE_OPEN_FAILED);
   }
   CHECK(mgr.GetConfig().level == logging::LogLevelWarning);
   CHECK_FALSE(mgr.GetConfig().useStdErr);
   CHECK(mgr.GetConfig().filename.empty());
}


TEST_CASE("log manager stderr switch", "[LogManager]")
{
   LogManager mgr;
   CHECK_FALSE(mgr.GetConfig().useStdErr);

   LoggingConfig config;
   config.useStdErr = true;
   mgr.Configure(config);
   CHECK(mgr.GetConfig().useStdErr);
   logging::Logger lgr = mgr.NewLogger("stderr");
   LOG_INFO(lgr) << "to stderr";

   config.useStdErr = false;
   mgr.Configure(config);
   CHECK_FALSE(mgr.GetConfig().useStdErr);
}

} // namespace cambus
