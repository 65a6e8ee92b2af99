#include <catch2/catch_all.hpp>

#include "Error.h"
#include "LogManager.h"
#include "Message.h"
#include "ScopedTaskRunner.h"
#include "TaskCompletion.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cambus {

TEST_CASE("task runs on the worker thread", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StartCamera,
         MessageData().Set(field::Camera, "cam1"));

   std::thread::id workerId;
   CHECK(runner.Run(msg, [&] { workerId = std::this_thread::get_id(); }));
   CHECK(workerId != std::thread::id());
   CHECK(workerId != std::this_thread::get_id());
   CHECK_FALSE(runner.IsBusy());
   CHECK_FALSE(msg.HasErrors());
}

TEST_CASE("run waits for the task to finish", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StopFilm);

   std::vector<int> order;
   order.push_back(1);
   runner.Run(msg, [&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      order.push_back(2);
   });
   order.push_back(3);
   CHECK(order == std::vector<int>{ 1, 2, 3 });
}

TEST_CASE("bus errors from a task are recorded", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StartCamera,
         MessageData().Set(field::Camera, "cam1"));

   CHECK_FALSE(runner.Run(msg, [] {
      throw CamBusError("Camera fell over", CAMBUS_ERR_DEVICE);
   }));
   REQUIRE(msg.GetErrors().size() == 1);
   CHECK(msg.GetErrors()[0].source == "cam1");
   CHECK(msg.GetErrors()[0].code == CAMBUS_ERR_DEVICE);
   CHECK(msg.GetErrors()[0].text == "Camera fell over");
   CHECK_FALSE(runner.IsBusy());

   // The runner is usable again
   CHECK(runner.Run(msg, [] {}));
}

TEST_CASE("other exceptions from a task are rethrown", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StopFilm);

   CHECK_THROWS_AS(runner.Run(msg, [] { throw std::runtime_error("boom"); }),
         std::runtime_error);
   CHECK_FALSE(msg.HasErrors());
   CHECK_FALSE(runner.IsBusy());
}

TEST_CASE("only one task in flight", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StopFilm);

   bool busyInside = false;
   CHECK_FALSE(runner.Run(msg, [&] {
      busyInside = runner.IsBusy();
      runner.Run(msg, [] {});
   }));
   CHECK(busyInside);
   REQUIRE(msg.GetErrors().size() == 1);
   CHECK(msg.GetErrors()[0].code == CAMBUS_ERR_TASK_BUSY);
}

TEST_CASE("aborted runner refuses work", "[ScopedTaskRunner]")
{
   LogManager logManager;
   ScopedTaskRunner runner("cam1", logManager.NewLogger("task:cam1"));
   Message msg("test", msgtype::StopFilm);

   runner.Abort();
   bool ran = false;
   try
   {
      runner.Run(msg, [&] { ran = true; });
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_BUS_STATE);
   }
   CHECK_FALSE(ran);
   CHECK_FALSE(runner.IsBusy());
}

TEST_CASE("task completion wakes the waiting thread", "[TaskCompletion]")
{
   TaskCompletion done;
   CHECK_FALSE(done.IsSignaled());

   std::thread worker([&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      done.Signal();
   });
   done.Wait();
   CHECK(done.IsSignaled());
   worker.join();

   // Stays signaled
   done.Wait();
}

} // namespace cambus
