#include <gtest/gtest.h>

#include "MessageBus.h"

TEST(BusSanityTests, CreateAndDestroyTwice)
{
   {
      cambus::MessageBus b1;
   }
   {
      cambus::MessageBus b2;
   }
}

TEST(BusSanityTests, CreateTwoAtOnce)
{
   cambus::MessageBus b1;
   cambus::MessageBus b2;
}

TEST(BusSanityTests, StartStopShutdown)
{
   cambus::MessageBus b;
   b.Start();
   b.Stop();
   b.Start();
   b.Shutdown();
   EXPECT_FALSE(b.IsRunning());
}

TEST(BusSanityTests, DestroyWhileRunning)
{
   cambus::MessageBus b;
   b.Start();
}
