// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include <ticcxx/soft.hpp>

namespace {

using namespace ticcxx;
using hil::tic_type;
using freq_type = hil::freq16MHz;

class counting_client : public hil::alarm_client
{
public:
  explicit counting_client (const hil::time<freq_type>& clock) :
    clock_{clock}
  { }

  void fired () override
  {
    ++count;
    at.push_back(clock_.now());
  }

  unsigned int count = 0;
  std::vector<tic_type> at;

private:
  const hil::time<freq_type>& clock_;
};

TEST(SoftCounter, StartStop)
{
  soft_counter<freq_type> ctr;

  ASSERT_FALSE(ctr.is_running());
  ASSERT_FALSE(ctr.is_armed());
  ASSERT_EQ(RC_SUCCESS, ctr.disable());
  ASSERT_EQ(0U, ctr.now());

  /* Stopped counters do not advance. */
  ctr.advance(10);
  ASSERT_EQ(0U, ctr.now());

  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ASSERT_TRUE(ctr.is_running());
  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ASSERT_TRUE(ctr.is_running());
  ctr.advance(10);
  ASSERT_EQ(10U, ctr.now());

  ASSERT_EQ(RC_SUCCESS, ctr.stop());
  ASSERT_FALSE(ctr.is_running());
  ASSERT_EQ(RC_SUCCESS, ctr.stop());
  ASSERT_FALSE(ctr.is_running());
  ctr.advance(10);
  ASSERT_EQ(10U, ctr.now());
}

TEST(SoftCounter, Wraps)
{
  soft_counter<freq_type> ctr;

  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ctr.set_counter(0xFFFFFFF0);
  ctr.advance(0x20);
  ASSERT_EQ(0x10U, ctr.now());
}

TEST(SoftCounter, Reserved)
{
  soft_counter<freq_type> ctr;

  ctr.reserve(true);
  ASSERT_TRUE(ctr.reserved());
  ASSERT_EQ(RC_EBUSY, ctr.start());
  ASSERT_FALSE(ctr.is_running());

  /* Redundant stop is still a no-op. */
  ASSERT_EQ(RC_SUCCESS, ctr.stop());

  ctr.reserve(false);
  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ctr.reserve(true);
  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ASSERT_EQ(RC_EBUSY, ctr.stop());
  ASSERT_TRUE(ctr.is_running());
}

TEST(SoftCounter, NotStoppable)
{
  soft_counter<freq_type> ctr{false};

  ASSERT_FALSE(ctr.stoppable());
  ASSERT_EQ(RC_SUCCESS, ctr.stop());
  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ASSERT_EQ(RC_ENOSUPPORT, ctr.stop());
  ASSERT_TRUE(ctr.is_running());
}

TEST(SoftCounter, Notifier)
{
  soft_counter<freq_type> ctr;
  unsigned int calls = 0;

  ctr.set_notifier([&calls]() {
      ++calls;
    });
  ctr.advance();
  ASSERT_EQ(1U, calls);
  ASSERT_EQ(RC_SUCCESS, ctr.start());
  ctr.advance(3);
  ASSERT_EQ(2U, calls);
  ctr.set_notifier(nullptr);
  ctr.advance(3);
  ASSERT_EQ(2U, calls);
  ASSERT_EQ(6U, ctr.now());
}

class PolledAlarm : public ::testing::Test
{
protected:
  PolledAlarm () :
    alarm{ctr},
    client{ctr}
  { }

  void SetUp () override
  {
    ASSERT_EQ(RC_SUCCESS, ctr.start());
    alarm.set_client(client);
  }

  /* Advance the counter by @p tics one tic at a time, servicing the
   * alarm at each tic. */
  void step (tic_type tics)
  {
    while (tics--) {
      ctr.advance();
      alarm.service();
    }
  }

  soft_counter<freq_type> ctr;
  polled_alarm<freq_type> alarm;
  counting_client client;
};

TEST_F(PolledAlarm, Capabilities)
{
  static_assert(std::is_same<polled_alarm<freq_type>::frequency_type, freq_type>::value, "frequency");
  static_assert(std::is_base_of<hil::time<freq_type>, polled_alarm<freq_type>>::value, "time");

  ctr.set_counter(1234);
  ASSERT_EQ(1234U, alarm.now());
  ASSERT_FALSE(alarm.is_enabled());
  ASSERT_FALSE(alarm.is_armed());
  ASSERT_FALSE(alarm.service());
}

TEST_F(PolledAlarm, GetAlarm)
{
  const tic_type values[] = {0, 1, 0x10, 0x7FFFFFFF, 0x80000000, 0xFFFFFFFF};
  for (auto tics : values) {
    alarm.set_alarm(tics);
    ASSERT_EQ(tics, alarm.get_alarm());
  }

  alarm.set_alarm(ctr.now() + 5);
  ASSERT_EQ(RC_SUCCESS, alarm.disable());
  ASSERT_EQ(5U, alarm.get_alarm());
  step(10);
  ASSERT_EQ(5U, alarm.get_alarm());
}

TEST_F(PolledAlarm, FiresOnce)
{
  alarm.set_alarm(ctr.now() + 5);
  ASSERT_TRUE(alarm.is_enabled());
  ASSERT_TRUE(alarm.is_armed());

  step(4);
  ASSERT_EQ(0U, client.count);
  step(1);
  ASSERT_EQ(1U, client.count);
  ASSERT_EQ(5U, client.at[0]);
  ASSERT_FALSE(alarm.is_enabled());
  step(100);
  ASSERT_EQ(1U, client.count);
}

TEST_F(PolledAlarm, WrapScenario)
{
  ctr.set_counter(0xFFFFFFF0);
  alarm.set_alarm(alarm.now() + 0x20);
  ASSERT_EQ(0x10U, alarm.get_alarm());

  step(0x1F);
  ASSERT_EQ(0x0FU, ctr.now());
  ASSERT_EQ(0U, client.count);
  step(1);
  ASSERT_EQ(1U, client.count);
  ASSERT_EQ(0x10U, client.at[0]);
  step(0x100);
  ASSERT_EQ(1U, client.count);
}

TEST_F(PolledAlarm, SkippedTarget)
{
  ctr.set_counter(0xFFFFFFF0);
  alarm.set_alarm(0x10);

  /* Servicing only every 0x18 tics never observes the target tic. */
  ctr.advance(0x18);
  ASSERT_FALSE(alarm.service());
  ctr.advance(0x18);
  ASSERT_TRUE(alarm.service());
  ASSERT_EQ(1U, client.count);
  ASSERT_EQ(0x20U, client.at[0]);
  ctr.advance(0x18);
  ASSERT_FALSE(alarm.service());
}

TEST_F(PolledAlarm, FullRangeSweep)
{
  const tic_type targets[] = {0, 1, 0x10, 0x12345678, 0x7FFFFFFF, 0x80000000, 0xFFFFFFF0, 0xFFFFFFFF};
  const tic_type stride = 0x10001;

  for (auto target : targets) {
    counting_client sweeper{ctr};
    alarm.set_client(sweeper);
    /* Start as far before the target as an alarm may be set. */
    ctr.set_counter(target + hil::HALF_RANGE + 1);
    alarm.set_alarm(target);
    ASSERT_FALSE(alarm.service());

    /* One pass around the full counter range. */
    tic_type travelled = 0;
    while (travelled < (0xFFFFFFFFU - stride)) {
      ctr.advance(stride);
      travelled += stride;
      alarm.service();
    }
    ASSERT_EQ(1U, sweeper.count) << "target " << target;
    ASSERT_GT(stride, hil::tic_delta(target, sweeper.at[0])) << "target " << target;
    alarm.set_client(client);
  }
  ASSERT_EQ(0U, client.count);
}

TEST_F(PolledAlarm, EnableDisable)
{
  ASSERT_EQ(RC_EINVAL, alarm.enable());
  ASSERT_FALSE(alarm.is_enabled());

  ASSERT_EQ(RC_SUCCESS, alarm.disable());
  ASSERT_EQ(RC_SUCCESS, alarm.disable());

  alarm.set_alarm(10);
  ASSERT_EQ(RC_SUCCESS, alarm.disable());
  ASSERT_FALSE(alarm.is_enabled());
  step(20);
  ASSERT_EQ(0U, client.count);

  /* Re-enabling a passed target fires on the next service. */
  ASSERT_EQ(RC_SUCCESS, alarm.enable());
  ASSERT_TRUE(alarm.is_enabled());
  ASSERT_TRUE(alarm.service());
  ASSERT_EQ(1U, client.count);
  ASSERT_FALSE(alarm.is_enabled());

  ASSERT_EQ(RC_SUCCESS, alarm.disable());
  ASSERT_FALSE(alarm.is_enabled());
}

TEST_F(PolledAlarm, ClientReplaced)
{
  counting_client second{ctr};

  alarm.set_client(second);
  alarm.set_alarm(3);
  step(5);
  ASSERT_EQ(0U, client.count);
  ASSERT_EQ(1U, second.count);
}

TEST_F(PolledAlarm, RearmInCallback)
{
  class chaining_client : public hil::alarm_client
  {
  public:
    explicit chaining_client (hil::alarm<freq_type>& alarm) :
      alarm_{alarm}
    { }

    void fired () override
    {
      at.push_back(alarm_.now());
      if (3U > at.size()) {
        alarm_.set_alarm(alarm_.get_alarm() + 10);
      }
    }

    std::vector<tic_type> at;

  private:
    hil::alarm<freq_type>& alarm_;
  };

  chaining_client chain{alarm};
  alarm.set_client(chain);
  alarm.set_alarm(10);
  step(100);
  ASSERT_EQ((std::vector<tic_type>{10, 20, 30}), chain.at);
  ASSERT_FALSE(alarm.is_enabled());
  ASSERT_EQ(30U, alarm.get_alarm());
}

TEST_F(PolledAlarm, RearmDueInCallback)
{
  unsigned int count = 0;
  class immediate_client : public hil::alarm_client
  {
  public:
    immediate_client (hil::alarm<freq_type>& alarm,
                      unsigned int& count) :
      alarm_{alarm},
      count_{count}
    { }

    void fired () override
    {
      ++count_;
      alarm_.set_alarm(alarm_.now());
    }

  private:
    hil::alarm<freq_type>& alarm_;
    unsigned int& count_;
  };

  immediate_client immediate{alarm, count};
  alarm.set_client(immediate);
  alarm.set_alarm(0);

  /* An already-due re-arm fires on the next pass, not recursively. */
  ASSERT_TRUE(alarm.service());
  ASSERT_EQ(1U, count);
  ASSERT_TRUE(alarm.is_enabled());
  ASSERT_TRUE(alarm.service());
  ASSERT_EQ(2U, count);
  ASSERT_EQ(RC_SUCCESS, alarm.disable());
  ASSERT_FALSE(alarm.service());
  ASSERT_EQ(2U, count);
}

TEST_F(PolledAlarm, NoClient)
{
  polled_alarm<freq_type> bare{ctr};

  bare.set_alarm(2);
  step(2);
  ASSERT_TRUE(bare.service());
  ASSERT_FALSE(bare.is_enabled());
  ASSERT_EQ(0U, client.count);
}

TEST_F(PolledAlarm, NotifierServices)
{
  ctr.set_notifier([this]() {
      alarm.service();
    });
  alarm.set_alarm(7);
  for (unsigned int i = 0; i < 20; ++i) {
    ctr.advance();
  }
  ASSERT_EQ(1U, client.count);
  ASSERT_EQ(7U, client.at[0]);
}

/* Mutex that serializes the test thread and a servicing thread.  It
 * permits nesting, as primask does. */
class test_mutex
{
public:
  test_mutex ()
  {
    lock().lock();
  }

  ~test_mutex ()
  {
    lock().unlock();
  }

  test_mutex (const test_mutex&) = delete;
  test_mutex& operator= (const test_mutex&) = delete;

private:
  static std::recursive_mutex& lock ()
  {
    static std::recursive_mutex mutex;
    return mutex;
  }
};

class atomic_client : public hil::alarm_client
{
public:
  void fired () override
  {
    std::lock_guard<std::mutex> guard{mutex};
    ++count;
  }

  std::mutex mutex;
  unsigned int count = 0;
};

TEST(PolledAlarmRace, CancelVersusService)
{
  soft_counter<freq_type, test_mutex> ctr;
  polled_alarm<freq_type, test_mutex> alarm{ctr};
  atomic_client client;

  ASSERT_EQ(RC_SUCCESS, ctr.start());
  alarm.set_client(client);

  for (unsigned int i = 0; i < 500; ++i) {
    unsigned int before;
    {
      std::lock_guard<std::mutex> guard{client.mutex};
      before = client.count;
    }
    alarm.set_alarm(ctr.now());
    bool fired = false;
    std::thread servicer{[&alarm, &fired]() {
        fired = alarm.service();
      }};
    EXPECT_EQ(RC_SUCCESS, alarm.disable());
    servicer.join();

    unsigned int after;
    {
      std::lock_guard<std::mutex> guard{client.mutex};
      after = client.count;
    }
    /* Either the cancel won and there was no callback, or the service
     * won and there was exactly one. */
    ASSERT_EQ(fired ? 1U : 0U, after - before);
    ASSERT_FALSE(alarm.is_enabled());
  }
}

} // ns anonymous
