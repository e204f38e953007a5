#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>

#include "core/job_queue.hpp"
#include "test_helpers.hpp"

using namespace model_batcher;

TEST(JobQueue_Unit, OfferHonoursCapacity)
{
  JobQueue queue(2);
  EXPECT_TRUE(queue.offer(make_job("a")));
  EXPECT_TRUE(queue.offer(make_job("b")));
  EXPECT_FALSE(queue.offer(make_job("c")));
  EXPECT_EQ(queue.size(), 2U);
  EXPECT_EQ(queue.capacity(), 2U);
}

TEST(JobQueue_Unit, ZeroCapacityIsUnbounded)
{
  JobQueue queue;
  for (int i = 0; i < 500; ++i) {
    ASSERT_TRUE(queue.offer(make_job("job")));
  }
  EXPECT_EQ(queue.size(), 500U);
}

TEST(JobQueue_Unit, RejectsNullJob)
{
  JobQueue queue(1);
  EXPECT_FALSE(queue.offer(nullptr));
  queue.push_back(nullptr);
  queue.push_front(nullptr);
  EXPECT_TRUE(queue.empty());
}

TEST(JobQueue_Unit, PushFrontBypassesCapacityAndJumpsAhead)
{
  JobQueue queue(1);
  ASSERT_TRUE(queue.offer(make_job("tail")));
  queue.push_front(make_job("head"));
  EXPECT_EQ(queue.size(), 2U);

  std::shared_ptr<Job> job;
  ASSERT_TRUE(queue.try_pop(job));
  EXPECT_EQ(job->get_job_id(), "head");
  ASSERT_TRUE(queue.try_pop(job));
  EXPECT_EQ(job->get_job_id(), "tail");
  EXPECT_FALSE(queue.try_pop(job));
}

TEST(JobQueue_Unit, FifoOrder)
{
  JobQueue queue(10);
  for (const char* id : {"0", "1", "2"}) {
    ASSERT_TRUE(queue.offer(make_job(id)));
  }
  std::shared_ptr<Job> job;
  for (const char* id : {"0", "1", "2"}) {
    ASSERT_TRUE(queue.wait_for_and_pop(job, std::chrono::milliseconds(1)));
    EXPECT_EQ(job->get_job_id(), id);
  }
}

TEST(JobQueue_Unit, WaitForTimesOutOnEmptyQueue)
{
  JobQueue queue;
  std::shared_ptr<Job> job;
  const auto start = Clock::now();
  EXPECT_FALSE(queue.wait_for_and_pop(job, std::chrono::milliseconds(20)));
  EXPECT_GE(Clock::now() - start, std::chrono::milliseconds(20));
  EXPECT_EQ(job, nullptr);
}

TEST(JobQueue_Unit, WaitAndPopReturnsFalseOnceStopRequested)
{
  JobQueue queue;
  std::stop_source source;
  source.request_stop();
  std::shared_ptr<Job> job;
  EXPECT_FALSE(queue.wait_and_pop(job, source.get_token()));
}
