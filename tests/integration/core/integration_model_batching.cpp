#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <format>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "core/model.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

namespace model_batcher { namespace {

constexpr int kProducers = 3;
constexpr int kJobsPerProducer = 100;
constexpr int kWorkers = 3;
constexpr int kBatchSize = 4;
constexpr auto kDeliveryTimeout = std::chrono::seconds(10);

struct Delivered {
  std::mutex mutex;
  std::multiset<std::string> ids;
  std::atomic<std::size_t> count{0};
  std::atomic<std::size_t> largest_batch{0};
};

void
consume(
    Model& model, const std::string& thread_id, const std::stop_token& stop,
    Delivered& delivered)
{
  while (!stop.stop_requested()) {
    JobBatch batch;
    try {
      model.poll_batch(thread_id, std::chrono::milliseconds(0), batch, stop);
    }
    catch (const PollCancelledException&) {
      return;
    }
    std::size_t largest = delivered.largest_batch.load();
    while (batch.size() > largest &&
           !delivered.largest_batch.compare_exchange_weak(
               largest, batch.size())) {
    }
    {
      const std::scoped_lock lock(delivered.mutex);
      for (const auto& job : batch) {
        delivered.ids.insert(job->get_job_id());
      }
    }
    delivered.count.fetch_add(batch.size());
  }
}

void
produce(Model& model, int producer)
{
  for (int i = 0; i < kJobsPerProducer; ++i) {
    auto job = make_job(std::format("p{}-{}", producer, i));
    while (!model.add_job(job)) {
      std::this_thread::yield();
    }
  }
}

void
run_producers_and_workers(Model& model, Delivered& delivered)
{
  std::vector<std::jthread> workers;
  for (int w = 0; w < kWorkers; ++w) {
    workers.emplace_back(
        [&model, &delivered, w](const std::stop_token& stop) {
          consume(model, std::format("W-{}", w), stop, delivered);
        });
  }
  {
    std::vector<std::jthread> producers;
    for (int p = 0; p < kProducers; ++p) {
      producers.emplace_back([&model, p] { produce(model, p); });
    }
  }

  const auto deadline = Clock::now() + kDeliveryTimeout;
  constexpr std::size_t kExpected = kProducers * kJobsPerProducer;
  while (delivered.count.load() < kExpected && Clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  for (auto& worker : workers) {
    worker.request_stop();
  }
}

void
expect_each_job_delivered_once(const Delivered& delivered)
{
  ASSERT_EQ(
      delivered.ids.size(),
      static_cast<std::size_t>(kProducers * kJobsPerProducer));
  for (int p = 0; p < kProducers; ++p) {
    for (int i = 0; i < kJobsPerProducer; ++i) {
      EXPECT_EQ(delivered.ids.count(std::format("p{}-{}", p, i)), 1U);
    }
  }
  EXPECT_LE(
      delivered.largest_batch.load(), static_cast<std::size_t>(kBatchSize));
  EXPECT_GE(delivered.largest_batch.load(), 1U);
}

}  // namespace

TEST(ModelBatching_Integration, ConcurrentProducersAndWorkers)
{
  auto model = make_model(make_batching_config(kBatchSize, 5), 1000);
  Delivered delivered;

  run_producers_and_workers(*model, delivered);

  expect_each_job_delivered_once(delivered);
  EXPECT_EQ(model->get_data_queue_size(), 0U);
}

TEST(ModelBatching_Integration, SmallQueueBackPressure)
{
  auto model = make_model(make_batching_config(kBatchSize, 5), 2);
  Delivered delivered;

  run_producers_and_workers(*model, delivered);

  expect_each_job_delivered_once(delivered);
}

TEST(ModelBatching_Integration, TicketAdmissionFollowsPollingWorkers)
{
  auto config = make_batching_config(kBatchSize, 5);
  config.use_job_ticket = true;
  auto model = make_model(config, 1000);
  ASSERT_TRUE(model->is_use_job_ticket());
  Delivered delivered;

  run_producers_and_workers(*model, delivered);

  expect_each_job_delivered_once(delivered);
  EXPECT_GE(model->get_num_job_tickets(), 0);
  EXPECT_LE(model->get_num_job_tickets(), kWorkers);
}

TEST(ModelBatching_Integration, ControlJobsReachTheirWorkerOnly)
{
  auto model = make_model(make_batching_config(kBatchSize, 5), 100);
  model->add_job("W-0", make_job("load-0", WorkerCommand::Load));
  model->add_job("W-1", make_job("load-1", WorkerCommand::Load));

  std::vector<std::string> seen(2);
  {
    std::vector<std::jthread> workers;
    for (int w = 0; w < 2; ++w) {
      workers.emplace_back([&model, &seen, w] {
        JobBatch batch;
        model->poll_batch(
            std::format("W-{}", w), std::chrono::milliseconds(100), batch);
        ASSERT_EQ(batch.size(), 1U);
        seen[static_cast<std::size_t>(w)] = batch.front()->get_job_id();
      });
    }
  }
  EXPECT_EQ(seen[0], "load-0");
  EXPECT_EQ(seen[1], "load-1");
  EXPECT_EQ(model->get_data_queue_size(), 0U);
}

}  // namespace model_batcher
