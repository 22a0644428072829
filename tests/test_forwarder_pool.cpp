#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>

#include "io_context_pool.hpp"
#include "listen/forwarder_pool.hpp"
#include "listen_test_support.hpp"

using namespace std::chrono_literals;

namespace hookrelay {
namespace {

using test_support::PickFreePort;
using test_support::TestLocalHttpServer;
using test_support::WaitFor;
namespace http = boost::beast::http;

struct RelayedOutcome {
  DeliveryTag tag;
  LocalOutcome outcome;
};

// Accepts every outcome at once unless told to hold them back.
class FakeRelay : public IResponseRelay {
public:
  void Relay(const DeliveryTag &tag, LocalOutcome outcome,
             std::function<void(bool)> on_accepted) override {
    std::unique_lock<std::mutex> lock(mutex_);
    records_.push_back(RelayedOutcome{tag, std::move(outcome)});
    if (hold_) {
      held_.push_back(std::move(on_accepted));
      return;
    }
    lock.unlock();
    if (on_accepted) {
      on_accepted(true);
    }
  }

  void set_hold(bool hold) {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_ = hold;
  }

  void ReleaseHeld() {
    std::vector<std::function<void(bool)>> held;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      held.swap(held_);
    }
    for (auto &cb : held) {
      cb(true);
    }
  }

  std::vector<RelayedOutcome> records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
  }

private:
  mutable std::mutex mutex_;
  bool hold_{false};
  std::vector<RelayedOutcome> records_;
  std::vector<std::function<void(bool)>> held_;
};

InboundEvent MakeEvent(const std::string &id, const std::string &path,
                       const std::string &body = R"({"type":"paid"})") {
  InboundEvent ev;
  ev.id = id;
  ev.session_id = "ses_test";
  ev.connection_id = "web_1";
  ev.method = "POST";
  ev.path = path;
  ev.headers = {{"Content-Type", "application/json"},
                {"Host", "hooks.example.com"},
                {"Connection", "keep-alive"},
                {"X-Hookdeck-Internal-Trace", "t-1"},
                {"X-Shop-Topic", "orders/paid"}};
  ev.body = body;
  return ev;
}

class ForwarderPoolTest : public ::testing::Test {
protected:
  ForwarderPoolTest()
      : local_port_(PickFreePort()), io_(2, "pool-test") {
    target_.scheme = "http";
    target_.host = "127.0.0.1";
    target_.port = std::to_string(local_port_);
    target_.base_path = "/";

    session_.session_id = "ses_test";
    session_.source_name = "shop";
    ConnectionDescriptor conn;
    conn.connection_id = "web_1";
    conn.connection_name = "orders";
    conn.destination_config_path = "/hooks";
    session_.connections.push_back(conn);
    session_.connection_ids.push_back("web_1");

    options_.max_connections = 4;
    options_.request_timeout = 2s;
  }

  ~ForwarderPoolTest() override {
    if (pool_) {
      auto drained = std::make_shared<std::promise<void>>();
      pool_->Shutdown(200ms, [drained] { drained->set_value(); });
      drained->get_future().wait_for(2s);
    }
    io_.stop();
  }

  void MakePool() {
    pool_ = std::make_shared<ForwarderPool>(io_.ioc(), target_, session_,
                                            options_, relay_, bus_);
  }

  unsigned short local_port_;
  IoContextPool io_;
  ForwardTarget target_;
  Session session_;
  ForwarderPoolOptions options_;
  FakeRelay relay_;
  EventBus bus_;
  std::shared_ptr<ForwarderPool> pool_;
};

TEST_F(ForwarderPoolTest, ForwardsEventAndRelaysResponse) {
  TestLocalHttpServer server(local_port_);
  server.set_response(http::status::created, "accepted");
  server.add_response_header("X-Reply", "1");
  server.Start();
  auto sub = bus_.Subscribe();
  MakePool();

  auto ev = MakeEvent("evt_1", "/orders");
  ev.query = "shop=demo";
  pool_->OnInboundEvent(1, ev);

  auto recorded = server.WaitForRequest(3s);
  ASSERT_TRUE(recorded.has_value());
  EXPECT_EQ(recorded->method, "POST");
  EXPECT_EQ(recorded->target, "/hooks/orders?shop=demo");
  EXPECT_EQ(recorded->body, R"({"type":"paid"})");
  EXPECT_EQ(recorded->header("Host"), "127.0.0.1:" + std::to_string(local_port_));
  EXPECT_EQ(recorded->header("X-Shop-Topic"), "orders/paid");
  EXPECT_TRUE(recorded->header("X-Hookdeck-Internal-Trace").empty());
  EXPECT_NE(recorded->header("Connection"), "keep-alive");

  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  const auto rec = relay_.records().front();
  EXPECT_EQ(rec.tag.generation, 1u);
  EXPECT_EQ(rec.tag.event_id, "evt_1");
  EXPECT_EQ(rec.outcome.status, 201);
  EXPECT_EQ(rec.outcome.body, "accepted");
  EXPECT_EQ(rec.outcome.transport_error, TransportError::kNone);
  bool has_reply_header = false;
  for (const auto &[name, value] : rec.outcome.headers) {
    has_reply_header |= (name == "X-Reply" && value == "1");
  }
  EXPECT_TRUE(has_reply_header);

  bool received = false;
  bool forwarded = false;
  while (auto e = sub->WaitPop(300ms)) {
    if (auto *r = std::get_if<listen_events::EventReceived>(&*e)) {
      received = true;
      EXPECT_EQ(r->connection_name, "orders");
    }
    if (auto *f = std::get_if<listen_events::EventForwarded>(&*e)) {
      forwarded = true;
      EXPECT_EQ(f->status, 201);
    }
  }
  EXPECT_TRUE(received);
  EXPECT_TRUE(forwarded);
}

TEST_F(ForwarderPoolTest, ConcurrencyNeverExceedsMaxConnections) {
  TestLocalHttpServer server(local_port_);
  server.set_delay(150ms);
  server.Start();
  options_.max_connections = 2;
  MakePool();

  for (int i = 0; i < 8; ++i) {
    pool_->OnInboundEvent(1, MakeEvent("evt_" + std::to_string(i), "/"));
  }
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 8; }, 10s));
  EXPECT_LE(server.max_concurrent(), 2);
  EXPECT_EQ(server.max_concurrent(), 2);
  EXPECT_LE(pool_->peak_in_flight(), 2u);
  EXPECT_EQ(pool_->dispatched(), 8u);
  EXPECT_TRUE(WaitFor([this] { return pool_->in_flight() == 0; }, 1s));
}

TEST_F(ForwarderPoolTest, SlotIsHeldUntilRelayAccepts) {
  TestLocalHttpServer server(local_port_);
  server.Start();
  options_.max_connections = 1;
  relay_.set_hold(true);
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_a", "/"));
  pool_->OnInboundEvent(1, MakeEvent("evt_b", "/"));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(server.total_requests(), 1u);
  EXPECT_EQ(pool_->in_flight(), 1u);
  EXPECT_EQ(pool_->pending(), 1u);

  relay_.set_hold(false);
  relay_.ReleaseHeld();
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 2; }, 3s));
  EXPECT_EQ(server.total_requests(), 2u);
  EXPECT_EQ(relay_.records()[1].tag.event_id, "evt_b");
}

TEST_F(ForwarderPoolTest, HangingTargetTimesOut) {
  TestLocalHttpServer server(local_port_, TestLocalHttpServer::Mode::Hang);
  server.Start();
  options_.request_timeout = 300ms;
  auto sub = bus_.Subscribe();
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_slow", "/slow"));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  const auto rec = relay_.records().front();
  EXPECT_EQ(rec.outcome.transport_error, TransportError::kTimeout);
  EXPECT_EQ(rec.outcome.status, 0);
  EXPECT_GE(rec.outcome.latency_ms, 250);

  bool failed = false;
  while (auto e = sub->WaitPop(300ms)) {
    if (auto *f = std::get_if<listen_events::EventFailed>(&*e)) {
      failed = true;
      EXPECT_EQ(f->transport_error, TransportError::kTimeout);
    }
  }
  EXPECT_TRUE(failed);
  server.Stop();
}

TEST_F(ForwarderPoolTest, UnreachableTargetIsDialError) {
  MakePool();
  pool_->OnInboundEvent(1, MakeEvent("evt_dial", "/"));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  EXPECT_EQ(relay_.records().front().outcome.transport_error,
            TransportError::kDial);
}

TEST_F(ForwarderPoolTest, OversizedHeaderIsAnsweredAndQueueKeepsMoving) {
  TestLocalHttpServer server(local_port_);
  server.Start();
  options_.max_connections = 1;
  auto sub = bus_.Subscribe();
  MakePool();

  auto huge = MakeEvent("evt_huge", "/");
  huge.headers.emplace_back("Cookie", std::string(70000, 'a'));
  pool_->OnInboundEvent(1, huge);
  pool_->OnInboundEvent(1, MakeEvent("evt_next", "/"));

  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 2; }, 3s));
  std::this_thread::sleep_for(100ms);
  const auto records = relay_.records();
  ASSERT_EQ(records.size(), 2u);
  int huge_answers = 0;
  for (const auto &rec : records) {
    if (rec.tag.event_id == "evt_huge") {
      ++huge_answers;
      EXPECT_EQ(rec.outcome.status, 0);
      EXPECT_EQ(rec.outcome.transport_error, TransportError::kWrite);
      EXPECT_FALSE(rec.outcome.detail.empty());
    } else {
      EXPECT_EQ(rec.tag.event_id, "evt_next");
      EXPECT_EQ(rec.outcome.status, 200);
    }
  }
  EXPECT_EQ(huge_answers, 1);
  EXPECT_EQ(server.total_requests(), 1u);

  bool failed = false;
  while (auto e = sub->WaitPop(200ms)) {
    if (auto *f = std::get_if<listen_events::EventFailed>(&*e)) {
      failed |= f->event_id == "evt_huge";
    }
  }
  EXPECT_TRUE(failed);
  server.Stop();
}

TEST_F(ForwarderPoolTest, InterimRepliesAreSkipped) {
  TestLocalHttpServer server(local_port_);
  server.set_send_interim(true);
  server.set_response(http::status::accepted, "done");
  server.Start();
  MakePool();

  auto ev = MakeEvent("evt_continue", "/");
  ev.headers.emplace_back("Expect", "100-continue");
  pool_->OnInboundEvent(1, ev);

  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  const auto rec = relay_.records().front();
  EXPECT_EQ(rec.outcome.transport_error, TransportError::kNone);
  EXPECT_EQ(rec.outcome.status, 202);
  EXPECT_EQ(rec.outcome.body, "done");
  for (const auto &[name, value] : rec.outcome.headers) {
    EXPECT_NE(name, "Link");
  }
  server.Stop();
}

TEST_F(ForwarderPoolTest, FilteredEventsAreAnsweredWithoutForwarding) {
  TestLocalHttpServer server(local_port_);
  server.Start();
  SessionFilters filters;
  filters.body = boost::json::parse(R"({"type":"paid"})");
  session_.filters = filters;
  auto sub = bus_.Subscribe();
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_skip", "/", R"({"type":"refund"})"));
  pool_->OnInboundEvent(1, MakeEvent("evt_keep", "/", R"({"type":"paid"})"));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 2; }, 3s));
  ASSERT_TRUE(server.WaitForCount(1, 1s));
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(server.total_requests(), 1u);

  for (const auto &rec : relay_.records()) {
    if (rec.tag.event_id == "evt_skip") {
      EXPECT_TRUE(rec.outcome.filtered);
    } else {
      EXPECT_FALSE(rec.outcome.filtered);
      EXPECT_EQ(rec.outcome.status, 200);
    }
  }
  bool saw_filtered = false;
  while (auto e = sub->WaitPop(200ms)) {
    if (auto *f = std::get_if<listen_events::EventFiltered>(&*e)) {
      saw_filtered = true;
      EXPECT_EQ(f->event_id, "evt_skip");
    }
  }
  EXPECT_TRUE(saw_filtered);
}

TEST_F(ForwarderPoolTest, FiltersCanBeLeftToTheService) {
  TestLocalHttpServer server(local_port_);
  server.Start();
  SessionFilters filters;
  filters.body = boost::json::parse(R"({"type":"paid"})");
  session_.filters = filters;
  options_.evaluate_filters = false;
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_any", "/", R"({"type":"refund"})"));
  ASSERT_TRUE(server.WaitForCount(1, 3s));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  EXPECT_FALSE(relay_.records().front().outcome.filtered);
}

TEST_F(ForwarderPoolTest, OversizedRequestBodyIsRejectedLocally) {
  TestLocalHttpServer server(local_port_);
  server.Start();
  options_.max_request_body_bytes = 8;
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_big", "/", std::string(64, 'a')));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  EXPECT_EQ(relay_.records().front().outcome.transport_error,
            TransportError::kBodyTooLarge);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(server.total_requests(), 0u);
}

TEST_F(ForwarderPoolTest, LargeResponseBodyIsTruncated) {
  TestLocalHttpServer server(local_port_);
  server.set_response(http::status::ok, std::string(5000, 'z'));
  server.Start();
  options_.max_response_body_bytes = 1024;
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_trunc", "/"));
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 1; }, 3s));
  const auto rec = relay_.records().front();
  EXPECT_EQ(rec.outcome.transport_error, TransportError::kNone);
  EXPECT_EQ(rec.outcome.status, 200);
  EXPECT_TRUE(rec.outcome.body_truncated);
  EXPECT_EQ(rec.outcome.body.size(), 1024u);
}

TEST_F(ForwarderPoolTest, LinkLossDropsQueuedEventsOfThatConnection) {
  TestLocalHttpServer server(local_port_);
  server.set_delay(300ms);
  server.Start();
  options_.max_connections = 1;
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_1", "/"));
  pool_->OnInboundEvent(1, MakeEvent("evt_2", "/"));
  pool_->OnInboundEvent(1, MakeEvent("evt_3", "/"));
  ASSERT_TRUE(server.WaitForCount(1, 2s));
  pool_->OnLinkLost(1);
  pool_->OnInboundEvent(2, MakeEvent("evt_2", "/"));

  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 2; }, 5s));
  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(relay_.count(), 2u);
  EXPECT_EQ(server.total_requests(), 2u);
  const auto records = relay_.records();
  EXPECT_EQ(records[0].tag.event_id, "evt_1");
  EXPECT_EQ(records[0].tag.generation, 1u);
  EXPECT_EQ(records[1].tag.event_id, "evt_2");
  EXPECT_EQ(records[1].tag.generation, 2u);
}

TEST_F(ForwarderPoolTest, QueueAboveHighWaterPausesReading) {
  TestLocalHttpServer server(local_port_);
  server.set_delay(100ms);
  server.Start();
  options_.max_connections = 1;
  options_.high_water_mark = 3;
  options_.low_water_mark = 1;
  MakePool();

  std::mutex flow_mutex;
  std::vector<bool> flow;
  pool_->SetFlowControl([&](bool paused) {
    std::lock_guard<std::mutex> lock(flow_mutex);
    flow.push_back(paused);
  });
  for (int i = 0; i < 6; ++i) {
    pool_->OnInboundEvent(1, MakeEvent("evt_" + std::to_string(i), "/"));
  }
  ASSERT_TRUE(WaitFor([this] { return relay_.count() == 6; }, 10s));
  std::lock_guard<std::mutex> lock(flow_mutex);
  ASSERT_GE(flow.size(), 2u);
  EXPECT_TRUE(flow.front());
  EXPECT_FALSE(flow.back());
}

TEST_F(ForwarderPoolTest, ShutdownWaitsForInFlightDelivery) {
  TestLocalHttpServer server(local_port_);
  server.set_delay(200ms);
  server.Start();
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_drain", "/"));
  ASSERT_TRUE(server.WaitForCount(1, 2s));
  std::promise<void> drained;
  pool_->Shutdown(3s, [&drained] { drained.set_value(); });
  ASSERT_EQ(drained.get_future().wait_for(3s), std::future_status::ready);
  EXPECT_EQ(relay_.count(), 1u);
  EXPECT_EQ(relay_.records().front().outcome.status, 200);

  // Events after shutdown are left for redelivery.
  pool_->OnInboundEvent(1, MakeEvent("evt_late", "/"));
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(relay_.count(), 1u);
}

TEST_F(ForwarderPoolTest, ShutdownAbortsCallsPastTheGrace) {
  TestLocalHttpServer server(local_port_, TestLocalHttpServer::Mode::Hang);
  server.Start();
  options_.request_timeout = 10s;
  MakePool();

  pool_->OnInboundEvent(1, MakeEvent("evt_stuck", "/"));
  ASSERT_TRUE(server.WaitForCount(1, 2s));
  const auto started = std::chrono::steady_clock::now();
  std::promise<void> drained;
  pool_->Shutdown(200ms, [&drained] { drained.set_value(); });
  ASSERT_EQ(drained.get_future().wait_for(2s), std::future_status::ready);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1500ms);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(relay_.count(), 0u);
  EXPECT_EQ(pool_->in_flight(), 0u);
  server.Stop();
}

} // namespace
} // namespace hookrelay
