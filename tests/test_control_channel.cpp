#include <gtest/gtest.h>

#include <condition_variable>
#include <future>
#include <mutex>

#include "io_context_pool.hpp"
#include "listen/control_channel.hpp"
#include "listen/control_transport.hpp"
#include "listen_test_support.hpp"
#include "my_error_codes.hpp"

using namespace std::chrono_literals;

namespace hookrelay {
namespace {

using test_support::FakeControlServer;
using test_support::MakeEventFrame;
using test_support::PickFreePort;
using test_support::WaitFor;
namespace json = boost::json;

class RecordingSink : public IInboundEventSink {
public:
  void OnInboundEvent(std::uint64_t generation, InboundEvent event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.emplace_back(generation, std::move(event));
  }
  void OnLinkLost(std::uint64_t generation) override {
    std::lock_guard<std::mutex> lock(mutex_);
    lost_.push_back(generation);
  }

  std::vector<std::pair<std::uint64_t, InboundEvent>> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }
  std::vector<std::uint64_t> lost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lost_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::uint64_t, InboundEvent>> events_;
  std::vector<std::uint64_t> lost_;
};

class ControlChannelTest : public ::testing::Test {
protected:
  ControlChannelTest() : port_(PickFreePort()), server_(port_), io_(2, "channel-test") {
    options_.session_id = "ses_test";
    options_.device_name = "laptop";
    options_.handshake_timeout = 2s;
    options_.default_heartbeat = 5s;
    options_.backoff.initial_delay = 20ms;
    options_.backoff.max_delay = 100ms;
    options_.backoff.jitter = 0ms;
    options_.close_flush_timeout = 500ms;
  }

  ~ControlChannelTest() override {
    if (channel_) {
      auto closed = std::make_shared<std::promise<void>>();
      channel_->Close([closed] { closed->set_value(); });
      closed->get_future().wait_for(3s);
    }
    server_.Stop();
    io_.stop();
  }

  void StartChannel(const std::string &url) {
    auto endpoint = parse_control_url(url, false);
    ASSERT_TRUE(endpoint.is_ok()) << endpoint.error();
    ControlTransportOptions transport;
    transport.verify_tls = false;
    transport.connect_timeout = 2s;
    channel_ = std::make_shared<ControlChannel>(
        io_.ioc(),
        make_websocket_transport_factory(endpoint.value(), transport),
        options_, bus_, token_);
    channel_->SetSink(&sink_);
    channel_->SetFatalHandler([this](const Error &err) {
      std::lock_guard<std::mutex> lock(fatal_mutex_);
      fatal_ = err;
    });
    channel_->Start();
  }

  void StartAndWaitRunning() {
    server_.Start();
    StartChannel(server_.url());
    ASSERT_TRUE(WaitFor(
        [this] { return channel_->state() == ChannelState::kRunning; }, 3s));
  }

  std::optional<Error> fatal() {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    return fatal_;
  }

  unsigned short port_;
  FakeControlServer server_;
  IoContextPool io_;
  EventBus bus_;
  CancellationToken token_;
  RecordingSink sink_;
  ControlChannelOptions options_;
  std::shared_ptr<ControlChannel> channel_;
  std::mutex fatal_mutex_;
  std::optional<Error> fatal_;
};

TEST_F(ControlChannelTest, SendsHelloThenRunsAfterWelcome) {
  auto sub = bus_.Subscribe();
  StartAndWaitRunning();

  ASSERT_TRUE(server_.WaitForFrames("hello", 1, 2s));
  auto hello = server_.FramesOfType("hello").front();
  EXPECT_EQ(hello.at("session_id").as_string(), "ses_test");
  EXPECT_EQ(hello.at("device_name").as_string(), "laptop");
  EXPECT_EQ(hello.at("protocol").to_number<int>(), 1);

  auto ev = sub->WaitPop(2s);
  ASSERT_TRUE(ev.has_value());
  auto *connected = std::get_if<listen_events::Connected>(&*ev);
  ASSERT_NE(connected, nullptr);
  EXPECT_EQ(connected->attempt, 1u);
  EXPECT_EQ(channel_->connects(), 1u);
}

TEST_F(ControlChannelTest, DeliversEventsInWireOrder) {
  StartAndWaitRunning();
  for (int i = 1; i <= 5; ++i) {
    server_.SendJson(MakeEventFrame("evt_" + std::to_string(i), "web_1", "POST",
                                    "/orders"));
  }
  ASSERT_TRUE(WaitFor([this] { return sink_.events().size() == 5; }, 3s));
  auto events = sink_.events();
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(events[i].second.id, "evt_" + std::to_string(i + 1));
    EXPECT_EQ(events[i].first, channel_->generation());
  }
  EXPECT_EQ(events[0].second.headers.front().first, "content-type");
}

TEST_F(ControlChannelTest, AnswersServerPingWithSameNonce) {
  StartAndWaitRunning();
  server_.SendJson(json::object{{"type", "ping"}, {"nonce", "n-77"}});
  ASSERT_TRUE(server_.WaitForFrames("pong", 1, 2s));
  EXPECT_EQ(server_.FramesOfType("pong").front().at("nonce").as_string(), "n-77");
}

TEST_F(ControlChannelTest, PingsAtTheAnnouncedHeartbeat) {
  server_.set_heartbeat_ms(100);
  StartAndWaitRunning();
  ASSERT_TRUE(server_.WaitForFrames("ping", 2, 3s));
  auto pings = server_.FramesOfType("ping");
  EXPECT_EQ(pings[0].at("nonce").to_number<int>(), 1);
  EXPECT_EQ(pings[1].at("nonce").to_number<int>(), 2);
  EXPECT_EQ(channel_->state(), ChannelState::kRunning);
  EXPECT_EQ(server_.connections(), 1);
}

TEST_F(ControlChannelTest, SilentServerTripsIdleWatchdog) {
  server_.set_heartbeat_ms(100);
  server_.set_answer_pings(false);
  StartAndWaitRunning();
  EXPECT_TRUE(server_.WaitForConnections(2, 3s));
  EXPECT_FALSE(sink_.lost().empty());
}

TEST_F(ControlChannelTest, ResponseForCurrentGenerationIsWritten) {
  StartAndWaitRunning();
  OutboundResponse res;
  res.event_id = "evt_1";
  res.status = 204;
  std::promise<bool> queued;
  channel_->SendResponse(channel_->generation(), res,
                         [&queued](bool ok) { queued.set_value(ok); });
  auto fut = queued.get_future();
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(fut.get());

  ASSERT_TRUE(server_.WaitForFrames("response", 1, 2s));
  auto frame = server_.FramesOfType("response").front();
  EXPECT_EQ(frame.at("event_id").as_string(), "evt_1");
  EXPECT_EQ(frame.at("status").to_number<int>(), 204);
  EXPECT_TRUE(WaitFor([this] { return channel_->responses_sent() == 1; }, 2s));
}

TEST_F(ControlChannelTest, ResponseForLostConnectionIsDiscarded) {
  StartAndWaitRunning();
  const auto old_gen = channel_->generation();
  server_.DropConnection();
  ASSERT_TRUE(server_.WaitForConnections(2, 3s));
  ASSERT_TRUE(WaitFor(
      [&] {
        return channel_->state() == ChannelState::kRunning &&
               channel_->generation() > old_gen;
      },
      3s));

  std::promise<bool> queued;
  OutboundResponse res;
  res.event_id = "evt_old";
  res.status = 200;
  channel_->SendResponse(old_gen, res,
                         [&queued](bool ok) { queued.set_value(ok); });
  auto fut = queued.get_future();
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(fut.get());
  EXPECT_TRUE(server_.FramesOfType("response").empty());

  auto lost = sink_.lost();
  ASSERT_FALSE(lost.empty());
  EXPECT_EQ(lost.front(), old_gen);
  EXPECT_EQ(channel_->connects(), 2u);
}

TEST_F(ControlChannelTest, MalformedFramesInARowForceReconnect) {
  options_.malformed_frame_threshold = 3;
  auto sub = bus_.Subscribe();
  StartAndWaitRunning();

  server_.SendText("not json");
  server_.SendJson(json::object{{"type", "mystery"}});
  server_.SendJson(json::object{{"type", "event"}, {"method", "POST"}});
  ASSERT_TRUE(server_.WaitForConnections(2, 3s));

  bool saw_disconnect = false;
  bool saw_backoff = false;
  while (auto ev = sub->WaitPop(500ms)) {
    if (auto *d = std::get_if<listen_events::Disconnected>(&*ev)) {
      saw_disconnect = true;
      EXPECT_NE(d->reason.find("malformed"), std::string::npos);
    }
    if (std::holds_alternative<listen_events::BackoffWaiting>(*ev)) {
      saw_backoff = true;
    }
  }
  EXPECT_TRUE(saw_disconnect);
  EXPECT_TRUE(saw_backoff);
}

TEST_F(ControlChannelTest, GoodFrameResetsMalformedCount) {
  options_.malformed_frame_threshold = 2;
  StartAndWaitRunning();
  server_.SendText("garbage");
  server_.SendJson(json::object{{"type", "ping"}, {"nonce", 1}});
  server_.SendText("garbage");
  ASSERT_TRUE(server_.WaitForFrames("pong", 1, 2s));
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(server_.connections(), 1);
  EXPECT_EQ(channel_->state(), ChannelState::kRunning);
}

TEST_F(ControlChannelTest, EventBeforeWelcomeIsSkipped) {
  server_.set_send_welcome(false);
  server_.Start();
  StartChannel(server_.url());
  ASSERT_TRUE(server_.WaitForFrames("hello", 1, 2s));

  server_.SendJson(MakeEventFrame("evt_early", "web_1", "POST", "/"));
  server_.SendJson(json::object{{"type", "welcome"}, {"heartbeat_ms", 5000}});
  server_.SendJson(MakeEventFrame("evt_late", "web_1", "POST", "/"));

  ASSERT_TRUE(WaitFor([this] { return sink_.events().size() == 1; }, 3s));
  EXPECT_EQ(sink_.events().front().second.id, "evt_late");
}

TEST_F(ControlChannelTest, MissingWelcomeTimesOutAndRetries) {
  options_.handshake_timeout = 200ms;
  server_.set_send_welcome(false);
  server_.Start();
  StartChannel(server_.url());
  EXPECT_TRUE(server_.WaitForConnections(2, 3s));
  EXPECT_EQ(channel_->connects(), 0u);
}

TEST_F(ControlChannelTest, GivesUpAfterMaxReconnectAttempts) {
  options_.max_reconnect_attempts = 2;
  options_.handshake_timeout = 500ms;
  // Nothing listens on this port.
  StartChannel("ws://127.0.0.1:" + std::to_string(PickFreePort()) + "/cli");
  ASSERT_TRUE(WaitFor([this] { return fatal().has_value(); }, 5s));
  EXPECT_EQ(fatal()->code, my_errors::LISTEN::CONTROL_CHANNEL_FATAL);
  EXPECT_EQ(channel_->state(), ChannelState::kClosed);
}

TEST_F(ControlChannelTest, CloseStopsReconnecting) {
  StartAndWaitRunning();
  std::promise<void> closed;
  channel_->Close([&closed] { closed.set_value(); });
  ASSERT_EQ(closed.get_future().wait_for(3s), std::future_status::ready);
  EXPECT_EQ(channel_->state(), ChannelState::kClosed);
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(server_.connections(), 1);

  std::promise<bool> queued;
  channel_->SendResponse(channel_->generation(), OutboundResponse{},
                         [&queued](bool ok) { queued.set_value(ok); });
  EXPECT_FALSE(queued.get_future().get());
}

} // namespace
} // namespace hookrelay
