// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for copytrader::IpcServer.
//
// Validates:
//   - ITradeSink calls only enqueue telemetry
//   - A full telemetry queue drops its oldest events
//   - formatTelemetry() tags fill and account records
//   - REQ/REP round trip through the command handler
//   - start()/stop() idempotency, including stop() without start()
// =============================================================================

#include "copytrader/network/ipc_server.hpp"
#include "copytrader/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <gtest/gtest.h>

#include <string>

using copytrader::AccountSnapshot;
using copytrader::FillRecord;
using copytrader::IpcServer;
using copytrader::SimulationTimeProvider;
using copytrader::domain::Fill;
using copytrader::domain::PositionAction;
using copytrader::domain::Side;

static std::string echoHandler(const std::string& cmd) {
  return nlohmann::json{{"status", "ok"}, {"echo", cmd}}.dump();
}

TEST(IpcServerTest, SinkCallsOnlyEnqueue) {
  SimulationTimeProvider clock{1700000000000};
  IpcServer server(echoHandler, clock, "", "");

  Fill fill;
  fill.coin = "BTC";
  fill.size = 1.0;
  fill.price = 100.0;
  server.saveFill(fill, PositionAction::Open, 0.0, 0.0);
  server.saveAccount(AccountSnapshot{});

  EXPECT_EQ(server.pendingTelemetry(), 2u);
}

TEST(IpcServerTest, SlowPublisherDropsOldestTelemetry) {
  SimulationTimeProvider clock;
  IpcServer server(echoHandler, clock, "", "", 2);

  for (int i = 0; i < 5; ++i) {
    server.saveAccount(AccountSnapshot{});
  }

  EXPECT_EQ(server.pendingTelemetry(), 2u);
  EXPECT_EQ(server.droppedTelemetry(), 3u);
}

TEST(IpcServerTest, FormatTelemetryTagsRecordType) {
  FillRecord record;
  record.time_ms = 42;
  record.fill.coin = "ETH";
  record.fill.side = Side::Sell;
  record.fill.size = 2.0;
  record.fill.price = 10.0;
  record.action = PositionAction::Reverse;

  auto fill_json = nlohmann::json::parse(IpcServer::formatTelemetry(record));
  EXPECT_EQ(fill_json["type"], "fill");
  EXPECT_EQ(fill_json["coin"], "ETH");
  EXPECT_EQ(fill_json["side"], "A");
  EXPECT_EQ(fill_json["action"], "REVERSE");
  EXPECT_DOUBLE_EQ(fill_json["volume_usd"].get<double>(), 20.0);

  AccountSnapshot snapshot;
  snapshot.num_trades = 3;
  auto account_json =
      nlohmann::json::parse(IpcServer::formatTelemetry(snapshot));
  EXPECT_EQ(account_json["type"], "account");
  EXPECT_EQ(account_json["num_trades"].get<int>(), 3);
  EXPECT_TRUE(account_json["positions"].is_object());
}

TEST(IpcServerTest, StopWithoutStartIsSafe) {
  SimulationTimeProvider clock;
  IpcServer server(echoHandler, clock, "", "");
  server.stop();
  server.stop();
  SUCCEED();
}

TEST(IpcServerTest, CommandRoundTrip) {
  SimulationTimeProvider clock;
  const std::string endpoint = "tcp://127.0.0.1:25556";
  IpcServer server(echoHandler, clock, endpoint, "");
  server.start();
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t client(ctx, zmq::socket_type::req);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.set(zmq::sockopt::linger, 0);
  client.connect(endpoint);

  const std::string cmd = "PING";
  client.send(zmq::buffer(cmd), zmq::send_flags::none);

  zmq::message_t reply;
  auto result = client.recv(reply, zmq::recv_flags::none);
  ASSERT_TRUE(result.has_value()) << "no reply from IpcServer";

  auto response = nlohmann::json::parse(reply.to_string());
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["echo"], "PING");

  client.close();
  server.stop();
  server.stop();
}
