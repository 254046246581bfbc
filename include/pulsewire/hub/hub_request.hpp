#pragma once

#include "pulsewire/hub/session.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pulsewire {

struct SessionInfo {
  SessionId id{0};
  std::string client_id;
  std::vector<std::string> topics; // sorted
  std::size_t queue_depth{0};
  std::uint64_t dropped{0};
  std::int64_t idle_ms{0};
  SessionState state{SessionState::Closed};
};

struct HubSnapshot {
  std::vector<SessionInfo> sessions;
  std::uint64_t broadcasts{0};
  std::uint64_t deliveries{0};
  std::uint64_t evictions{0};
};

using SnapshotReply = boost::asio::experimental::concurrent_channel<
    boost::asio::any_io_executor,
    void(boost::system::error_code, HubSnapshot)>;

struct RegisterRequest {
  std::shared_ptr<Session> session;
};

struct UnregisterRequest {
  std::shared_ptr<Session> session;
};

struct TopicsRequest {
  SessionId id{0};
  TopicSet topics;
};

/// The frame is encoded by the caller; every recipient shares it.
struct BroadcastRequest {
  std::optional<std::string> topic;
  std::shared_ptr<const std::string> frame;
};

struct SnapshotRequest {
  std::shared_ptr<SnapshotReply> reply;
};

struct ShutdownRequest {};

using HubRequest =
    std::variant<RegisterRequest, UnregisterRequest, TopicsRequest,
                 BroadcastRequest, SnapshotRequest, ShutdownRequest>;

} // namespace pulsewire
