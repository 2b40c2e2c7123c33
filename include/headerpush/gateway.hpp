#pragma once

//
// headerpush: gateway convenience header
//
// Usage:
//   #include <headerpush/gateway.hpp>
//
// This pulls in the main building blocks:
//
//   - headerpush::gateway::Gateway             -> listener + sessions + watcher
//   - headerpush::gateway::NotificationSession -> per-client tip WebSocket
//   - headerpush::gateway::ConnectionRegistry  -> id -> live connection map
//   - headerpush::gateway::TipBroadcaster      -> fan-out of new tips
//   - headerpush::gateway::UpstreamClient      -> HeaderSV HTTP client
//   - headerpush::gateway::ProxyHandlers       -> REST pass-through routes
//

#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/tip.hpp>
#include <headerpush/gateway/connection.hpp>
#include <headerpush/gateway/registry.hpp>
#include <headerpush/gateway/upstream.hpp>
#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/proxy.hpp>
#include <headerpush/gateway/notification_session.hpp>
#include <headerpush/gateway/broadcaster.hpp>
#include <headerpush/gateway/tip_watcher.hpp>
#include <headerpush/gateway/http_session.hpp>
#include <headerpush/gateway/listener.hpp>
#include <headerpush/gateway/gateway.hpp>
