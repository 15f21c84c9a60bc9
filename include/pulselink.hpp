#pragma once

/*
===============================================================================
pulselink - Public API Entry Point
===============================================================================

Client-side realtime connection core: one managed connection per Manager,
demand-driven connect, reconnect with exponential backoff, heartbeat-based
liveness, a bounded outbound queue and topic subscriptions.

Applications provide a Transport, a credential Provider and (optionally) a
Clock conforming to the concepts in pulselink::core, then drive the Manager
with poll() from a single owner thread.
===============================================================================
*/

#include "pulselink/manager.hpp"


namespace pulselink {

using Config          = core::Config;
using Error           = core::Error;
using OverflowPolicy  = core::OverflowPolicy;
using State           = core::connection::State;
using Status          = core::connection::Status;
using Frame           = core::codec::Frame;
using Subscription    = core::subscription::Subscription;
using Signals         = core::environment::Signals;
using SteadyClock     = core::SteadyClock;
using StaticProvider  = core::credential::StaticProvider;

} // namespace pulselink
