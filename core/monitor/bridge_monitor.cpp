/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "monitor/bridge_monitor.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>

namespace qbridge::monitor {

  using primitives::TransferStatus;

  bool HealthReport::healthy() const {
    return stuck_transfers.empty()
       and std::ranges::all_of(chains, [](auto &p) { return p.second; });
  }

  BridgeMonitor::BridgeMonitor(
      Config config,
      std::shared_ptr<transfer::TransferStateMachine> transfers,
      std::shared_ptr<registry::ValidatorRegistry> registry,
      std::shared_ptr<chain::ChainAdapters> adapters,
      std::shared_ptr<alert::AlertSink> alert_sink,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        transfers_{std::move(transfers)},
        registry_{std::move(registry)},
        adapters_{std::move(adapters)},
        alert_sink_{std::move(alert_sink)},
        clock_{std::move(clock)},
        logger_{log::createLogger("BridgeMonitor", "monitor")} {
    BOOST_ASSERT(transfers_);
    BOOST_ASSERT(registry_);
    BOOST_ASSERT(adapters_);
    BOOST_ASSERT(alert_sink_);
    BOOST_ASSERT(clock_);
  }

  BridgeStats BridgeMonitor::stats(
      std::optional<clock::SystemClock::Duration> window) const {
    auto now = clock_->now();
    auto since = window ? now - *window : clock::TimePoint::min();

    BridgeStats stats;
    clock::SystemClock::Duration completion_total{0};
    for (const auto &t : transfers_->list(
             std::nullopt, 0, std::numeric_limits<size_t>::max())) {
      if (t.created_at < since) {
        continue;
      }
      ++stats.total_transfers;
      stats.volume += t.amount;
      auto &chain = stats.chains[t.source_chain];
      ++chain.transfers;
      chain.volume += t.amount;

      switch (t.status) {
        case TransferStatus::Completed:
          ++stats.completed;
          stats.fees += t.fee;
          chain.fees += t.fee;
          if (t.completed_at) {
            completion_total += *t.completed_at - t.created_at;
          }
          break;
        case TransferStatus::Refunded:
          ++stats.refunded;
          break;
        case TransferStatus::Expired:
          ++stats.expired;
          break;
        case TransferStatus::Disputed:
          ++stats.disputed;
          break;
        default:
          ++stats.pending;
          break;
      }
    }

    if (stats.total_transfers > 0) {
      stats.success_rate = static_cast<double>(stats.completed)
                         / static_cast<double>(stats.total_transfers);
    }
    if (stats.completed > 0) {
      stats.average_completion_time =
          std::chrono::duration_cast<std::chrono::seconds>(completion_total)
          / stats.completed;
    }
    stats.eligible_validators = registry_->eligibleCount();
    return stats;
  }

  HealthReport BridgeMonitor::health() {
    auto now = clock_->now();
    HealthReport report;
    report.paused = transfers_->isPaused();
    report.eligible_validators = registry_->eligibleCount();

    std::vector<alert::Alert> alerts;
    reported_.exclusiveAccess([&](Reported &reported) {
      for (const auto &adapter : adapters_->all()) {
        auto chain_id = adapter->chainId();
        auto healthy = adapter->isHealthy();
        report.chains[chain_id] = healthy;
        if (healthy) {
          reported.unresponsive.erase(chain_id);
        } else if (reported.unresponsive.insert(chain_id).second) {
          alerts.push_back(alert::Alert{
              .type = alert::AlertType::ChainUnresponsive,
              .transfer_id = std::nullopt,
              .amount = 0,
              .description = fmt::format("chain #{} is unreachable", chain_id),
              .at = now});
        }
      }

      // settled transfers are never scanned, the reported set follows the
      // currently stuck ones
      std::unordered_set<primitives::TransferId> stuck;
      for (const auto &t : transfers_->unsettled()) {
        if (t.status == TransferStatus::Expired
            or now - t.created_at < config_.stuck_after) {
          continue;
        }
        report.stuck_transfers.push_back(t.id);
        stuck.insert(t.id);
        if (not reported.stuck.contains(t.id)) {
          alerts.push_back(alert::Alert{
              .type = alert::AlertType::StuckTransfer,
              .transfer_id = t.id,
              .amount = t.amount,
              .description = fmt::format("transfer is {} since {}s",
                                         t.status,
                                         std::chrono::duration_cast<
                                             std::chrono::seconds>(
                                             now - t.created_at)
                                             .count()),
              .at = now});
        }
      }
      reported.stuck = std::move(stuck);
    });

    for (auto &alert : alerts) {
      alert_sink_->raise(std::move(alert));
    }
    if (not report.healthy()) {
      SL_WARN(logger_,
              "Bridge unhealthy: {} stuck transfers",
              report.stuck_transfers.size());
    }
    return report;
  }

}  // namespace qbridge::monitor
