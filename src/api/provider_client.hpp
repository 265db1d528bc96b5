#pragma once

#include "core/models.hpp"
#include "daemon/cli_invoker.hpp"

#include <string>
#include <vector>

class LogSink;

/// Typed calls onto the provider daemon's one-shot JSON modes.
class ProviderClient {
public:
    ProviderClient(LogSink& sink, const CliInvoker& invoker);

    /// --get-gpus-json
    InvokeResult<std::vector<GpuInfo>> get_gpus();

    /// --get-settings-json
    InvokeResult<ProviderSettings> get_settings();

    /// --update-settings-json <json>; returns the settings the daemon confirmed
    InvokeResult<ProviderSettings> update_settings(const ProviderSettings& settings);

    /// --set-gpu-config-json --gpu-id <id> --rate <float> --available <bool>
    InvokeResult<GpuInfo> set_gpu_config(const std::string& gpu_id, float hourly_rate, bool available);

    InvokeResult<std::vector<LocalJob>> get_local_jobs();
    InvokeResult<NetworkStatus> get_network_status();
    InvokeResult<FinancialSummary> get_financial_summary();
    InvokeResult<SystemOverview> get_system_overview();

    /// Shortest text that reads back as the same float ("2.5", "0.1")
    static std::string format_rate(float rate);

private:
    LogSink& sink_;
    const CliInvoker& invoker_;
};
