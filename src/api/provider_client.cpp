#include "api/provider_client.hpp"
#include "log/log_sink.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

using json = nlohmann::json;

ProviderClient::ProviderClient(LogSink& sink, const CliInvoker& invoker)
    : sink_(sink), invoker_(invoker) {}

std::string ProviderClient::format_rate(float rate) {
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), rate);
    return std::string(buf, res.ptr);
}

// ── GPUs ────────────────────────────────────────────────────

InvokeResult<std::vector<GpuInfo>> ProviderClient::get_gpus() {
    sink_.emit(LogCategory::Status, "Attempting to fetch GPUs from daemon...");
    return invoker_.invoke<std::vector<GpuInfo>>({"--get-gpus-json"});
}

InvokeResult<GpuInfo> ProviderClient::set_gpu_config(const std::string& gpu_id,
                                                     float hourly_rate, bool available) {
    std::string rate = format_rate(hourly_rate);
    std::string avail = available ? "true" : "false";
    sink_.emit(LogCategory::Status,
               "Attempting to set GPU rental config via daemon: GPU ID " + gpu_id +
               ", Rate " + rate + ", Available " + avail);
    return invoker_.invoke<GpuInfo>({
        "--set-gpu-config-json",
        "--gpu-id", gpu_id,
        "--rate", rate,
        "--available", avail,
    });
}

// ── Settings ────────────────────────────────────────────────

InvokeResult<ProviderSettings> ProviderClient::get_settings() {
    sink_.emit(LogCategory::Status, "Attempting to fetch provider settings from daemon...");
    return invoker_.invoke<ProviderSettings>({"--get-settings-json"});
}

InvokeResult<ProviderSettings> ProviderClient::update_settings(const ProviderSettings& settings) {
    std::string payload = json(settings).dump();
    sink_.emit(LogCategory::Status,
               "Attempting to update provider settings via daemon: " + payload);
    return invoker_.invoke<ProviderSettings>({"--update-settings-json", payload});
}

// ── Jobs, network, finance ──────────────────────────────────

InvokeResult<std::vector<LocalJob>> ProviderClient::get_local_jobs() {
    sink_.emit(LogCategory::Status, "Attempting to fetch local jobs from daemon...");
    return invoker_.invoke<std::vector<LocalJob>>({"--get-local-jobs-json"});
}

InvokeResult<NetworkStatus> ProviderClient::get_network_status() {
    sink_.emit(LogCategory::Status, "Attempting to fetch network status from daemon...");
    return invoker_.invoke<NetworkStatus>({"--get-network-status-json"});
}

InvokeResult<FinancialSummary> ProviderClient::get_financial_summary() {
    sink_.emit(LogCategory::Status, "Attempting to fetch financial summary from daemon...");
    return invoker_.invoke<FinancialSummary>({"--get-financial-summary-json"});
}

InvokeResult<SystemOverview> ProviderClient::get_system_overview() {
    sink_.emit(LogCategory::Status, "Attempting to fetch system overview from daemon...");
    return invoker_.invoke<SystemOverview>({"--get-system-overview-json"});
}
