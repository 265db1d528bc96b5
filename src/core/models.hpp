#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Payloads exchanged with the provider daemon's one-shot JSON modes.
// Field names follow the daemon's CLI contract; from_json also accepts
// the currency-suffixed aliases (e.g. "current_hourly_rate_dgpu").

struct GpuInfo {
    std::string id;                  // "nvidia-0"
    std::string name;
    std::string model;
    uint32_t vram_total_mb = 0;
    uint32_t vram_free_mb = 0;
    std::optional<uint32_t> utilization_gpu_percent;
    std::optional<uint32_t> temperature_c;
    std::optional<uint32_t> power_draw_w;
    bool is_available_for_rent = false;
    std::optional<float> current_hourly_rate;
};

struct ProviderSettings {
    float default_hourly_rate = 0.0f;
    std::string preferred_currency;
    uint32_t min_job_duration_minutes = 0;
    uint32_t max_concurrent_jobs = 0;
};

enum class JobStatus { Running, Completed, Failed, Queued };

struct LocalJob {
    std::string id;
    std::string name;
    JobStatus status = JobStatus::Queued;
    float progress_percent = 0.0f;
    std::string submitted_at;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
    std::optional<float> estimated_cost;
};

struct NetworkStatus {
    std::string connection_type;     // "Ethernet", "WiFi", "Disconnected"
    std::optional<std::string> ip_address;
    float upload_speed_mbps = 0.0f;
    float download_speed_mbps = 0.0f;
    uint32_t latency_ms = 0;
};

struct FinancialSummary {
    float current_balance = 0.0f;
    float total_earned = 0.0f;
    float pending_payout = 0.0f;
    std::optional<std::string> last_payout_at;
};

struct SystemOverview {
    uint64_t total_disk_space_gb = 0;
    uint64_t free_disk_space_gb = 0;
    float cpu_usage_percent = 0.0f;
    float ram_usage_percent = 0.0f;
    uint64_t uptime_seconds = 0;
};

std::string job_status_name(JobStatus status);
/// Returns false for anything outside running|completed|failed|queued
bool parse_job_status(const std::string& text, JobStatus& out);

void to_json(nlohmann::json& j, const GpuInfo& v);
void from_json(const nlohmann::json& j, GpuInfo& v);
void to_json(nlohmann::json& j, const ProviderSettings& v);
void from_json(const nlohmann::json& j, ProviderSettings& v);
void to_json(nlohmann::json& j, const LocalJob& v);
void from_json(const nlohmann::json& j, LocalJob& v);
void to_json(nlohmann::json& j, const NetworkStatus& v);
void from_json(const nlohmann::json& j, NetworkStatus& v);
void to_json(nlohmann::json& j, const FinancialSummary& v);
void from_json(const nlohmann::json& j, FinancialSummary& v);
void to_json(nlohmann::json& j, const SystemOverview& v);
void from_json(const nlohmann::json& j, SystemOverview& v);
