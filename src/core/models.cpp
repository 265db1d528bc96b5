#include "core/models.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Required field, looked up under its plain name or the daemon's alias.
const json& field(const json& j, const char* name, const char* alias = nullptr) {
    if (alias && !j.contains(name) && j.contains(alias)) {
        return j.at(alias);
    }
    return j.at(name);
}

template <typename T>
void read_optional(const json& j, const char* name, std::optional<T>& out,
                   const char* alias = nullptr) {
    out.reset();
    const char* key = name;
    if (!j.contains(key)) {
        if (!alias || !j.contains(alias)) return;
        key = alias;
    }
    const auto& v = j.at(key);
    if (v.is_null()) return;
    out = v.get<T>();
}

template <typename T>
void write_optional(json& j, const char* name, const std::optional<T>& v) {
    if (v) {
        j[name] = *v;
    } else {
        j[name] = nullptr;
    }
}

} // namespace

std::string job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Queued:    return "queued";
    }
    return "queued";
}

bool parse_job_status(const std::string& text, JobStatus& out) {
    if (text == "running")   { out = JobStatus::Running;   return true; }
    if (text == "completed") { out = JobStatus::Completed; return true; }
    if (text == "failed")    { out = JobStatus::Failed;    return true; }
    if (text == "queued")    { out = JobStatus::Queued;    return true; }
    return false;
}

// ── GpuInfo ─────────────────────────────────────────────────

void to_json(json& j, const GpuInfo& v) {
    j = json{
        {"id", v.id},
        {"name", v.name},
        {"model", v.model},
        {"vram_total_mb", v.vram_total_mb},
        {"vram_free_mb", v.vram_free_mb},
        {"is_available_for_rent", v.is_available_for_rent}
    };
    write_optional(j, "utilization_gpu_percent", v.utilization_gpu_percent);
    write_optional(j, "temperature_c", v.temperature_c);
    write_optional(j, "power_draw_w", v.power_draw_w);
    write_optional(j, "current_hourly_rate", v.current_hourly_rate);
}

void from_json(const json& j, GpuInfo& v) {
    j.at("id").get_to(v.id);
    j.at("name").get_to(v.name);
    j.at("model").get_to(v.model);
    j.at("vram_total_mb").get_to(v.vram_total_mb);
    j.at("vram_free_mb").get_to(v.vram_free_mb);
    j.at("is_available_for_rent").get_to(v.is_available_for_rent);
    read_optional(j, "utilization_gpu_percent", v.utilization_gpu_percent);
    read_optional(j, "temperature_c", v.temperature_c);
    read_optional(j, "power_draw_w", v.power_draw_w);
    read_optional(j, "current_hourly_rate", v.current_hourly_rate, "current_hourly_rate_dgpu");
}

// ── ProviderSettings ────────────────────────────────────────

void to_json(json& j, const ProviderSettings& v) {
    j = json{
        {"default_hourly_rate", v.default_hourly_rate},
        {"preferred_currency", v.preferred_currency},
        {"min_job_duration_minutes", v.min_job_duration_minutes},
        {"max_concurrent_jobs", v.max_concurrent_jobs}
    };
}

void from_json(const json& j, ProviderSettings& v) {
    field(j, "default_hourly_rate", "default_hourly_rate_dgpu").get_to(v.default_hourly_rate);
    j.at("preferred_currency").get_to(v.preferred_currency);
    j.at("min_job_duration_minutes").get_to(v.min_job_duration_minutes);
    j.at("max_concurrent_jobs").get_to(v.max_concurrent_jobs);
}

// ── LocalJob ────────────────────────────────────────────────

void to_json(json& j, const LocalJob& v) {
    j = json{
        {"id", v.id},
        {"name", v.name},
        {"status", job_status_name(v.status)},
        {"progress_percent", v.progress_percent},
        {"submitted_at", v.submitted_at}
    };
    write_optional(j, "started_at", v.started_at);
    write_optional(j, "completed_at", v.completed_at);
    write_optional(j, "estimated_cost", v.estimated_cost);
}

void from_json(const json& j, LocalJob& v) {
    j.at("id").get_to(v.id);
    j.at("name").get_to(v.name);
    std::string status = j.at("status").get<std::string>();
    if (!parse_job_status(status, v.status)) {
        throw std::invalid_argument("unknown job status '" + status + "'");
    }
    j.at("progress_percent").get_to(v.progress_percent);
    j.at("submitted_at").get_to(v.submitted_at);
    read_optional(j, "started_at", v.started_at);
    read_optional(j, "completed_at", v.completed_at);
    read_optional(j, "estimated_cost", v.estimated_cost, "estimated_cost_dgpu");
}

// ── NetworkStatus ───────────────────────────────────────────

void to_json(json& j, const NetworkStatus& v) {
    j = json{
        {"connection_type", v.connection_type},
        {"upload_speed_mbps", v.upload_speed_mbps},
        {"download_speed_mbps", v.download_speed_mbps},
        {"latency_ms", v.latency_ms}
    };
    write_optional(j, "ip_address", v.ip_address);
}

void from_json(const json& j, NetworkStatus& v) {
    j.at("connection_type").get_to(v.connection_type);
    read_optional(j, "ip_address", v.ip_address);
    j.at("upload_speed_mbps").get_to(v.upload_speed_mbps);
    j.at("download_speed_mbps").get_to(v.download_speed_mbps);
    j.at("latency_ms").get_to(v.latency_ms);
}

// ── FinancialSummary ────────────────────────────────────────

void to_json(json& j, const FinancialSummary& v) {
    j = json{
        {"current_balance", v.current_balance},
        {"total_earned", v.total_earned},
        {"pending_payout", v.pending_payout}
    };
    write_optional(j, "last_payout_at", v.last_payout_at);
}

void from_json(const json& j, FinancialSummary& v) {
    field(j, "current_balance", "current_balance_dgpu").get_to(v.current_balance);
    field(j, "total_earned", "total_earned_dgpu").get_to(v.total_earned);
    field(j, "pending_payout", "pending_payout_dgpu").get_to(v.pending_payout);
    read_optional(j, "last_payout_at", v.last_payout_at);
}

// ── SystemOverview ──────────────────────────────────────────

void to_json(json& j, const SystemOverview& v) {
    j = json{
        {"total_disk_space_gb", v.total_disk_space_gb},
        {"free_disk_space_gb", v.free_disk_space_gb},
        {"cpu_usage_percent", v.cpu_usage_percent},
        {"ram_usage_percent", v.ram_usage_percent},
        {"uptime_seconds", v.uptime_seconds}
    };
}

void from_json(const json& j, SystemOverview& v) {
    j.at("total_disk_space_gb").get_to(v.total_disk_space_gb);
    j.at("free_disk_space_gb").get_to(v.free_disk_space_gb);
    j.at("cpu_usage_percent").get_to(v.cpu_usage_percent);
    j.at("ram_usage_percent").get_to(v.ram_usage_percent);
    j.at("uptime_seconds").get_to(v.uptime_seconds);
}
