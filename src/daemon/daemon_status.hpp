#pragma once

#include <string>

/// offline -> starting -> online -> stopping -> offline; error is reachable
/// from starting, online and stopping, and error -> starting is a retry.
enum class DaemonStatus { Offline, Starting, Online, Stopping, Error };

inline std::string status_name(DaemonStatus status) {
    switch (status) {
        case DaemonStatus::Offline:  return "offline";
        case DaemonStatus::Starting: return "starting";
        case DaemonStatus::Online:   return "online";
        case DaemonStatus::Stopping: return "stopping";
        case DaemonStatus::Error:    return "error";
    }
    return "offline";
}

inline bool parse_status(const std::string& text, DaemonStatus& out) {
    if (text == "offline")  { out = DaemonStatus::Offline;  return true; }
    if (text == "starting") { out = DaemonStatus::Starting; return true; }
    if (text == "online")   { out = DaemonStatus::Online;   return true; }
    if (text == "stopping") { out = DaemonStatus::Stopping; return true; }
    if (text == "error")    { out = DaemonStatus::Error;    return true; }
    return false;
}
