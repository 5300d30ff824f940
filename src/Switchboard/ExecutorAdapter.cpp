// =================================================================
// src/Switchboard/ExecutorAdapter.cpp
// =================================================================

#include "Switchboard/ExecutorAdapter.hpp"
#include "Switchboard/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace Switchboard {

std::string transportToString(TransportKind transport) {
    switch (transport) {
        case TransportKind::HTTP: return "http";
        case TransportKind::CLI: return "cli";
        case TransportKind::RPC: return "rpc";
        default: return "unknown";
    }
}

TransportKind stringToTransport(const std::string& str) {
    std::string normalized = str;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);
    
    if (normalized == "http") return TransportKind::HTTP;
    if (normalized == "cli") return TransportKind::CLI;
    if (normalized == "rpc") return TransportKind::RPC;
    
    throw ConfigError("Unknown executor transport: " + str);
}

} // namespace Switchboard
