#pragma once

#define SMRITI_VERSION "0.4.1"
#define SMRITI_MCP_PROTOCOL_VERSION "2024-11-05"

namespace smriti {
namespace version {

inline const char* string() {
    return SMRITI_VERSION;
}

} // namespace version
} // namespace smriti
