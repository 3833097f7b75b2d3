// ConnectionState.hpp
#pragma once

// Health of the link to the local Dynamo service as seen by DynamoConnector.
enum class ConnectionState {
    Init,
    Connected,
    MultipleConnections,
    NotConnected,
    Blocked,
    LostConnection
};

inline const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Init: return "INIT";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::MultipleConnections: return "MULTIPLE_CONNECTIONS";
        case ConnectionState::NotConnected: return "NOT_CONNECTED";
        case ConnectionState::Blocked: return "BLOCKED";
        case ConnectionState::LostConnection: return "LOST_CONNECTION";
    }
    return "UNKNOWN";
}

// States in which the background timer keeps re-running discovery.
inline bool isRetryState(ConnectionState state) {
    return state == ConnectionState::NotConnected
        || state == ConnectionState::MultipleConnections
        || state == ConnectionState::Blocked
        || state == ConnectionState::LostConnection;
}
