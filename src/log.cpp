#include "log.hpp"

std::unique_ptr<Logger> logger { std::make_unique<Logger>() };

std::ostream& operator<<( std::ostream &os, const LOGL &l ) {
    switch( l ) {
    case LOGL::TRACE: return os << "[TRACE] ";
    case LOGL::DEBUG: return os << "[DEBUG] ";
    case LOGL::INFO: return os << "[INFO] ";
    case LOGL::WARN: return os << "[WARN] ";
    case LOGL::ERROR: return os << "[ERROR] ";
    case LOGL::ALERT: return os << "[ALERT] ";
    }
    return os;
}

std::ostream& operator<<( std::ostream &os, const LOGS &l ) {
    switch( l ) {
    case LOGS::MAIN: return os << "[MAIN] ";
    case LOGS::FSM: return os << "[FSM] ";
    case LOGS::PACKET: return os << "[PACKET] ";
    case LOGS::RIB: return os << "[RIB] ";
    case LOGS::CLI: return os << "[CLI] ";
    case LOGS::CONF: return os << "[CONF] ";
    }
    return os;
}
