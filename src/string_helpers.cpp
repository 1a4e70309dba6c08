#include <iostream>
#include <iomanip>
#include <sstream>

#include "string_helpers.hpp"
#include "fsm_table.hpp"
#include "packet.hpp"
#include "cli.hpp"

std::ostream& operator<<( std::ostream &stream, const FSM_STATE &state ) {
    switch( state ) {
    case FSM_STATE::IDLE:           stream << "Idle"; break;
    case FSM_STATE::CONNECT:        stream << "Connect"; break;
    case FSM_STATE::ACTIVE:         stream << "Active"; break;
    case FSM_STATE::OPENSENT:       stream << "OpenSent"; break;
    case FSM_STATE::OPENCONFIRM:    stream << "OpenConfirm"; break;
    case FSM_STATE::ESTABLISHED:    stream << "Established"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const FSM_EVENT &event ) {
    switch( event ) {
    case FSM_EVENT::MANUAL_START:                   stream << "ManualStart"; break;
    case FSM_EVENT::MANUAL_START_PASSIVE:           stream << "ManualStartPassive"; break;
    case FSM_EVENT::AUTOMATIC_START:                stream << "AutomaticStart"; break;
    case FSM_EVENT::AUTOMATIC_START_PASSIVE:        stream << "AutomaticStartPassive"; break;
    case FSM_EVENT::MANUAL_STOP:                    stream << "ManualStop"; break;
    case FSM_EVENT::CONNECT_RETRY_TIMER_EXPIRES:    stream << "ConnectRetryTimerExpires"; break;
    case FSM_EVENT::HOLD_TIMER_EXPIRES:             stream << "HoldTimerExpires"; break;
    case FSM_EVENT::KEEPALIVE_TIMER_EXPIRES:        stream << "KeepaliveTimerExpires"; break;
    case FSM_EVENT::TCP_CONNECTION_CONFIRMED:       stream << "TcpConnectionConfirmed"; break;
    case FSM_EVENT::TCP_CONNECTION_FAILS:           stream << "TcpConnectionFails"; break;
    case FSM_EVENT::BGP_OPEN:                       stream << "BGPOpen"; break;
    case FSM_EVENT::BGP_HEADER_ERR:                 stream << "BGPHeaderErr"; break;
    case FSM_EVENT::BGP_OPEN_MSG_ERR:               stream << "BGPOpenMsgErr"; break;
    case FSM_EVENT::NOTIF_MSG:                      stream << "NotifMsg"; break;
    case FSM_EVENT::KEEPALIVE_MSG:                  stream << "KeepAliveMsg"; break;
    case FSM_EVENT::UPDATE_MSG:                     stream << "UpdateMsg"; break;
    case FSM_EVENT::UPDATE_MSG_ERR:                 stream << "UpdateMsgErr"; break;
    }
    return stream;
}

static const char* error_code_name( uint8_t code ) {
    switch( static_cast<BGP_ERR>( code ) ) {
    case BGP_ERR::HEADER: return "Message Header Error";
    case BGP_ERR::OPEN: return "OPEN Message Error";
    case BGP_ERR::UPDATE: return "UPDATE Message Error";
    case BGP_ERR::HOLD: return "Hold Timer Expired";
    case BGP_ERR::FSM: return "Finite State Machine Error";
    case BGP_ERR::CEASE: return "Cease";
    }
    return "Unknown Error";
}

std::ostream& operator<<( std::ostream &stream, const bgp_notification_msg &msg ) {
    stream << "NOTIFICATION " << error_code_name( msg.code )
        << " (" << static_cast<int>( msg.code ) << "/" << static_cast<int>( msg.subcode ) << ")";
    return stream;
}

std::string to_string( const FSM_STATE &state ) {
    std::ostringstream ss;
    ss << state;
    return ss.str();
}

std::string to_string( const bgp_notification_msg &msg ) {
    std::ostringstream ss;
    ss << msg;
    return ss.str();
}

std::string format_duration( uint64_t seconds ) {
    std::ostringstream ss;
    auto days = seconds / 86400;
    auto hours = ( seconds % 86400 ) / 3600;
    auto minutes = ( seconds % 3600 ) / 60;
    if( days > 0 ) {
        ss << days << "d";
    }
    if( days > 0 || hours > 0 ) {
        ss << hours << "h";
    }
    if( days > 0 || hours > 0 || minutes > 0 ) {
        ss << minutes << "m";
    }
    ss << seconds % 60 << "s";
    return ss.str();
}

std::ostream& operator<<( std::ostream &os, const GET_NEIGHBOURS_RESP &resp ) {
    auto flags = os.flags();
    os << std::left;
    os << std::setw( 16 ) << "Neighbor";
    os << std::setw( 8 ) << "AS";
    os << std::setw( 13 ) << "State";
    os << std::setw( 12 ) << "Up/Down";
    os << std::setw( 16 ) << "RouterID";
    os << std::setw( 6 ) << "Hold";
    os << std::setw( 9 ) << "MsgRcvd";
    os << std::setw( 9 ) << "MsgSent";
    os << std::setw( 9 ) << "UpdRcvd";
    os << std::setw( 9 ) << "UpdSent";
    os << std::setw( 6 ) << "Est";
    os << "LastError";
    os << std::endl;
    for( auto const &nei: resp.neighbours ) {
        os << std::setw( 16 ) << nei.address;
        os << std::setw( 8 ) << nei.remote_as;
        os << std::setw( 13 ) << nei.state;
        os << std::setw( 12 ) << format_duration( nei.time_in_state );
        os << std::setw( 16 ) << nei.router_id;
        os << std::setw( 6 ) << nei.hold_time;
        os << std::setw( 9 ) << nei.msg_in;
        os << std::setw( 9 ) << nei.msg_out;
        os << std::setw( 9 ) << nei.updates_in;
        os << std::setw( 9 ) << nei.updates_out;
        os << std::setw( 6 ) << nei.established_count;
        os << nei.last_error;
        os << std::endl;
    }

    os.flags( flags );
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_ROUTES_RESP &resp ) {
    auto flags = os.flags();
    os << std::left;
    os << "Table: " << resp.table << std::endl;
    os << std::setw( 16 ) << "Peer";
    os << std::setw( 20 ) << "Prefix";
    os << std::setw( 16 ) << "NextHop";
    os << std::setw( 8 ) << "LocPrf";
    os << std::setw( 8 ) << "MED";
    os << std::setw( 12 ) << "Origin";
    os << "Path";
    os << std::endl;
    for( auto const &route: resp.routes ) {
        os << std::setw( 16 ) << route.peer;
        os << std::setw( 20 ) << route.prefix;
        os << std::setw( 16 ) << route.next_hop;
        os << std::setw( 8 ) << ( route.has_local_pref ? std::to_string( route.local_pref ) : "-" );
        os << std::setw( 8 ) << ( route.has_med ? std::to_string( route.med ) : "-" );
        os << std::setw( 12 ) << route.origin;
        os << route.as_path;
        os << std::endl;
    }
    os << "Total: " << resp.routes.size() << std::endl;

    os.flags( flags );
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_VERSION_RESP &resp ) {
    os << "Version: " << resp.version_string;
    return os;
}
