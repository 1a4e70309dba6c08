#include <set>
#include <stdexcept>

#include "config.hpp"

static void check_hold_time( uint16_t hold_time, const std::string &where ) {
    if( hold_time == 1 || hold_time == 2 ) {
        throw std::invalid_argument( where + ": hold_time must be 0 or at least 3 seconds" );
    }
}

void global_conf::validate() const {
    if( control_socket.empty() ) {
        throw std::invalid_argument( "control_socket is required" );
    }
    if( my_as == 0 ) {
        throw std::invalid_argument( "my_as is required" );
    }
    if( bgp_router_id.is_unspecified() ) {
        throw std::invalid_argument( "bgp_router_id must be non-zero" );
    }
    check_hold_time( hold_time, "global" );
    if( connect_retry_time == 0 ) {
        throw std::invalid_argument( "connect_retry_time must be positive" );
    }
    if( connect_retry_max < connect_retry_time ) {
        throw std::invalid_argument( "connect_retry_max must not be less than connect_retry_time" );
    }
    if( threads == 0 ) {
        throw std::invalid_argument( "threads must be at least 1" );
    }
    for( auto const &n: networks ) {
        if( n != n.canonical() ) {
            throw std::invalid_argument( "network "s + n.to_string() + " has host bits set" );
        }
    }

    std::set<address_v4> seen;
    for( auto const &nei: neighbours ) {
        auto where = "neighbour "s + nei.address.to_string();
        if( nei.address.is_unspecified() ) {
            throw std::invalid_argument( "neighbour address must be non-zero" );
        }
        if( !seen.insert( nei.address ).second ) {
            throw std::invalid_argument( where + " is configured twice" );
        }
        if( nei.remote_as == 0 ) {
            throw std::invalid_argument( where + ": remote_as is required" );
        }
        if( nei.port == 0 ) {
            throw std::invalid_argument( where + ": port must be non-zero" );
        }
        if( nei.hold_time.has_value() ) {
            check_hold_time( *nei.hold_time, where );
        }
    }
}
