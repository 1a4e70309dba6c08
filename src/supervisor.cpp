#include "supervisor.hpp"
#include "log.hpp"
#include "string_helpers.hpp"

#ifndef BGPCPD_VERSION
#define BGPCPD_VERSION "unknown"
#endif

static ROUTE_DUMP dump_route( const std::string &peer, const bgp_route &route ) {
    ROUTE_DUMP d;
    d.peer = peer;
    d.prefix = route.prefix.to_string();
    d.next_hop = route.next_hop.to_string();
    d.as_path = to_string( route.as_path );
    d.origin = to_string( route.origin );
    d.has_local_pref = route.local_pref.has_value();
    d.local_pref = route.local_pref.value_or( 0 );
    d.has_med = route.med.has_value();
    d.med = route.med.value_or( 0 );
    return d;
}

static std::string provenance( const bgp_route &route ) {
    return route.is_local() ? "local"s : route.peer->to_string();
}

bgp_supervisor::bgp_supervisor( io_context &i, const global_conf &c ):
    io( i ),
    conf( c ),
    strand( boost::asio::make_strand( i ) ),
    accpt( i, endpoint( c.listen_address, c.listen_on_port ) ),
    shutdown_timer( i ),
    table( c.my_as, c.bgp_router_id )
{
    for( auto const &nei: c.neighbours ) {
        auto fsm = std::make_shared<bgp_fsm>( io, conf, nei, [ this ]( peer_event ev ) {
            on_peer_event( std::move( ev ) );
        });
        neighbours.emplace( nei.address, std::move( fsm ) );
    }
}

void bgp_supervisor::start() {
    logger->logInfo() << LOGS::MAIN << "Starting BGP speaker AS " << conf.my_as << " router id " << conf.bgp_router_id
        << " on " << accpt.local_endpoint() << std::endl;

    boost::asio::post( strand, [ this ]() {
        apply( table.originate( conf.networks ) );
    });
    for( auto &[ addr, fsm ]: neighbours ) {
        logger->logInfo() << LOGS::MAIN << "Neighbour " << addr << " AS " << fsm->conf.remote_as
            << ( fsm->conf.passive ? " (passive)" : "" ) << std::endl;
        fsm->start();
    }
    do_accept();
}

void bgp_supervisor::shutdown() {
    boost::asio::post( strand, [ this ]() {
        if( shutting_down ) {
            return;
        }
        shutting_down = true;
        logger->logInfo() << LOGS::MAIN << "Shutting down" << std::endl;

        error_code ec;
        accpt.close( ec );
        for( auto &[ addr, fsm ]: neighbours ) {
            fsm->stop();
        }
        shutdown_timer.expires_after( SHUTDOWN_GRACE_TIME );
        shutdown_timer.async_wait( [ this ]( error_code ec ) {
            if( ec ) {
                logger->logError() << LOGS::MAIN << "Shutdown timer: " << ec.message() << std::endl;
            }
            io.stop();
        });
    });
}

uint16_t bgp_supervisor::listen_port() const {
    return accpt.local_endpoint().port();
}

void bgp_supervisor::do_accept() {
    accpt.async_accept( std::bind( &bgp_supervisor::on_accept, this, std::placeholders::_1, std::placeholders::_2 ) );
}

void bgp_supervisor::on_accept( error_code ec, socket_tcp sock ) {
    if( ec ) {
        if( ec == boost::asio::error::operation_aborted ) {
            return;
        }
        logger->logError() << LOGS::MAIN << "Error on accepting new connection: " << ec.message() << std::endl;
        do_accept();
        return;
    }

    error_code rec;
    auto remote = sock.remote_endpoint( rec );
    if( rec ) {
        logger->logWarn() << LOGS::MAIN << "Accepted connection is already gone: " << rec.message() << std::endl;
        do_accept();
        return;
    }
    auto const &remote_addr = remote.address().to_v4();
    auto const &nei_it = neighbours.find( remote_addr );
    if( nei_it == neighbours.end() ) {
        logger->logWarn() << LOGS::MAIN << "Connection from " << remote << " is not from our peers, dropping it" << std::endl;
        sock.close( rec );
    } else {
        logger->logDebug() << LOGS::MAIN << "Incoming connection from " << remote << std::endl;
        nei_it->second->place_connection( std::move( sock ) );
    }
    do_accept();
}

void bgp_supervisor::on_peer_event( peer_event ev ) {
    boost::asio::post( strand, [ this, ev = std::move( ev ) ]() {
        std::visit( overloaded {
            [ this ]( const peer_established &e ) {
                apply( table.peer_up( rib_peer { e.peer, e.router_id, e.local_address, e.remote_as, false } ) );
            },
            [ this ]( const peer_update &e ) {
                apply( table.update( e.peer, e.withdrawn, e.routes ) );
            },
            [ this ]( const peer_down &e ) {
                apply( table.peer_down( e.peer ) );
                if( auto it = neighbours.find( e.peer ); it != neighbours.end() ) {
                    it->second->withdrawal_complete();
                }
            }
        }, ev );
    });
}

void bgp_supervisor::apply( const rib_changes &changes ) {
    for( auto const &[ addr, change ]: changes ) {
        if( change.empty() ) {
            continue;
        }
        auto it = neighbours.find( addr );
        if( it == neighbours.end() ) {
            continue;
        }
        it->second->send_updates( change );
    }
}

void bgp_supervisor::handle_cli( const CLI_MSG &req, cli_reply reply ) {
    boost::asio::post( strand, [ this, req, reply = std::move( reply ) ]() {
        reply( process_cli( req ) );
    });
}

std::optional<address_v4> bgp_supervisor::parse_peer_filter( const std::string &peer, CLI_MSG &out ) const {
    if( peer.empty() ) {
        return std::nullopt;
    }
    error_code ec;
    auto addr = boost::asio::ip::make_address_v4( peer, ec );
    if( ec ) {
        out.error = "Bad neighbour address: "s + peer;
        return std::nullopt;
    }
    if( neighbours.find( addr ) == neighbours.end() ) {
        out.error = "Unknown neighbour: "s + peer;
        return std::nullopt;
    }
    return addr;
}

CLI_MSG bgp_supervisor::process_cli( const CLI_MSG &req ) {
    CLI_MSG out_msg {};
    out_msg.type = CLI_CMD_TYPE::RESPONSE;
    out_msg.cmd = req.cmd;
    out_msg.peer = req.peer;

    logger->logDebug() << LOGS::CLI << "Control request " << static_cast<int>( req.cmd ) << std::endl;

    switch( req.cmd ) {
    case CLI_CMD::GET_VERSION: {
        GET_VERSION_RESP resp;
        resp.version_string = BGPCPD_VERSION;
        out_msg.data = serialize( resp );
        break;
    }
    case CLI_CMD::GET_NEIGHBOURS: {
        GET_NEIGHBOURS_RESP resp;
        auto now = std::chrono::steady_clock::now();
        for( auto const &[ addr, fsm ]: neighbours ) {
            auto stats = fsm->dump();
            NEIGHBOUR_DUMP d;
            d.address = addr.to_string();
            d.remote_as = fsm->conf.remote_as;
            d.state = to_string( stats.state );
            d.time_in_state = std::chrono::duration_cast<std::chrono::seconds>( now - stats.state_since ).count();
            d.router_id = stats.router_id.to_string();
            d.hold_time = stats.hold_time;
            d.msg_in = stats.msg_in;
            d.msg_out = stats.msg_out;
            d.updates_in = stats.updates_in;
            d.updates_out = stats.updates_out;
            d.established_count = stats.established_count;
            d.last_error = stats.last_error;
            resp.neighbours.push_back( std::move( d ) );
        }
        out_msg.data = serialize( resp );
        break;
    }
    case CLI_CMD::GET_ROUTES_RECEIVED: {
        auto filter = parse_peer_filter( req.peer, out_msg );
        if( !out_msg.error.empty() ) {
            break;
        }
        GET_ROUTES_RESP resp;
        resp.table = "received";
        for( auto const &route: table.received( filter ) ) {
            resp.routes.push_back( dump_route( provenance( route ), route ) );
        }
        out_msg.data = serialize( resp );
        break;
    }
    case CLI_CMD::GET_ROUTES_ADVERTISED: {
        auto filter = parse_peer_filter( req.peer, out_msg );
        if( !out_msg.error.empty() ) {
            break;
        }
        GET_ROUTES_RESP resp;
        resp.table = "advertised";
        for( auto const &[ to, route ]: table.advertised( filter ) ) {
            resp.routes.push_back( dump_route( to.to_string(), route ) );
        }
        out_msg.data = serialize( resp );
        break;
    }
    case CLI_CMD::GET_LOC_RIB: {
        GET_ROUTES_RESP resp;
        resp.table = "loc-rib";
        for( auto const &route: table.best() ) {
            resp.routes.push_back( dump_route( provenance( route ), route ) );
        }
        out_msg.data = serialize( resp );
        break;
    }
    default:
        out_msg.error = "Can't process this command";
        break;
    }
    return out_msg;
}
