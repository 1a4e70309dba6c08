#include <algorithm>

#include "fsm.hpp"
#include "log.hpp"
#include "string_helpers.hpp"

bgp_fsm::bgp_fsm( io_context &i, const global_conf &g, const bgp_neighbour_v4 &c, peer_event_handler handler ):
    io( i ),
    strand( boost::asio::make_strand( i ) ),
    gconf( g ),
    conf( c ),
    on_event( std::move( handler ) ),
    state( FSM_STATE::IDLE ),
    ConnectRetryCounter( 0 ),
    ConnectRetryTimer( i ),
    HoldTimer( i ),
    KeepaliveTimer( i ),
    HoldTime( g.hold_time_for( c ) ),
    KeepaliveTime( HoldTime / 3 )
{
    stats.state_since = std::chrono::steady_clock::now();
}

void bgp_fsm::start() {
    boost::asio::post( strand, [ self = shared_from_this() ]() {
        self->stopped = false;
        self->dispatch( self->conf.passive ? FSM_EVENT::MANUAL_START_PASSIVE : FSM_EVENT::MANUAL_START );
    });
}

void bgp_fsm::stop() {
    boost::asio::post( strand, [ self = shared_from_this() ]() {
        self->stopped = true;
        self->start_deferred = false;
        self->dispatch( FSM_EVENT::MANUAL_STOP );
    });
}

void bgp_fsm::place_connection( socket_tcp s ) {
    boost::asio::post( strand, [ self = shared_from_this(), s = std::move( s ) ]() mutable {
        self->on_inbound( std::move( s ) );
    });
}

void bgp_fsm::send_updates( rib_change change ) {
    boost::asio::post( strand, [ self = shared_from_this(), change = std::move( change ) ]() {
        if( self->state != FSM_STATE::ESTABLISHED || !self->conn ) {
            return;
        }
        for( auto const &update: make_updates( change.withdrawn, change.announced ) ) {
            self->send( update );
            self->count( &bgp_fsm_stats::updates_out );
        }
        logger->logDebug() << LOGS::FSM << "Peer " << self->conf.address << ": advertised " << change.announced.size()
            << " and withdrew " << change.withdrawn.size() << " prefixes" << std::endl;
    });
}

void bgp_fsm::withdrawal_complete() {
    boost::asio::post( strand, [ self = shared_from_this() ]() {
        self->withdrawal_pending = false;
        if( self->start_deferred ) {
            self->start_deferred = false;
            self->automatic_start();
        }
    });
}

bgp_fsm_stats bgp_fsm::dump() const {
    std::lock_guard<std::mutex> lg { stats_mutex };
    return stats;
}

std::chrono::seconds bgp_fsm::connect_retry_backoff() const {
    uint32_t shift = std::min<uint32_t>( ConnectRetryCounter, 16 );
    uint64_t backoff = static_cast<uint64_t>( gconf.connect_retry_time ) << shift;
    return std::chrono::seconds( std::min<uint64_t>( backoff, gconf.connect_retry_max ) );
}

void bgp_fsm::dispatch( FSM_EVENT event, const event_ctx &ctx ) {
    auto const &tr = fsm_lookup( state, event );
    logger->logTrace() << LOGS::FSM << "Peer " << conf.address << ": " << event << " in " << state << std::endl;
    set_state( tr.next );
    for( auto const &action: tr.actions ) {
        run_action( action, tr, ctx );
    }
}

static bool has_session( FSM_STATE s ) {
    return s == FSM_STATE::OPENSENT || s == FSM_STATE::OPENCONFIRM || s == FSM_STATE::ESTABLISHED;
}

void bgp_fsm::set_state( FSM_STATE next ) {
    if( next == state ) {
        return;
    }
    logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": " << state << " -> " << next << std::endl;
    auto prev = state;
    state = next;
    std::lock_guard<std::mutex> lg { stats_mutex };
    stats.state = next;
    // Connect attempts from Idle keep the Idle timestamp until a session forms
    if( has_session( prev ) || has_session( next ) ) {
        stats.state_since = std::chrono::steady_clock::now();
    }
    if( next == FSM_STATE::IDLE ) {
        stats.hold_time = 0;
    }
}

void bgp_fsm::run_action( FSM_ACTION action, const fsm_transition &tr, const event_ctx &ctx ) {
    switch( action ) {
    case FSM_ACTION::INITIATE_CONNECT:
        initiate_connect();
        break;
    case FSM_ACTION::DROP_CONNECTION:
        drop_connections();
        break;
    case FSM_ACTION::START_CONNECT_RETRY:
        arm( ConnectRetryTimer, ConnectRetryGen, connect_retry_backoff(), FSM_EVENT::CONNECT_RETRY_TIMER_EXPIRES );
        break;
    case FSM_ACTION::STOP_CONNECT_RETRY:
        cancel( ConnectRetryTimer, ConnectRetryGen );
        break;
    case FSM_ACTION::SEND_OPEN:
        send( make_open() );
        break;
    case FSM_ACTION::SEND_KEEPALIVE:
        send( bgp_keepalive_msg {} );
        break;
    case FSM_ACTION::SEND_NOTIFICATION: {
        auto notification = tr.notification ? tr.notification : ctx.notification;
        if( !notification ) {
            notification = bgp_notification_msg { BGP_ERR::FSM, FSM_ERR::UNSPEC };
        }
        logger->logWarn() << LOGS::FSM << "Peer " << conf.address << ": sending " << *notification << std::endl;
        set_error( "sent "s + to_string( *notification ) );
        send( *notification );
        break;
    }
    case FSM_ACTION::ARM_HOLD_LARGE:
        arm( HoldTimer, HoldGen, LARGE_HOLD_TIME, FSM_EVENT::HOLD_TIMER_EXPIRES );
        break;
    case FSM_ACTION::NEGOTIATE_TIMERS: {
        if( ctx.open == nullptr ) {
            break;
        }
        HoldTime = std::min( ctx.open->hold_time, gconf.hold_time_for( conf ) );
        KeepaliveTime = HoldTime / 3;
        remote_id = ctx.open->bgp_id;
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": negotiated hold time " << HoldTime
            << " keepalive time " << KeepaliveTime << " router id " << remote_id << std::endl;
        {
            std::lock_guard<std::mutex> lg { stats_mutex };
            stats.hold_time = HoldTime;
            stats.router_id = remote_id;
        }
        if( HoldTime == 0 ) {
            cancel( HoldTimer, HoldGen );
            cancel( KeepaliveTimer, KeepaliveGen );
        } else {
            arm( HoldTimer, HoldGen, std::chrono::seconds( HoldTime ), FSM_EVENT::HOLD_TIMER_EXPIRES );
            arm( KeepaliveTimer, KeepaliveGen, std::chrono::seconds( KeepaliveTime ), FSM_EVENT::KEEPALIVE_TIMER_EXPIRES );
        }
        break;
    }
    case FSM_ACTION::RESTART_HOLD:
        if( HoldTime != 0 ) {
            arm( HoldTimer, HoldGen, std::chrono::seconds( HoldTime ), FSM_EVENT::HOLD_TIMER_EXPIRES );
        }
        break;
    case FSM_ACTION::RESTART_KEEPALIVE:
        if( KeepaliveTime != 0 ) {
            arm( KeepaliveTimer, KeepaliveGen, std::chrono::seconds( KeepaliveTime ), FSM_EVENT::KEEPALIVE_TIMER_EXPIRES );
        }
        break;
    case FSM_ACTION::PROCESS_UPDATE: {
        if( ctx.update == nullptr ) {
            break;
        }
        count( &bgp_fsm_stats::updates_in );
        peer_update ev { conf.address, {}, ctx.update->routes() };
        for( auto const &p: ctx.update->withdrawn ) {
            ev.withdrawn.push_back( p.canonical() );
        }
        for( auto &route: ev.routes ) {
            route.peer = conf.address;
            route.peer_router_id = remote_id;
        }
        logger->logDebug() << LOGS::FSM << "Peer " << conf.address << ": UPDATE with " << ev.routes.size()
            << " routes and " << ev.withdrawn.size() << " withdrawals" << std::endl;
        on_event( std::move( ev ) );
        break;
    }
    case FSM_ACTION::STOP_TIMERS:
        cancel( ConnectRetryTimer, ConnectRetryGen );
        cancel( HoldTimer, HoldGen );
        cancel( KeepaliveTimer, KeepaliveGen );
        break;
    case FSM_ACTION::INCREMENT_RETRY_COUNTER: {
        ConnectRetryCounter++;
        std::lock_guard<std::mutex> lg { stats_mutex };
        stats.connect_retry_counter = ConnectRetryCounter;
        break;
    }
    case FSM_ACTION::RESET_RETRY_COUNTER: {
        ConnectRetryCounter = 0;
        std::lock_guard<std::mutex> lg { stats_mutex };
        stats.connect_retry_counter = 0;
        break;
    }
    case FSM_ACTION::ROUTES_UP: {
        // conn is set whenever Established is entered
        auto local = conn ? conn->local_address() : gconf.bgp_router_id;
        {
            std::lock_guard<std::mutex> lg { stats_mutex };
            stats.established_count++;
        }
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << " is established, local address " << local << std::endl;
        on_event( peer_established { conf.address, remote_id, local, conf.remote_as } );
        break;
    }
    case FSM_ACTION::ROUTES_DOWN:
        withdrawal_pending = true;
        on_event( peer_down { conf.address } );
        break;
    }
}

void bgp_fsm::automatic_start() {
    if( stopped || state != FSM_STATE::IDLE ) {
        return;
    }
    if( withdrawal_pending ) {
        logger->logDebug() << LOGS::FSM << "Peer " << conf.address << ": restart deferred until routes are withdrawn" << std::endl;
        start_deferred = true;
        return;
    }
    dispatch( conf.passive ? FSM_EVENT::AUTOMATIC_START_PASSIVE : FSM_EVENT::AUTOMATIC_START );
}

void bgp_fsm::arm( timer &t, uint64_t &gen, std::chrono::seconds d, FSM_EVENT event ) {
    auto id = ++gen;
    t.expires_after( d );
    t.async_wait( boost::asio::bind_executor( strand, [ self = shared_from_this(), &gen, id, event ]( error_code ec ) {
        if( ec || id != gen ) {
            return;
        }
        self->on_timer( event );
    }));
}

void bgp_fsm::cancel( timer &t, uint64_t &gen ) {
    ++gen;
    t.cancel();
}

void bgp_fsm::on_timer( FSM_EVENT event ) {
    if( event == FSM_EVENT::CONNECT_RETRY_TIMER_EXPIRES ) {
        if( state == FSM_STATE::IDLE ) {
            automatic_start();
            return;
        }
        if( state == FSM_STATE::ACTIVE && conf.passive ) {
            return;
        }
    }
    if( event == FSM_EVENT::HOLD_TIMER_EXPIRES ) {
        set_error( "hold timer expired" );
    }
    dispatch( event );
}

void bgp_fsm::initiate_connect() {
    auto c = std::make_shared<bgp_connection>( socket_tcp { io }, strand, CONN_DIR::OUTBOUND );
    conn = c;

    error_code ec;
    c->sock.open( boost::asio::ip::tcp::v4(), ec );
    if( !ec && !gconf.listen_address.is_unspecified() ) {
        c->sock.bind( endpoint { gconf.listen_address, 0 }, ec );
    }
    if( ec ) {
        // completion is still reported through the strand
        boost::asio::post( strand, std::bind( &bgp_fsm::on_connect, shared_from_this(), c, ec ) );
        return;
    }
    logger->logDebug() << LOGS::FSM << "Connecting to " << conf.address << ":" << conf.port << std::endl;
    c->sock.async_connect( endpoint { conf.address, conf.port },
        boost::asio::bind_executor( strand, std::bind( &bgp_fsm::on_connect, shared_from_this(), c, std::placeholders::_1 ) ) );
}

void bgp_fsm::on_connect( std::shared_ptr<bgp_connection> c, error_code ec ) {
    if( c != conn ) {
        c->close();
        return;
    }
    if( ec ) {
        logger->logDebug() << LOGS::FSM << "Cannot connect to " << conf.address << ": " << ec.message() << std::endl;
        set_error( "connect: "s + ec.message() );
        dispatch( FSM_EVENT::TCP_CONNECTION_FAILS );
        return;
    }
    logger->logInfo() << LOGS::FSM << "Connected to " << conf.address << ":" << conf.port << std::endl;
    do_read( c );
    dispatch( FSM_EVENT::TCP_CONNECTION_CONFIRMED );
}

void bgp_fsm::on_inbound( socket_tcp s ) {
    auto c = std::make_shared<bgp_connection>( std::move( s ), strand, CONN_DIR::INBOUND );

    switch( state ) {
    case FSM_STATE::IDLE:
        if( stopped || withdrawal_pending ) {
            logger->logDebug() << LOGS::FSM << "Peer " << conf.address << ": refusing connection while idle" << std::endl;
            c->close();
            return;
        }
        dispatch( FSM_EVENT::AUTOMATIC_START_PASSIVE );
        conn = c;
        do_read( c );
        dispatch( FSM_EVENT::TCP_CONNECTION_CONFIRMED );
        break;
    case FSM_STATE::CONNECT:
    case FSM_STATE::ACTIVE:
        if( conn ) {
            conn->close();
        }
        conn = c;
        do_read( c );
        dispatch( FSM_EVENT::TCP_CONNECTION_CONFIRMED );
        break;
    case FSM_STATE::OPENSENT:
    case FSM_STATE::OPENCONFIRM:
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": second connection in " << state << ", waiting for its OPEN" << std::endl;
        if( rival ) {
            rival->close();
        }
        rival = c;
        rival->send( make_open() );
        count( &bgp_fsm_stats::msg_out );
        do_read( c );
        break;
    case FSM_STATE::ESTABLISHED:
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": rejecting connection while established" << std::endl;
        c->send( bgp_notification_msg { BGP_ERR::CEASE, CEASE_ERR::COLLISION } );
        c->close_after_flush();
        break;
    }
}

void bgp_fsm::drop_connections() {
    if( conn ) {
        conn->close_after_flush();
        conn.reset();
    }
    if( rival ) {
        rival->close();
        rival.reset();
    }
}

void bgp_fsm::do_read( std::shared_ptr<bgp_connection> c ) {
    c->sock.async_read_some( boost::asio::buffer( c->buffer ),
        boost::asio::bind_executor( strand, std::bind( &bgp_fsm::on_receive, shared_from_this(), c, std::placeholders::_1, std::placeholders::_2 ) ) );
}

void bgp_fsm::on_receive( std::shared_ptr<bgp_connection> c, error_code ec, std::size_t length ) {
    if( c != conn && c != rival ) {
        return;
    }
    if( ec ) {
        if( c == rival ) {
            rival->close();
            rival.reset();
            return;
        }
        logger->logDebug() << LOGS::FSM << "Peer " << conf.address << ": connection lost: " << ec.message() << std::endl;
        set_error( "connection: "s + ec.message() );
        dispatch( FSM_EVENT::TCP_CONNECTION_FAILS );
        return;
    }

    c->stream.append( c->buffer.data(), length );
    try {
        while( c == conn || c == rival ) {
            auto msg = c->stream.next();
            if( !msg ) {
                break;
            }
            count( &bgp_fsm_stats::msg_in );
            handle_message( c, *msg );
        }
    } catch( bgp_codec_error &e ) {
        logger->logError() << LOGS::PACKET << "Peer " << conf.address << ": " << e.what() << std::endl;
        set_error( e.what() );
        if( c == rival ) {
            reject_rival( e.notification() );
            return;
        }
        if( c != conn ) {
            return;
        }
        event_ctx ctx;
        ctx.notification = e.notification();
        switch( static_cast<BGP_ERR>( e.code() ) ) {
        case BGP_ERR::OPEN:
            dispatch( FSM_EVENT::BGP_OPEN_MSG_ERR, ctx );
            break;
        case BGP_ERR::UPDATE:
            dispatch( FSM_EVENT::UPDATE_MSG_ERR, ctx );
            break;
        default:
            dispatch( FSM_EVENT::BGP_HEADER_ERR, ctx );
            break;
        }
        return;
    }

    if( c == conn || c == rival ) {
        do_read( c );
    }
}

void bgp_fsm::handle_message( const std::shared_ptr<bgp_connection> &c, const bgp_message &msg ) {
    bool is_rival = ( c == rival );

    std::visit( overloaded {
        [ this, is_rival ]( const bgp_open_msg &open ) {
            logger->logDebug() << LOGS::PACKET << "Peer " << conf.address << ": received OPEN AS " << open.my_as
                << " id " << open.bgp_id << " hold time " << open.hold_time << std::endl;
            if( is_rival ) {
                handle_rival_open( open );
                return;
            }
            event_ctx ctx;
            ctx.open = &open;
            if( state == FSM_STATE::OPENSENT ) {
                ctx.notification = check_open( open );
                if( ctx.notification ) {
                    set_error( "bad OPEN: "s + to_string( *ctx.notification ) );
                    dispatch( FSM_EVENT::BGP_OPEN_MSG_ERR, ctx );
                    return;
                }
            }
            dispatch( FSM_EVENT::BGP_OPEN, ctx );
        },
        [ this, is_rival ]( const bgp_update_msg &update ) {
            if( is_rival ) {
                reject_rival( bgp_notification_msg { BGP_ERR::FSM, FSM_ERR::OPEN_SENT } );
                return;
            }
            event_ctx ctx;
            ctx.update = &update;
            dispatch( FSM_EVENT::UPDATE_MSG, ctx );
        },
        [ this, is_rival ]( const bgp_notification_msg &notification ) {
            logger->logWarn() << LOGS::PACKET << "Peer " << conf.address << ": received " << notification << std::endl;
            if( is_rival ) {
                rival->close();
                rival.reset();
                return;
            }
            set_error( "received "s + to_string( notification ) );
            dispatch( FSM_EVENT::NOTIF_MSG );
        },
        [ this, is_rival ]( const bgp_keepalive_msg & ) {
            if( is_rival ) {
                return;
            }
            dispatch( FSM_EVENT::KEEPALIVE_MSG );
        }
    }, msg );
}

void bgp_fsm::handle_rival_open( const bgp_open_msg &open ) {
    if( auto err = check_open( open ); err ) {
        reject_rival( *err );
        return;
    }
    if( state != FSM_STATE::OPENSENT && state != FSM_STATE::OPENCONFIRM ) {
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": collision while " << state << ", closing the new connection" << std::endl;
        reject_rival( bgp_notification_msg { BGP_ERR::CEASE, CEASE_ERR::COLLISION } );
        return;
    }

    // The connection initiated by the speaker with the higher BGP identifier survives.
    // Two inbound connections mean the peer gave up on the first one.
    bool keep_rival = conn->dir == CONN_DIR::INBOUND || gconf.bgp_router_id.to_uint() < open.bgp_id.to_uint();
    if( !keep_rival ) {
        logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": collision resolved, keeping the existing connection" << std::endl;
        reject_rival( bgp_notification_msg { BGP_ERR::CEASE, CEASE_ERR::COLLISION } );
        return;
    }

    logger->logInfo() << LOGS::FSM << "Peer " << conf.address << ": collision resolved, switching to the new connection" << std::endl;
    conn->send( bgp_notification_msg { BGP_ERR::CEASE, CEASE_ERR::COLLISION } );
    conn->close_after_flush();
    conn = std::move( rival );
    rival.reset();

    // OPEN already went out on the new connection
    set_state( FSM_STATE::OPENSENT );
    event_ctx ctx;
    ctx.open = &open;
    dispatch( FSM_EVENT::BGP_OPEN, ctx );
}

void bgp_fsm::reject_rival( const bgp_notification_msg &notification ) {
    if( !rival ) {
        return;
    }
    rival->send( notification );
    rival->close_after_flush();
    rival.reset();
}

std::optional<bgp_notification_msg> bgp_fsm::check_open( const bgp_open_msg &open ) const {
    if( open.my_as != conf.remote_as ) {
        logger->logError() << LOGS::FSM << "Peer " << conf.address << ": incorrect AS " << open.my_as << ", we expected " << conf.remote_as << std::endl;
        return bgp_notification_msg { BGP_ERR::OPEN, OPEN_ERR::PEER_AS };
    }
    if( open.bgp_id.is_unspecified() || open.bgp_id == gconf.bgp_router_id ) {
        logger->logError() << LOGS::FSM << "Peer " << conf.address << ": bad BGP identifier " << open.bgp_id << std::endl;
        return bgp_notification_msg { BGP_ERR::OPEN, OPEN_ERR::BGP_ID };
    }
    if( open.hold_time == 1 || open.hold_time == 2 ) {
        logger->logError() << LOGS::FSM << "Peer " << conf.address << ": unacceptable hold time " << open.hold_time << std::endl;
        return bgp_notification_msg { BGP_ERR::OPEN, OPEN_ERR::HOLD_TIME };
    }
    return std::nullopt;
}

bgp_open_msg bgp_fsm::make_open() const {
    bgp_open_msg open;
    open.version = BGP_VERSION;
    open.my_as = gconf.my_as;
    open.hold_time = gconf.hold_time_for( conf );
    open.bgp_id = gconf.bgp_router_id;
    return open;
}

void bgp_fsm::send( const bgp_message &msg ) {
    if( !conn ) {
        return;
    }
    conn->send( msg );
    count( &bgp_fsm_stats::msg_out );
}

void bgp_fsm::set_error( const std::string &err ) {
    std::lock_guard<std::mutex> lg { stats_mutex };
    stats.last_error = err;
}

void bgp_fsm::count( uint64_t bgp_fsm_stats::*counter, uint64_t n ) {
    std::lock_guard<std::mutex> lg { stats_mutex };
    stats.*counter += n;
}
