#include <chrono>
#include <cstdio>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>

#include "supervisor.hpp"
#include "bgpctl.hpp"
#include "net_integer.hpp"

namespace {

using namespace std::chrono_literals;

address_v4 addr( const std::string &s ) {
    return boost::asio::ip::make_address_v4( s );
}

// Each test binary runs in its own process, the pid keeps parallel runs apart
uint16_t test_port( uint16_t offset ) {
    return static_cast<uint16_t>( 20000 + ( getpid() % 5000 ) * 8 + offset );
}

// One speaker with its own io_context and worker thread
struct speaker {
    global_conf conf;
    io_context io;
    std::unique_ptr<bgp_supervisor> sup;
    std::thread worker;

    speaker( const std::string &address, uint16_t as, uint16_t port ) {
        conf.control_socket = ::testing::TempDir() + "bgpcpd_" + address + ".sock";
        conf.listen_address = addr( address );
        conf.listen_on_port = port;
        conf.my_as = as;
        conf.bgp_router_id = addr( address );
        conf.hold_time = 9;
        conf.connect_retry_time = 5;
        conf.connect_retry_max = 30;
    }

    void add_neighbour( const std::string &address, uint16_t as, uint16_t port, bool passive = false ) {
        bgp_neighbour_v4 nei;
        nei.address = addr( address );
        nei.remote_as = as;
        nei.port = port;
        nei.passive = passive;
        conf.neighbours.push_back( nei );
    }

    void start() {
        conf.validate();
        sup = std::make_unique<bgp_supervisor>( io, conf );
        sup->start();
        worker = std::thread( [ this ]() { io.run(); } );
    }

    void stop() {
        if( !worker.joinable() ) {
            return;
        }
        sup->shutdown();
        worker.join();
    }

    ~speaker() {
        if( worker.joinable() ) {
            io.stop();
            worker.join();
        }
    }

    CLI_MSG query( CLI_CMD cmd, const std::string &peer = {} ) {
        CLI_MSG req {};
        req.type = CLI_CMD_TYPE::REQUEST;
        req.cmd = cmd;
        req.peer = peer;

        auto done = std::make_shared<std::promise<CLI_MSG>>();
        auto result = done->get_future();
        sup->handle_cli( req, [ done ]( CLI_MSG msg ) {
            done->set_value( std::move( msg ) );
        });
        if( result.wait_for( 5s ) != std::future_status::ready ) {
            throw std::runtime_error( "control request timed out" );
        }
        return result.get();
    }

    NEIGHBOUR_DUMP neighbour( const std::string &address ) {
        auto resp = deserialize<GET_NEIGHBOURS_RESP>( query( CLI_CMD::GET_NEIGHBOURS ).data );
        for( auto const &nei: resp.neighbours ) {
            if( nei.address == address ) {
                return nei;
            }
        }
        throw std::runtime_error( "no neighbour " + address );
    }

    std::vector<ROUTE_DUMP> routes( CLI_CMD cmd, const std::string &peer = {} ) {
        auto msg = query( cmd, peer );
        if( !msg.error.empty() ) {
            throw std::runtime_error( msg.error );
        }
        return deserialize<GET_ROUTES_RESP>( msg.data ).routes;
    }
};

bool wait_for( std::function<bool()> cond, std::chrono::seconds timeout ) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while( std::chrono::steady_clock::now() < deadline ) {
        if( cond() ) {
            return true;
        }
        std::this_thread::sleep_for( 100ms );
    }
    return cond();
}

bool has_prefix( const std::vector<ROUTE_DUMP> &routes, const std::string &prefix ) {
    for( auto const &r: routes ) {
        if( r.prefix == prefix ) {
            return true;
        }
    }
    return false;
}

// Blocking BGP endpoint scripted by the test
struct raw_peer {
    io_context io;
    socket_tcp sock { io };

    void connect( const std::string &from, const std::string &to, uint16_t port ) {
        sock.open( boost::asio::ip::tcp::v4() );
        sock.bind( endpoint { addr( from ), 0 } );
        sock.connect( endpoint { addr( to ), port } );
    }

    void send( const bgp_message &msg ) {
        boost::asio::write( sock, boost::asio::buffer( encode( msg ) ) );
    }

    void send_raw( const std::vector<uint8_t> &bytes ) {
        boost::asio::write( sock, boost::asio::buffer( bytes ) );
    }

    bgp_message receive() {
        std::vector<uint8_t> buf( BGP_HEADER_LEN );
        boost::asio::read( sock, boost::asio::buffer( buf ) );
        auto len = get_be16( buf.data() + 16 );
        if( len < BGP_HEADER_LEN ) {
            throw std::runtime_error( "bad length from the speaker" );
        }
        buf.resize( len );
        boost::asio::read( sock, boost::asio::buffer( buf.data() + BGP_HEADER_LEN, len - BGP_HEADER_LEN ) );
        return decode( buf.data(), buf.size() );
    }

    // KEEPALIVEs sent meanwhile are skipped
    bgp_notification_msg receive_notification() {
        while( true ) {
            auto msg = receive();
            if( auto n = std::get_if<bgp_notification_msg>( &msg ); n != nullptr ) {
                return *n;
            }
        }
    }
};

bgp_open_msg peer_open( uint16_t as, const std::string &id, uint16_t hold_time ) {
    bgp_open_msg open;
    open.my_as = as;
    open.bgp_id = addr( id );
    open.hold_time = hold_time;
    return open;
}

}

TEST( loopback, two_speakers_exchange_routes_and_withdraw_on_shutdown ) {
    auto port = test_port( 0 );

    speaker peer2 { "127.0.0.2", 65002, port };
    peer2.add_neighbour( "127.0.0.1", 65001, port, true );
    peer2.conf.networks.push_back( boost::asio::ip::make_network_v4( "10.2.0.0/24" ) );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.add_neighbour( "127.0.0.2", 65002, port );
    peer1.conf.networks.push_back( boost::asio::ip::make_network_v4( "10.0.0.0/24" ) );

    peer2.start();
    peer1.start();

    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Established"; }, 10s ) );
    ASSERT_TRUE( wait_for( [ &peer2 ]() { return peer2.neighbour( "127.0.0.1" ).state == "Established"; }, 10s ) );

    // Peer2 learns 10.0.0.0/24 with the path of Peer1
    ASSERT_TRUE( wait_for( [ &peer2 ]() { return has_prefix( peer2.routes( CLI_CMD::GET_ROUTES_RECEIVED ), "10.0.0.0/24" ); }, 10s ) );
    auto received = peer2.routes( CLI_CMD::GET_ROUTES_RECEIVED, "127.0.0.1" );
    ASSERT_EQ( received.size(), 1 );
    EXPECT_EQ( received[ 0 ].as_path, "65001" );
    EXPECT_EQ( received[ 0 ].next_hop, "127.0.0.1" );
    EXPECT_EQ( received[ 0 ].peer, "127.0.0.1" );

    ASSERT_TRUE( wait_for( [ &peer1 ]() { return has_prefix( peer1.routes( CLI_CMD::GET_ROUTES_RECEIVED ), "10.2.0.0/24" ); }, 10s ) );
    auto advertised = peer1.routes( CLI_CMD::GET_ROUTES_ADVERTISED, "127.0.0.2" );
    ASSERT_EQ( advertised.size(), 1 );
    EXPECT_EQ( advertised[ 0 ].prefix, "10.0.0.0/24" );

    auto loc_rib = peer1.routes( CLI_CMD::GET_LOC_RIB );
    EXPECT_EQ( loc_rib.size(), 2 );

    auto nei = peer1.neighbour( "127.0.0.2" );
    EXPECT_EQ( nei.router_id, "127.0.0.2" );
    EXPECT_EQ( nei.hold_time, 9 );
    EXPECT_EQ( nei.established_count, 1u );
    EXPECT_GE( nei.updates_in, 1u );

    // Peer2 goes away, Peer1 drops to Idle and forgets its routes
    peer2.stop();
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Idle"; }, 9s ) );
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.routes( CLI_CMD::GET_ROUTES_RECEIVED ).empty(); }, 5s ) );
    EXPECT_EQ( peer1.routes( CLI_CMD::GET_LOC_RIB ).size(), 1 );
    EXPECT_TRUE( peer1.routes( CLI_CMD::GET_ROUTES_ADVERTISED ).empty() );
    EXPECT_NE( peer1.neighbour( "127.0.0.2" ).last_error.find( "Cease" ), std::string::npos );

    peer1.stop();
}

TEST( loopback, unreachable_neighbour_stays_idle ) {
    auto port = test_port( 1 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.conf.connect_retry_time = 1;
    peer1.conf.connect_retry_max = 2;
    // nothing listens on 127.0.0.3
    peer1.add_neighbour( "127.0.0.3", 65003, port );
    peer1.start();

    // several connect attempts fail while the samples are taken
    uint64_t last = 0;
    for( int i = 0; i < 13; i++ ) {
        auto nei = peer1.neighbour( "127.0.0.3" );
        EXPECT_TRUE( nei.state == "Idle" || nei.state == "Connect" ) << nei.state;
        EXPECT_GE( nei.time_in_state, last ) << "sample " << i;
        last = nei.time_in_state;
        std::this_thread::sleep_for( 500ms );
    }

    auto nei = peer1.neighbour( "127.0.0.3" );
    EXPECT_GE( nei.time_in_state, 5u );
    EXPECT_FALSE( nei.last_error.empty() );
    EXPECT_GE( peer1.sup->neighbours.at( addr( "127.0.0.3" ) )->dump().connect_retry_counter, 3u );

    peer1.stop();
}

TEST( loopback, control_queries_reject_bad_filters ) {
    auto port = test_port( 2 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.add_neighbour( "127.0.0.3", 65003, port, true );
    peer1.start();

    auto version = peer1.query( CLI_CMD::GET_VERSION );
    EXPECT_TRUE( version.error.empty() );
    EXPECT_FALSE( deserialize<GET_VERSION_RESP>( version.data ).version_string.empty() );

    EXPECT_EQ( peer1.query( CLI_CMD::GET_ROUTES_RECEIVED, "not-an-address" ).error, "Bad neighbour address: not-an-address" );
    EXPECT_EQ( peer1.query( CLI_CMD::GET_ROUTES_ADVERTISED, "10.9.9.9" ).error, "Unknown neighbour: 10.9.9.9" );
    EXPECT_TRUE( peer1.query( CLI_CMD::GET_ROUTES_RECEIVED, "127.0.0.3" ).error.empty() );

    // a passive neighbour waits in Active
    EXPECT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.3" ).state == "Active"; }, 5s ) );

    peer1.stop();
}

TEST( loopback, control_socket_serves_bgpctl_commands ) {
    auto port = test_port( 3 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.conf.networks.push_back( boost::asio::ip::make_network_v4( "10.0.0.0/24" ) );
    peer1.start();

    std::remove( peer1.conf.control_socket.c_str() );
    auto *sup = peer1.sup.get();
    CLIServer cli { peer1.io, peer1.conf.control_socket, [ sup ]( const CLI_MSG &req, cli_reply reply ) {
        sup->handle_cli( req, std::move( reply ) );
    }};

    io_context client_io;
    CLIClientConnection conn { client_io, peer1.conf.control_socket };
    CLICMD cmd;

    auto resp = conn.request( cmd.call_cmd( "show routes" ) );
    ASSERT_TRUE( resp.error.empty() );
    auto routes = deserialize<GET_ROUTES_RESP>( resp.data );
    EXPECT_EQ( routes.table, "loc-rib" );
    ASSERT_EQ( routes.routes.size(), 1 );
    EXPECT_EQ( routes.routes[ 0 ].peer, "local" );
    EXPECT_EQ( routes.routes[ 0 ].as_path, "65001" );

    auto bad = conn.request( cmd.call_cmd( "show routes received 10.9.9.9" ) );
    EXPECT_FALSE( bad.error.empty() );

    peer1.stop();
    std::remove( peer1.conf.control_socket.c_str() );
}

TEST( session, connect_retry_backoff_is_bounded ) {
    io_context io;
    global_conf conf;
    conf.bgp_router_id = addr( "127.0.0.1" );
    conf.connect_retry_time = 5;
    conf.connect_retry_max = 120;
    bgp_neighbour_v4 nei;
    nei.address = addr( "127.0.0.2" );
    nei.remote_as = 65002;
    conf.neighbours.push_back( nei );

    auto fsm = std::make_shared<bgp_fsm>( io, conf, conf.neighbours.front(), []( peer_event ) {} );
    EXPECT_EQ( fsm->connect_retry_backoff(), 5s );
    fsm->ConnectRetryCounter = 1;
    EXPECT_EQ( fsm->connect_retry_backoff(), 10s );
    fsm->ConnectRetryCounter = 4;
    EXPECT_EQ( fsm->connect_retry_backoff(), 80s );
    fsm->ConnectRetryCounter = 5;
    EXPECT_EQ( fsm->connect_retry_backoff(), 120s );
    fsm->ConnectRetryCounter = 64;
    EXPECT_EQ( fsm->connect_retry_backoff(), 120s );
}

TEST( session, collision_keeps_connection_of_higher_router_id ) {
    auto port = test_port( 4 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.add_neighbour( "127.0.0.2", 65002, port );

    raw_peer first;
    acceptor listener { first.io, endpoint { addr( "127.0.0.2" ), port } };
    peer1.start();

    // the speaker connects out and sends its OPEN
    listener.accept( first.sock );
    auto open = first.receive();
    ASSERT_TRUE( std::holds_alternative<bgp_open_msg>( open ) );
    EXPECT_EQ( std::get<bgp_open_msg>( open ).my_as, 65001 );
    EXPECT_EQ( std::get<bgp_open_msg>( open ).bgp_id, addr( "127.0.0.1" ) );

    // a connection from the peer side crosses it
    raw_peer second;
    second.connect( "127.0.0.2", "127.0.0.1", port );
    ASSERT_TRUE( std::holds_alternative<bgp_open_msg>( second.receive() ) );
    second.send( peer_open( 65002, "127.0.0.2", 9 ) );

    // 127.0.0.2 has the higher identifier, so the speaker gives up its own connection
    auto cease = first.receive_notification();
    EXPECT_EQ( cease.code, static_cast<uint8_t>( BGP_ERR::CEASE ) );
    EXPECT_EQ( cease.subcode, static_cast<uint8_t>( CEASE_ERR::COLLISION ) );

    ASSERT_TRUE( std::holds_alternative<bgp_keepalive_msg>( second.receive() ) );
    second.send( bgp_keepalive_msg {} );
    EXPECT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Established"; }, 5s ) );
    EXPECT_EQ( peer1.neighbour( "127.0.0.2" ).router_id, "127.0.0.2" );

    peer1.stop();
}

TEST( session, hold_timer_expires_on_silent_peer ) {
    auto port = test_port( 5 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.add_neighbour( "127.0.0.2", 65002, port, true );
    peer1.start();
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Active"; }, 5s ) );

    raw_peer remote;
    remote.connect( "127.0.0.2", "127.0.0.1", port );
    ASSERT_TRUE( std::holds_alternative<bgp_open_msg>( remote.receive() ) );
    remote.send( peer_open( 65002, "127.0.0.2", 3 ) );
    ASSERT_TRUE( std::holds_alternative<bgp_keepalive_msg>( remote.receive() ) );
    remote.send( bgp_keepalive_msg {} );
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Established"; }, 5s ) );
    EXPECT_EQ( peer1.neighbour( "127.0.0.2" ).hold_time, 3 );

    // nothing more is sent
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Idle"; }, 6s ) );
    EXPECT_NE( peer1.neighbour( "127.0.0.2" ).last_error.find( "Hold Timer Expired" ), std::string::npos );

    auto notification = remote.receive_notification();
    EXPECT_EQ( notification.code, static_cast<uint8_t>( BGP_ERR::HOLD ) );
    EXPECT_EQ( notification.subcode, 0 );

    peer1.stop();
}

TEST( session, malformed_header_is_answered_with_notification ) {
    auto port = test_port( 6 );

    speaker peer1 { "127.0.0.1", 65001, port };
    peer1.add_neighbour( "127.0.0.2", 65002, port, true );
    peer1.start();
    ASSERT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Active"; }, 5s ) );

    raw_peer remote;
    remote.connect( "127.0.0.2", "127.0.0.1", port );
    ASSERT_TRUE( std::holds_alternative<bgp_open_msg>( remote.receive() ) );

    // KEEPALIVE with a zeroed marker
    std::vector<uint8_t> bad( 16, 0 );
    put_be16( bad, static_cast<uint16_t>( BGP_HEADER_LEN ) );
    bad.push_back( static_cast<uint8_t>( bgp_type::KEEPALIVE ) );
    remote.send_raw( bad );

    auto notification = remote.receive_notification();
    EXPECT_EQ( notification.code, static_cast<uint8_t>( BGP_ERR::HEADER ) );
    EXPECT_EQ( notification.subcode, static_cast<uint8_t>( HEADER_ERR::SYNC ) );
    EXPECT_TRUE( wait_for( [ &peer1 ]() { return peer1.neighbour( "127.0.0.2" ).state == "Idle"; }, 5s ) );
    EXPECT_FALSE( peer1.neighbour( "127.0.0.2" ).last_error.empty() );

    peer1.stop();
}
