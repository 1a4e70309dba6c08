#ifndef FSM_HPP_
#define FSM_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "packet.hpp"
#include "fsm_table.hpp"
#include "connection.hpp"

inline constexpr auto LARGE_HOLD_TIME { std::chrono::seconds( 240 ) };

// RIB input produced by a session and consumed on the supervisor strand
struct peer_established {
    address_v4 peer;
    address_v4 router_id;
    address_v4 local_address;
    uint16_t remote_as;
};

struct peer_update {
    address_v4 peer;
    std::vector<prefix_v4> withdrawn;
    std::vector<bgp_route> routes;
};

struct peer_down {
    address_v4 peer;
};

using peer_event = std::variant<peer_established,peer_update,peer_down>;
using peer_event_handler = std::function<void( peer_event )>;

// Message or error that raised an FSM event
struct event_ctx {
    const bgp_open_msg *open { nullptr };
    const bgp_update_msg *update { nullptr };
    std::optional<bgp_notification_msg> notification;
};

struct bgp_fsm_stats {
    FSM_STATE state { FSM_STATE::IDLE };
    // not refreshed while a failed connect cycles through Idle and Connect
    std::chrono::steady_clock::time_point state_since;
    address_v4 router_id;
    uint16_t hold_time { 0 };
    uint64_t msg_in { 0 };
    uint64_t msg_out { 0 };
    uint64_t updates_in { 0 };
    uint64_t updates_out { 0 };
    uint32_t established_count { 0 };
    uint32_t connect_retry_counter { 0 };
    std::string last_error;
};

struct bgp_fsm : public std::enable_shared_from_this<bgp_fsm> {
    io_context &io;
    strand_t strand;
    const global_conf &gconf;
    const bgp_neighbour_v4 &conf;
    peer_event_handler on_event;

    FSM_STATE state;
    std::shared_ptr<bgp_connection> conn;
    std::shared_ptr<bgp_connection> rival;

    // counters
    uint32_t ConnectRetryCounter;

    // timers
    timer ConnectRetryTimer;
    timer HoldTimer;
    timer KeepaliveTimer;
    uint64_t ConnectRetryGen { 0 };
    uint64_t HoldGen { 0 };
    uint64_t KeepaliveGen { 0 };

    // negotiated
    uint16_t HoldTime;
    uint16_t KeepaliveTime;
    address_v4 remote_id;

    bool stopped { true };
    bool withdrawal_pending { false };
    bool start_deferred { false };

    bgp_fsm( io_context &i, const global_conf &g, const bgp_neighbour_v4 &c, peer_event_handler handler );

    // Entry points, safe to call from any thread
    void start();
    void stop();
    void place_connection( socket_tcp s );
    void send_updates( rib_change change );
    void withdrawal_complete();

    bgp_fsm_stats dump() const;

    std::chrono::seconds connect_retry_backoff() const;

private:
    mutable std::mutex stats_mutex;
    bgp_fsm_stats stats;

    void dispatch( FSM_EVENT event, const event_ctx &ctx = {} );
    void run_action( FSM_ACTION action, const fsm_transition &tr, const event_ctx &ctx );
    void set_state( FSM_STATE next );
    void automatic_start();

    void arm( timer &t, uint64_t &gen, std::chrono::seconds d, FSM_EVENT event );
    void cancel( timer &t, uint64_t &gen );
    void on_timer( FSM_EVENT event );

    void initiate_connect();
    void on_connect( std::shared_ptr<bgp_connection> c, error_code ec );
    void on_inbound( socket_tcp s );
    void drop_connections();

    void do_read( std::shared_ptr<bgp_connection> c );
    void on_receive( std::shared_ptr<bgp_connection> c, error_code ec, std::size_t length );
    void handle_message( const std::shared_ptr<bgp_connection> &c, const bgp_message &msg );
    void handle_rival_open( const bgp_open_msg &open );
    void reject_rival( const bgp_notification_msg &notification );

    std::optional<bgp_notification_msg> check_open( const bgp_open_msg &open ) const;
    bgp_open_msg make_open() const;
    void send( const bgp_message &msg );

    void set_error( const std::string &err );
    void count( uint64_t bgp_fsm_stats::*counter, uint64_t n = 1 );
};

#endif
