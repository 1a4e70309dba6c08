#ifndef SUPERVISOR_HPP_
#define SUPERVISOR_HPP_

#include <map>
#include <memory>

#include "types.hpp"
#include "config.hpp"
#include "fsm.hpp"
#include "table.hpp"
#include "cli.hpp"

inline constexpr auto SHUTDOWN_GRACE_TIME { std::chrono::seconds( 1 ) };

// Owns the sessions, the BGP listener and the RIB. Every RIB access runs on
// the supervisor strand, which orders session events and control queries.
struct bgp_supervisor {
    io_context &io;
    const global_conf &conf;
    strand_t strand;
    acceptor accpt;
    timer shutdown_timer;

    bgp_table_v4 table;
    std::map<address_v4,std::shared_ptr<bgp_fsm>> neighbours;
    bool shutting_down { false };

    bgp_supervisor( io_context &i, const global_conf &c );

    void start();

    // Ceases every session, stops the io_context after a short grace period
    void shutdown();

    void handle_cli( const CLI_MSG &req, cli_reply reply );

    uint16_t listen_port() const;

private:
    void do_accept();
    void on_accept( error_code ec, socket_tcp sock );
    void on_peer_event( peer_event ev );
    void apply( const rib_changes &changes );
    CLI_MSG process_cli( const CLI_MSG &req );
    std::optional<address_v4> parse_peer_filter( const std::string &peer, CLI_MSG &out ) const;
};

#endif
